#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/program_options.hpp>
#include "gamelib/participant.h"
#include "console_strategy.h"
#include "round_engine.h"
#include "round_log.h"
#include "session_commands.h"
#include "session_settings.h"
#include "strategy_factory.h"

namespace
{
    bool ask_play_again(std::istream& is, std::ostream& os)
    {
        for (;;)
        {
            os << "Play another round? (yes/no): " << std::flush;

            std::string line;

            if (!std::getline(is, line))
                return false;

            boost::algorithm::trim(line);
            boost::algorithm::to_lower(line);

            if (line == "yes")
                return true;
            else if (line == "no")
                return false;

            os << "Invalid input. Please enter 'yes' or 'no'.\n";
        }
    }

    std::string default_round_log_filename()
    {
        boost::filesystem::create_directories("logs");

        const auto now = boost::posix_time::second_clock::local_time();
        std::ostringstream ss;
        ss.imbue(std::locale(ss.getloc(), new boost::posix_time::time_facet("%Y-%m-%d_%H%M%S")));
        ss << "logs/session_" << now << ".json";
        return ss.str();
    }
}

int main(int argc, char* argv[])
{
    try
    {
        namespace log = boost::log;

        log::add_common_attributes();

        static const char* log_format = "[%TimeStamp%] %Message%";

        log::add_console_log
        (
            std::clog,
            log::keywords::format = log_format
        );

        namespace po = boost::program_options;

        std::string settings_file;
        std::vector<std::string> player_names;
        int rounds;
        std::int64_t seed;
        std::string log_file;
        std::string round_log_file;
        bool god_mode = false;

        po::options_description desc("Options");
        desc.add_options()
            ("help", "produce help message")
            ("settings", po::value<std::string>(&settings_file), "settings file")
            ("player", po::value<std::vector<std::string>>(&player_names), "human player name, repeatable")
            ("rounds", po::value<int>(&rounds)->default_value(0), "number of rounds, 0 plays until stopped")
            ("seed", po::value<std::int64_t>(&seed)->default_value(std::random_device()()), "random seed")
            ("log-file", po::value<std::string>(&log_file), "log file")
            ("round-log", po::value<std::string>(&round_log_file), "round log file")
            ("god-mode", po::bool_switch(&god_mode), "deal blackjack to human players")
            ;

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help"))
        {
            std::cout << desc << "\n";
            return 1;
        }

        po::notify(vm);

        if (!log_file.empty())
        {
            log::add_file_log
            (
                log::keywords::file_name = log_file,
                log::keywords::auto_flush = true,
                log::keywords::format = log_format
            );
        }

        session_settings settings;

        if (!settings_file.empty())
            settings.load(settings_file);

        if (god_mode)
            settings.god_mode = true;

        if (player_names.empty() && settings.bots.empty())
            throw std::runtime_error("Must be at least one player");

        BOOST_LOG_TRIVIAL(info) << "Using seed: " << seed;

        std::vector<std::unique_ptr<participant>> participants;
        std::vector<std::unique_ptr<strategy_base>> strategies;
        std::vector<console_strategy*> consoles;
        round_engine engine(settings, seed);

        for (std::size_t i = 0; i < player_names.size(); ++i)
        {
            std::unique_ptr<console_strategy> s(new console_strategy(std::cin, std::cout));
            consoles.push_back(s.get());
            participants.push_back(std::unique_ptr<participant>(new participant(player_names[i], settings.init_balance)));
            strategies.push_back(std::move(s));
            engine.add_participant(*participants.back(), *strategies.back());
        }

        for (std::size_t i = 0; i < settings.bots.size(); ++i)
        {
            const auto& bot = settings.bots[i];
            participants.push_back(std::unique_ptr<participant>(new participant(bot.name, settings.init_balance)));
            strategies.push_back(create_bot_strategy(bot.strategy, settings, seed + 1 + i));
            engine.add_participant(*participants.back(), *strategies.back());
            BOOST_LOG_TRIVIAL(info) << "Bot " << bot.name << " plays strategy: " << bot.strategy;
        }

        session_commands commands(engine, std::cout);

        for (std::size_t i = 0; i < consoles.size(); ++i)
        {
            consoles[i]->set_command_handler([&commands](const std::string& command) {
                commands.run(command);
            });
        }

        if (settings.deal_delay > 0)
        {
            const auto delay = std::chrono::milliseconds(static_cast<int>(settings.deal_delay * 1000));

            engine.connect_card_dealt([delay](const participant&, int) {
                std::this_thread::sleep_for(delay);
            });
        }

        if (settings.log_game && round_log_file.empty())
            round_log_file = default_round_log_filename();

        round_log history(settings.log_game ? round_log_file : std::string());

        if (settings.log_game)
            BOOST_LOG_TRIVIAL(info) << "Logging rounds to: " << round_log_file;

        commands.print_balances();

        try
        {
            for (int round = 0; rounds == 0 || round < rounds; ++round)
            {
                if (!engine.can_continue())
                {
                    BOOST_LOG_TRIVIAL(info) << "No player can afford another round";
                    break;
                }

                engine.play();
                history.add_round(engine);

                if (!consoles.empty() && !ask_play_again(std::cin, std::cout))
                    break;
            }
        }
        catch (const quit_requested&)
        {
            BOOST_LOG_TRIVIAL(info) << "Session ended by user";
        }

        commands.print_balances();
        return 0;
    }
    catch (const std::exception& e)
    {
        BOOST_LOG_TRIVIAL(error) << e.what();
        return 1;
    }
}
