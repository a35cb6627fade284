#include "session_commands.h"
#include <stdexcept>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/log/trivial.hpp>
#include "gamelib/game_error.h"
#include "gamelib/participant.h"
#include "gamelib/shoe.h"
#include "round_engine.h"

session_commands::session_commands(round_engine& engine, std::ostream& os)
    : engine_(engine)
    , os_(os)
{
}

void session_commands::print_balances() const
{
    os_ << "Player balance:\n";

    for (std::size_t i = 0; i < engine_.get_participant_count(); ++i)
    {
        const participant& p = engine_.get_participant(i);
        os_ << boost::format("\t%1%: $%2%\n") % p.get_name() % p.get_balance();
    }
}

void session_commands::print_help() const
{
    os_ << "Available commands:\n"
        << "\t/help                                  Prints this message\n"
        << "\t/exit                                  Quits the game\n"
        << "\t/showbalance                           Display the players balance\n"
        << "\t/editbalance [player] [new balance]    Modify a players balance\n"
        << "\t/shuffle                               Shuffles and resets the shoe\n"
        << "\t/godmode [on|off]                      Deal blackjack to human players\n";
}

void session_commands::run(const std::string& command)
{
    std::vector<std::string> parts;
    const std::string trimmed = boost::algorithm::trim_copy(command);
    boost::algorithm::split(parts, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);

    if (parts.empty() || parts[0].empty())
    {
        os_ << "Invalid command, run /help for list of commands.\n";
        return;
    }

    if (parts[0] == "help")
        print_help();
    else if (parts[0] == "exit")
        throw quit_requested();
    else if (parts[0] == "showbalance")
        print_balances();
    else if (parts[0] == "shuffle")
    {
        try
        {
            engine_.reshuffle();
            os_ << boost::format("Shoe reshuffled, %1% cards\n") % engine_.get_shoe().size();
        }
        catch (const std::logic_error& e)
        {
            os_ << "Cannot shuffle now: " << e.what() << "\n";
        }
    }
    else if (parts[0] == "godmode" && parts.size() == 2 && (parts[1] == "on" || parts[1] == "off"))
    {
        engine_.set_god_mode(parts[1] == "on");
        BOOST_LOG_TRIVIAL(info) << "God mode " << parts[1];
        os_ << "God mode " << parts[1] << "\n";
    }
    else if (parts[0] == "editbalance")
    {
        if (parts.size() < 3)
        {
            os_ << "Usage: /editbalance [player name] [new balance]\n";
            return;
        }

        // last token is the balance, the name may contain spaces
        edit_balance(boost::algorithm::join(std::vector<std::string>(parts.begin() + 1, parts.end() - 1), " "),
            parts.back());
    }
    else
        os_ << "Invalid command, run /help for list of commands.\n";
}

void session_commands::edit_balance(const std::string& name, const std::string& amount)
{
    participant* p = engine_.find_participant(name);

    if (!p)
    {
        os_ << "Player '" << name << "' not found.\n";
        return;
    }

    double balance;

    try
    {
        balance = boost::lexical_cast<double>(amount);
    }
    catch (const boost::bad_lexical_cast&)
    {
        os_ << "Invalid balance amount. Must be a number.\n";
        return;
    }

    try
    {
        const double old_balance = p->get_balance();
        p->set_balance(balance);
        BOOST_LOG_TRIVIAL(info) << p->get_name() << ": balance set to " << balance;
        os_ << boost::format("%1%'s balance updated: $%2% -> $%3%\n") % p->get_name() % old_balance % balance;
    }
    catch (const game_error& e)
    {
        os_ << e.what() << "\n";
    }
}
