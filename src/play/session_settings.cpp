#include "session_settings.h"
#include <fstream>
#include <stdexcept>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/log/trivial.hpp>

namespace
{
    bot_strategy::bet_policy string_to_bet_policy(const std::string& s)
    {
        if (s == "fixed")
            return bot_strategy::FIXED_BET;
        else if (s == "capped")
            return bot_strategy::CAPPED_BET;

        throw std::runtime_error("unknown bot bet policy: " + s);
    }

    // Older settings files store flags as "true"/"false" strings
    bool read_flag(const boost::property_tree::ptree& pt, const std::string& key, bool def)
    {
        const auto value = pt.get_optional<std::string>(key);

        if (!value)
            return def;

        return *value == "true" || *value == "True" || *value == "1";
    }
}

session_settings::session_settings()
    : num_decks(1)
    , init_balance(100)
    , default_bet(10)
    , bot_bet_policy(bot_strategy::CAPPED_BET)
    , min_balance(1)
    , deal_delay(0)
    , log_game(true)
    , god_mode(false)
{
}

void session_settings::load(const std::string& filename)
{
    std::ifstream f(filename);

    if (!f)
        throw std::runtime_error("unable to open settings file: " + filename);

    BOOST_LOG_TRIVIAL(info) << "Loading settings: " << filename;
    load(f);
}

void session_settings::load(std::istream& is)
{
    boost::property_tree::ptree pt;
    boost::property_tree::read_json(is, pt);

    num_decks = pt.get("num_decks", num_decks);
    init_balance = pt.get("init_balance", init_balance);
    default_bet = pt.get("default_bet", default_bet);
    min_balance = pt.get("min_balance", min_balance);
    deal_delay = pt.get("deal_delay", deal_delay);
    log_game = read_flag(pt, "log_game", log_game);
    god_mode = read_flag(pt, "god_mode", god_mode);

    if (const auto policy = pt.get_optional<std::string>("bot_bet_policy"))
        bot_bet_policy = string_to_bet_policy(*policy);

    if (num_decks < 1)
        throw std::runtime_error("num_decks must be at least 1");

    if (init_balance < 0)
        throw std::runtime_error("init_balance cannot be negative");

    if (default_bet < 1)
        throw std::runtime_error("default_bet must be positive");

    if (const auto bots_node = pt.get_child_optional("bots"))
    {
        bots.clear();

        for (const auto& child : *bots_node)
        {
            const bot_t bot = {
                child.second.get<std::string>("name"),
                child.second.get<std::string>("strategy", "default")
            };

            bots.push_back(bot);
        }
    }
}
