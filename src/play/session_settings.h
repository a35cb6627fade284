#pragma once

#include <string>
#include <vector>
#include <istream>
#include "bot_strategy.h"

struct session_settings
{
    struct bot_t
    {
        std::string name;
        std::string strategy;
    };

    session_settings();
    void load(const std::string& filename);
    void load(std::istream& is);

    int num_decks;
    double init_balance;
    int default_bet;
    bot_strategy::bet_policy bot_bet_policy;
    double min_balance;
    double deal_delay;
    bool log_game;
    bool god_mode;
    std::vector<bot_t> bots;
};
