#pragma once

#include "strategy_base.h"

// Base for automated players: bets the configured default amount
class bot_strategy : public strategy_base
{
public:
    enum bet_policy
    {
        FIXED_BET,
        CAPPED_BET
    };

    bot_strategy(int default_bet, bet_policy policy);
    int get_bet(const std::string& name, double balance);

private:
    int default_bet_;
    bet_policy policy_;
};
