#pragma once

#include "bot_strategy.h"

// Basic strategy for hard totals, keyed by dealer up-card and hand value
class table_strategy : public bot_strategy
{
public:
    static const int MIN_UPCARD = 2;
    static const int MAX_UPCARD = 11;
    static const int MIN_TOTAL = 4;
    static const int MAX_TOTAL = 21;

    table_strategy(int default_bet, bet_policy policy);
    int decide(const hand& h, int dealer_card, double balance, int current_bet);
    bool decide_split_eligible(const hand& h) const;
    static int lookup(int upcard_value, int total);
};
