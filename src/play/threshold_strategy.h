#pragma once

#include "bot_strategy.h"

class threshold_strategy : public bot_strategy
{
public:
    threshold_strategy(int default_bet, bet_policy policy, int threshold = 16);
    int decide(const hand& h, int dealer_card, double balance, int current_bet);

private:
    int threshold_;
};
