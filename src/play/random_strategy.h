#pragma once

#include <random>
#include <cstdint>
#include "bot_strategy.h"

// Hits or stands with equal probability
class random_strategy : public bot_strategy
{
public:
    random_strategy(int default_bet, bet_policy policy, std::int64_t seed);
    int decide(const hand& h, int dealer_card, double balance, int current_bet);

private:
    std::mt19937 engine_;
};
