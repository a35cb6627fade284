#include "bot_strategy.h"
#include <algorithm>
#include <cmath>

bot_strategy::bot_strategy(const int default_bet, const bet_policy policy)
    : default_bet_(default_bet)
    , policy_(policy)
{
}

int bot_strategy::get_bet(const std::string&, const double balance)
{
    if (policy_ == FIXED_BET)
        return balance >= default_bet_ ? default_bet_ : 0;

    return std::max(0, std::min(default_bet_, static_cast<int>(std::floor(balance))));
}
