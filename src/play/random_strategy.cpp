#include "random_strategy.h"
#include "gamelib/action.h"

random_strategy::random_strategy(const int default_bet, const bet_policy policy, const std::int64_t seed)
    : bot_strategy(default_bet, policy)
    , engine_(static_cast<unsigned long>(seed))
{
}

int random_strategy::decide(const hand&, int, double, int)
{
    return std::uniform_int_distribution<int>(0, 1)(engine_) == 0 ? HIT : STAND;
}
