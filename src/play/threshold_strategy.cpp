#include "threshold_strategy.h"
#include "gamelib/action.h"
#include "gamelib/hand.h"

threshold_strategy::threshold_strategy(const int default_bet, const bet_policy policy, const int threshold)
    : bot_strategy(default_bet, policy)
    , threshold_(threshold)
{
}

int threshold_strategy::decide(const hand& h, int, double, int)
{
    return h.get_value() <= threshold_ ? HIT : STAND;
}
