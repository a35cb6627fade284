#include "strategy_base.h"
#include "gamelib/hand.h"

bool strategy_base::decide_split_eligible(const hand& h) const
{
    return h.is_pair();
}

void strategy_base::action_rejected(int, const std::string&)
{
}

void strategy_base::bet_rejected(int, const std::string&)
{
}
