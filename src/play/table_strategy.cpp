#include "table_strategy.h"
#include "gamelib/action.h"
#include "gamelib/hand.h"
#include "util/card.h"

namespace
{
    // Rows are dealer up-card values 2-11, columns hand totals 4-21
    const char* const decision_table[] =
    {
        "HHHHHHDDHSSSSSSSSS",
        "HHHHHDDDHSSSSSSSSS",
        "HHHHHDDDSSSSSSSSSS",
        "HHHHHDDDSSSSSSSSSS",
        "HHHHHDDDSSSSSSSSSS",
        "HHHHHHDDHHHHHSSSSS",
        "HHHHHHDDHHHHHSSSSS",
        "HHHHHHDDHHHHHSSSSS",
        "HHHHHHHDHHHHHSSSSS",
        "HHHHHHHHHHHHHSSSSS",
    };
}

const int table_strategy::MIN_UPCARD;
const int table_strategy::MAX_UPCARD;
const int table_strategy::MIN_TOTAL;
const int table_strategy::MAX_TOTAL;

table_strategy::table_strategy(const int default_bet, const bet_policy policy)
    : bot_strategy(default_bet, policy)
{
}

int table_strategy::lookup(const int upcard_value, const int total)
{
    if (upcard_value < MIN_UPCARD || upcard_value > MAX_UPCARD || total < MIN_TOTAL || total > MAX_TOTAL)
        return STAND;

    switch (decision_table[upcard_value - MIN_UPCARD][total - MIN_TOTAL])
    {
    case 'H': return HIT;
    case 'D': return DOUBLE;
    default: return STAND;
    }
}

int table_strategy::decide(const hand& h, const int dealer_card, double, int)
{
    return lookup(get_upcard_value(dealer_card), h.get_value());
}

bool table_strategy::decide_split_eligible(const hand&) const
{
    return false; // no pair table
}
