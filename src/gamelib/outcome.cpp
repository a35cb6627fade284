#include "outcome.h"
#include "hand.h"

settlement resolve_outcome(const hand& player, const hand& dealer, const int bet)
{
    const int value = player.get_value();
    const int dealer_value = dealer.get_value();
    settlement s;

    if (player.is_busted())
    {
        s.result = BUSTED;
        s.payout = 0;
    }
    else if (player.is_blackjack())
    {
        s.result = BLACKJACK;
        s.payout = bet * 2.5; // 3:2
    }
    else if (dealer.is_busted() || value > dealer_value)
    {
        s.result = WIN;
        s.payout = bet * 2.0;
    }
    else if (value == dealer_value)
    {
        s.result = PUSH;
        s.payout = bet;
    }
    else
    {
        s.result = LOSE;
        s.payout = 0;
    }

    return s;
}

const std::string get_result_string(const int result)
{
    switch (result)
    {
    case BLACKJACK: return "blackjack";
    case WIN: return "win";
    case PUSH: return "push";
    case LOSE: return "lose";
    case BUSTED: return "busted";
    default: return "";
    }
}
