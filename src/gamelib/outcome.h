#pragma once

#include <string>

class hand;

enum result_t
{
    NO_RESULT,
    BLACKJACK,
    WIN,
    PUSH,
    LOSE,
    BUSTED
};

struct settlement
{
    result_t result;
    double payout;
};

// Settles one hand against the dealer's final hand. The bet has already been
// taken from the balance, so the payout includes the returned stake.
settlement resolve_outcome(const hand& player, const hand& dealer, int bet);

const std::string get_result_string(int result);
