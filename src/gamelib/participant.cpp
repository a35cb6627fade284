#include "participant.h"
#include <stdexcept>
#include "game_error.h"

participant::participant(const std::string& name, const double balance)
    : name_(name)
    , balance_(balance)
{
    if (balance < 0)
        throw invalid_balance();

    reset_for_new_round();
}

void participant::place_bet(const int amount)
{
    if (amount <= 0)
        throw invalid_bet();

    if (amount > balance_)
        throw insufficient_balance("Bet amount exceeds available balance");

    if (current_bet_ != 0)
        throw std::logic_error("bet already placed this round");

    balance_ -= amount;
    current_bet_ = amount;
    bets_[0] = amount;
}

void participant::hit(const int card)
{
    hands_[active_].add_card(card);
}

void participant::validate_split() const
{
    if (has_split())
        throw not_splittable("Cannot split more than once");

    if (!hands_[active_].is_pair())
        throw not_splittable("Cannot split: hand must have exactly two cards of the same rank");

    if (bets_[active_] > balance_)
        throw insufficient_balance("Insufficient balance to split");
}

void participant::split()
{
    validate_split();

    const int stake = bets_[active_];
    const hand old = hands_[active_];

    hands_[active_] = hand();
    hands_[active_].add_card(old.get_card(0));

    hands_.push_back(hand());
    hands_.back().add_card(old.get_card(1));

    balance_ -= stake;
    current_bet_ += stake;
    bets_.push_back(stake);
    results_.push_back(NO_RESULT);
    settled_.push_back(false);
}

void participant::validate_double() const
{
    if (bets_[active_] > balance_)
        throw insufficient_balance("Insufficient balance to double down");

    if (hands_[active_].size() != 2)
        throw not_doubleable();
}

void participant::double_down(const int card)
{
    validate_double();

    const int stake = bets_[active_];
    balance_ -= stake;
    current_bet_ += stake;
    bets_[active_] = 2 * stake;
    hit(card);
}

void participant::reset_for_new_round()
{
    current_bet_ = 0;
    active_ = 0;
    hands_.assign(1, hand());
    bets_.assign(1, 0);
    results_.assign(1, NO_RESULT);
    settled_.assign(1, false);
    actions_.clear();
}

void participant::log_action(const int action, const int dealer_card)
{
    const hand& h = hands_[active_];
    const action_record record = {action, h.get_cards(), h.get_value(), dealer_card};
    actions_.push_back(record);
}

void participant::activate_hand(const std::size_t index)
{
    if (index >= hands_.size())
        throw std::out_of_range("no such hand");

    active_ = index;
}

void participant::settle(const std::size_t index, const settlement& s)
{
    if (index >= hands_.size())
        throw std::out_of_range("no such hand");

    if (settled_[index])
        throw std::logic_error("hand already settled");

    settled_[index] = true;
    results_[index] = s.result;
    balance_ += s.payout;
}

void participant::set_balance(const double balance)
{
    if (balance < 0)
        throw invalid_balance();

    balance_ = balance;
}
