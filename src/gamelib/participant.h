#pragma once

#include <string>
#include <vector>
#include <boost/noncopyable.hpp>
#include "hand.h"
#include "outcome.h"

// Seat at the table: balance, hands and per-round bookkeeping. All mutators
// validate before changing anything and throw a game_error on rejection.
class participant : private boost::noncopyable
{
public:
    struct action_record
    {
        int action;
        std::vector<int> cards;
        int value;
        int dealer_card;
    };

    participant(const std::string& name, double balance);
    void place_bet(int amount);
    void hit(int card);
    void split();
    void double_down(int card);
    void reset_for_new_round();
    void log_action(int action, int dealer_card);
    void activate_hand(std::size_t index);
    void settle(std::size_t index, const settlement& s);
    void set_balance(double balance);
    void validate_split() const;
    void validate_double() const;
    const std::string& get_name() const { return name_; }
    double get_balance() const { return balance_; }
    int get_current_bet() const { return current_bet_; }
    bool has_bet() const { return current_bet_ > 0; }
    bool has_split() const { return hands_.size() > 1; }
    std::size_t get_hand_count() const { return hands_.size(); }
    const hand& get_hand(std::size_t index) const { return hands_[index]; }
    const hand& get_active_hand() const { return hands_[active_]; }
    std::size_t get_active_index() const { return active_; }
    int get_hand_bet(std::size_t index) const { return bets_[index]; }
    result_t get_hand_result(std::size_t index) const { return results_[index]; }
    result_t get_result() const { return results_[0]; }
    const std::vector<action_record>& get_actions() const { return actions_; }

private:
    std::string name_;
    double balance_;
    int current_bet_;
    std::size_t active_;
    std::vector<hand> hands_;
    std::vector<int> bets_;
    std::vector<result_t> results_;
    std::vector<bool> settled_;
    std::vector<action_record> actions_;
};
