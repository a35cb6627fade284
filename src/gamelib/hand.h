#pragma once

#include <array>
#include <vector>
#include <ostream>
#include <string>

class hand
{
public:
    // Distinct totals a hand can reach, one more than the number of aces
    static const int MAX_TOTALS = 32;

    hand();
    explicit hand(const std::vector<int>& cards);
    void add_card(int card);
    int get_value() const { return value_; }
    int get_min_total() const;
    bool is_blackjack() const;
    bool is_busted() const;
    bool is_soft() const;
    bool is_pair() const;
    std::size_t size() const { return cards_.size(); }
    bool empty() const { return cards_.empty(); }
    int get_card(std::size_t i) const { return cards_[i]; }
    const std::vector<int>& get_cards() const { return cards_; }
    std::vector<std::string> get_card_names() const;

private:
    void insert_total(std::array<int, MAX_TOTALS>& totals, int& count, int total) const;

    std::vector<int> cards_;
    std::array<int, MAX_TOTALS> totals_;
    int total_count_;
    int value_;
};

std::ostream& operator<<(std::ostream& os, const hand& h);
