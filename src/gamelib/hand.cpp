#include "hand.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include "util/card.h"

hand::hand()
    : total_count_(1)
    , value_(0)
{
    totals_[0] = 0;
}

hand::hand(const std::vector<int>& cards)
    : total_count_(1)
    , value_(0)
{
    totals_[0] = 0;

    for (std::size_t i = 0; i < cards.size(); ++i)
        add_card(cards[i]);
}

void hand::insert_total(std::array<int, MAX_TOTALS>& totals, int& count, const int total) const
{
    for (int i = 0; i < count; ++i)
    {
        if (totals[i] == total)
            return;
    }

    if (count == MAX_TOTALS)
        throw std::length_error("too many distinct hand totals");

    totals[count++] = total;
}

void hand::add_card(const int card)
{
    if (!is_valid_card(card))
        throw std::invalid_argument("invalid card");

    const int low = get_low_value(card);
    const int high = get_high_value(card);

    std::array<int, MAX_TOTALS> totals;
    int count = 0;

    for (int i = 0; i < total_count_; ++i)
    {
        insert_total(totals, count, totals_[i] + low);

        if (high != low)
            insert_total(totals, count, totals_[i] + high);
    }

    cards_.push_back(card);
    totals_ = totals;
    total_count_ = count;

    int best = -1;
    int lowest = totals_[0];

    for (int i = 0; i < total_count_; ++i)
    {
        if (totals_[i] <= 21)
            best = std::max(best, totals_[i]);

        lowest = std::min(lowest, totals_[i]);
    }

    value_ = best != -1 ? best : lowest;
}

int hand::get_min_total() const
{
    return *std::min_element(totals_.begin(), totals_.begin() + total_count_);
}

bool hand::is_blackjack() const
{
    return cards_.size() == 2 && value_ == 21;
}

bool hand::is_busted() const
{
    return value_ > 21;
}

bool hand::is_soft() const
{
    return value_ <= 21 && value_ != get_min_total();
}

bool hand::is_pair() const
{
    return cards_.size() == 2 && get_rank(cards_[0]) == get_rank(cards_[1]);
}

std::vector<std::string> hand::get_card_names() const
{
    std::vector<std::string> names;

    for (std::size_t i = 0; i < cards_.size(); ++i)
        names.push_back(get_card_name(cards_[i]));

    return names;
}

std::ostream& operator<<(std::ostream& os, const hand& h)
{
    os << "[";

    for (std::size_t i = 0; i < h.size(); ++i)
        os << (i > 0 ? " " : "") << get_card_string(h.get_card(i));

    return os << "] " << (h.is_soft() ? "soft " : "") << h.get_value();
}
