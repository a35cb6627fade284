#pragma once

#include <vector>
#include <random>
#include <cstdint>
#include <boost/noncopyable.hpp>

class shoe : private boost::noncopyable
{
public:
    shoe(int decks, std::int64_t seed);
    // Stacked shoe for replays and tests, cards are drawn from the back
    explicit shoe(const std::vector<int>& cards);
    void shuffle();
    int draw();
    std::size_t size() const { return cards_.size(); }
    bool empty() const { return cards_.empty(); }
    int get_decks() const { return decks_; }

private:
    int decks_;
    std::mt19937 engine_;
    std::vector<int> cards_;
};
