#include "shoe.h"
#include <stdexcept>
#include "util/card.h"
#include "util/partial_shuffle.h"
#include "game_error.h"

shoe::shoe(const int decks, const std::int64_t seed)
    : decks_(decks)
    , engine_(static_cast<unsigned long>(seed))
{
    if (decks < 1)
        throw std::invalid_argument("shoe needs at least one deck");

    cards_.reserve(decks * CARDS);

    for (int i = 0; i < decks; ++i)
    {
        for (int card = 0; card < CARDS; ++card)
            cards_.push_back(card);
    }

    shuffle();
}

shoe::shoe(const std::vector<int>& cards)
    : decks_(static_cast<int>((cards.size() + CARDS - 1) / CARDS))
    , cards_(cards)
{
    for (std::size_t i = 0; i < cards_.size(); ++i)
    {
        if (!is_valid_card(cards_[i]))
            throw std::invalid_argument("invalid card in stacked shoe");
    }

    if (decks_ < 1)
        decks_ = 1;
}

void shoe::shuffle()
{
    partial_shuffle(cards_, cards_.size(), engine_);
}

int shoe::draw()
{
    if (cards_.empty())
        throw shoe_empty();

    const int card = cards_.back();
    cards_.pop_back();
    return card;
}
