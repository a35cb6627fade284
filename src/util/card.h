#pragma once

#include <string>

enum { CLUB, DIAMOND, HEART, SPADE, SUITS };

enum
{
    TWO, THREE, FOUR, FIVE, SIX, SEVEN, EIGHT, NINE, TEN, JACK, QUEEN, KING, ACE
};

static const int RANKS = 13;
static const int CARDS = 52;

inline int get_rank(const int card)
{
    return card >> 2;
}

inline int get_suit(const int card)
{
    return card & 3;
}

inline int get_card(const int rank, const int suit)
{
    return rank << 2 | suit;
}

inline bool is_valid_card(const int card)
{
    return card >= 0 && card < CARDS;
}

// Lowest value a card counts as. Aces are the only cards with a second value.
inline int get_low_value(const int card)
{
    const int rank = get_rank(card);

    if (rank == ACE)
        return 1;
    else if (rank >= TEN)
        return 10;

    return rank + 2;
}

inline int get_high_value(const int card)
{
    return get_rank(card) == ACE ? 11 : get_low_value(card);
}

// Value of a dealer up-card for table lookups, aces count as 11
inline int get_upcard_value(const int card)
{
    return get_high_value(card);
}

inline const std::string get_card_string(const int card)
{
    if (card < 0 || card >= 52)
        return "?";

    std::string s(2, 0);

    switch (get_rank(card))
    {
    case 0: s[0] = '2'; break;
    case 1: s[0] = '3'; break;
    case 2: s[0] = '4'; break;
    case 3: s[0] = '5'; break;
    case 4: s[0] = '6'; break;
    case 5: s[0] = '7'; break;
    case 6: s[0] = '8'; break;
    case 7: s[0] = '9'; break;
    case 8: s[0] = 'T'; break;
    case 9: s[0] = 'J'; break;
    case 10: s[0] = 'Q'; break;
    case 11: s[0] = 'K'; break;
    case 12: s[0] = 'A'; break;
    }

    switch (get_suit(card))
    {
    case 0: s[1] = 'c'; break;
    case 1: s[1] = 'd'; break;
    case 2: s[1] = 'h'; break;
    case 3: s[1] = 's'; break;
    }

    return s;
}

inline const std::string get_rank_name(const int rank)
{
    switch (rank)
    {
    case JACK: return "Jack";
    case QUEEN: return "Queen";
    case KING: return "King";
    case ACE: return "Ace";
    default: return rank >= TWO && rank <= TEN ? std::to_string(rank + 2) : "?";
    }
}

inline const std::string get_suit_name(const int suit)
{
    switch (suit)
    {
    case CLUB: return "Clubs";
    case DIAMOND: return "Diamonds";
    case HEART: return "Hearts";
    case SPADE: return "Spades";
    default: return "?";
    }
}

// Long form used in round logs, e.g. "Ace of Spades"
inline const std::string get_card_name(const int card)
{
    if (!is_valid_card(card))
        return "?";

    return get_rank_name(get_rank(card)) + " of " + get_suit_name(get_suit(card));
}
