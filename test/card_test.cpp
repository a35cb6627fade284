#include "gtest/gtest.h"
#include "util/card.h"

TEST(card, values)
{
    EXPECT_EQ(2, get_low_value(get_card(TWO, HEART)));
    EXPECT_EQ(9, get_high_value(get_card(NINE, CLUB)));
    EXPECT_EQ(10, get_low_value(get_card(TEN, SPADE)));

    for (int rank = JACK; rank <= KING; ++rank)
    {
        EXPECT_EQ(10, get_low_value(get_card(rank, DIAMOND)));
        EXPECT_EQ(10, get_high_value(get_card(rank, DIAMOND)));
    }

    EXPECT_EQ(1, get_low_value(get_card(ACE, SPADE)));
    EXPECT_EQ(11, get_high_value(get_card(ACE, SPADE)));
    EXPECT_EQ(11, get_upcard_value(get_card(ACE, SPADE)));
}

TEST(card, names)
{
    EXPECT_EQ("Ace of Spades", get_card_name(get_card(ACE, SPADE)));
    EXPECT_EQ("10 of Hearts", get_card_name(get_card(TEN, HEART)));
    EXPECT_EQ("Queen of Clubs", get_card_name(get_card(QUEEN, CLUB)));
    EXPECT_EQ("?", get_card_name(-1));
    EXPECT_EQ("Ah", get_card_string(get_card(ACE, HEART)));
    EXPECT_EQ("Td", get_card_string(get_card(TEN, DIAMOND)));
    EXPECT_EQ("?", get_card_string(CARDS));
}
