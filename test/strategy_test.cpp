#include "gtest/gtest.h"
#include "gamelib/action.h"
#include "gamelib/hand.h"
#include "play/random_strategy.h"
#include "play/session_settings.h"
#include "play/strategy_factory.h"
#include "play/table_strategy.h"
#include "play/threshold_strategy.h"
#include "util/card.h"

namespace
{
    hand make_hand(int r0, int r1, int r2 = -1)
    {
        hand h;
        h.add_card(get_card(r0, CLUB));
        h.add_card(get_card(r1, HEART));

        if (r2 != -1)
            h.add_card(get_card(r2, SPADE));

        return h;
    }
}

TEST(threshold_strategy, hits_to_sixteen)
{
    threshold_strategy s(10, bot_strategy::CAPPED_BET);
    const int upcard = get_card(ACE, SPADE);

    EXPECT_EQ(HIT, s.decide(make_hand(TEN, SIX), upcard, 100, 10));
    EXPECT_EQ(STAND, s.decide(make_hand(TEN, SEVEN), upcard, 100, 10));
    EXPECT_EQ(STAND, s.decide(make_hand(ACE, SIX), get_card(TWO, SPADE), 100, 10));
    EXPECT_EQ(HIT, s.decide(make_hand(TWO, THREE), upcard, 100, 10));
}

TEST(table_strategy, lookup)
{
    EXPECT_EQ(HIT, table_strategy::lookup(2, 12));
    EXPECT_EQ(STAND, table_strategy::lookup(4, 12));
    EXPECT_EQ(DOUBLE, table_strategy::lookup(3, 9));
    EXPECT_EQ(HIT, table_strategy::lookup(2, 9));
    EXPECT_EQ(DOUBLE, table_strategy::lookup(10, 11));
    EXPECT_EQ(HIT, table_strategy::lookup(10, 10));
    EXPECT_EQ(HIT, table_strategy::lookup(7, 16));
    EXPECT_EQ(STAND, table_strategy::lookup(7, 17));
    EXPECT_EQ(HIT, table_strategy::lookup(11, 11));
    EXPECT_EQ(STAND, table_strategy::lookup(11, 21));
}

TEST(table_strategy, outside_table_stands)
{
    EXPECT_EQ(STAND, table_strategy::lookup(1, 12));
    EXPECT_EQ(STAND, table_strategy::lookup(12, 12));
    EXPECT_EQ(STAND, table_strategy::lookup(6, 3));
    EXPECT_EQ(STAND, table_strategy::lookup(6, 22));
}

TEST(table_strategy, ace_upcard_counts_eleven)
{
    table_strategy s(10, bot_strategy::CAPPED_BET);

    // 10 against an ace hits, against a 9 it doubles
    EXPECT_EQ(HIT, s.decide(make_hand(FOUR, SIX), get_card(ACE, SPADE), 100, 10));
    EXPECT_EQ(DOUBLE, s.decide(make_hand(FOUR, SIX), get_card(NINE, SPADE), 100, 10));
    EXPECT_EQ(DOUBLE, s.decide(make_hand(FIVE, SIX), get_card(KING, SPADE), 100, 10));
    EXPECT_FALSE(s.decide_split_eligible(make_hand(EIGHT, EIGHT)));
}

TEST(bot_strategy, bet_policies)
{
    threshold_strategy fixed(10, bot_strategy::FIXED_BET);
    EXPECT_EQ(10, fixed.get_bet("bot", 100));
    EXPECT_EQ(10, fixed.get_bet("bot", 10));
    EXPECT_EQ(0, fixed.get_bet("bot", 9.5));

    threshold_strategy capped(10, bot_strategy::CAPPED_BET);
    EXPECT_EQ(10, capped.get_bet("bot", 100));
    EXPECT_EQ(7, capped.get_bet("bot", 7.5));
    EXPECT_EQ(0, capped.get_bet("bot", 0.5));
}

TEST(random_strategy, hits_or_stands)
{
    random_strategy s(10, bot_strategy::CAPPED_BET, 99);
    int hits = 0;

    for (int i = 0; i < 200; ++i)
    {
        const int action = s.decide(make_hand(TEN, TWO), get_card(TEN, SPADE), 100, 10);
        ASSERT_TRUE(action == HIT || action == STAND);
        hits += action == HIT ? 1 : 0;
    }

    EXPECT_GT(hits, 0);
    EXPECT_LT(hits, 200);
}

TEST(strategy_base, split_eligible)
{
    threshold_strategy s(10, bot_strategy::CAPPED_BET);
    EXPECT_TRUE(s.decide_split_eligible(make_hand(EIGHT, EIGHT)));
    EXPECT_FALSE(s.decide_split_eligible(make_hand(EIGHT, NINE)));
    EXPECT_FALSE(s.decide_split_eligible(make_hand(EIGHT, EIGHT, TWO)));
}

TEST(strategy_factory, names)
{
    const session_settings settings;

    EXPECT_TRUE(dynamic_cast<threshold_strategy*>(create_bot_strategy("default", settings, 1).get()) != nullptr);
    EXPECT_TRUE(dynamic_cast<table_strategy*>(create_bot_strategy("by the books", settings, 1).get()) != nullptr);
    EXPECT_TRUE(dynamic_cast<random_strategy*>(create_bot_strategy("random", settings, 1).get()) != nullptr);
    EXPECT_THROW(create_bot_strategy("ai", settings, 1), std::runtime_error);
}
