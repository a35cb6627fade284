#include "gtest/gtest.h"
#include "gamelib/action.h"
#include "gamelib/game_error.h"
#include "gamelib/participant.h"
#include "util/card.h"

TEST(participant, place_bet)
{
    participant p("Alice", 100);

    EXPECT_THROW(p.place_bet(0), invalid_bet);
    EXPECT_THROW(p.place_bet(-5), invalid_bet);
    EXPECT_THROW(p.place_bet(101), insufficient_balance);
    EXPECT_EQ(100, p.get_balance());
    EXPECT_EQ(0, p.get_current_bet());

    p.place_bet(100);
    EXPECT_EQ(0, p.get_balance());
    EXPECT_EQ(100, p.get_current_bet());
    EXPECT_TRUE(p.has_bet());
}

TEST(participant, negative_balance_rejected)
{
    EXPECT_THROW(participant("Bob", -1), invalid_balance);

    participant p("Bob", 10);
    EXPECT_THROW(p.set_balance(-0.5), invalid_balance);
    EXPECT_EQ(10, p.get_balance());

    p.set_balance(55);
    EXPECT_EQ(55, p.get_balance());
}

TEST(participant, split_pair)
{
    participant p("Alice", 100);
    p.place_bet(10);
    p.hit(get_card(EIGHT, CLUB));
    p.hit(get_card(EIGHT, HEART));

    p.split();

    ASSERT_EQ(2u, p.get_hand_count());
    EXPECT_EQ(1u, p.get_hand(0).size());
    EXPECT_EQ(1u, p.get_hand(1).size());
    EXPECT_EQ(get_card(EIGHT, CLUB), p.get_hand(0).get_card(0));
    EXPECT_EQ(get_card(EIGHT, HEART), p.get_hand(1).get_card(0));
    EXPECT_EQ(10, p.get_hand_bet(1));
    EXPECT_EQ(20, p.get_current_bet());
    EXPECT_EQ(80, p.get_balance());

    // only one split per round
    p.hit(get_card(EIGHT, SPADE));
    EXPECT_THROW(p.split(), not_splittable);
    EXPECT_EQ(2u, p.get_hand_count());
}

TEST(participant, split_rejected)
{
    participant p("Alice", 100);
    p.place_bet(10);
    p.hit(get_card(SEVEN, CLUB));
    p.hit(get_card(EIGHT, HEART));

    EXPECT_THROW(p.split(), not_splittable);
    EXPECT_EQ(1u, p.get_hand_count());

    participant q("Bob", 100);
    q.place_bet(10);
    q.hit(get_card(EIGHT, CLUB));
    q.hit(get_card(EIGHT, HEART));
    q.hit(get_card(TWO, HEART));

    EXPECT_THROW(q.split(), not_splittable);
    EXPECT_EQ(3u, q.get_hand(0).size());
    EXPECT_EQ(90, q.get_balance());
}

TEST(participant, split_needs_second_stake)
{
    participant p("Alice", 10);
    p.place_bet(10);
    p.hit(get_card(NINE, CLUB));
    p.hit(get_card(NINE, HEART));

    EXPECT_THROW(p.split(), insufficient_balance);
    EXPECT_EQ(1u, p.get_hand_count());
    EXPECT_EQ(2u, p.get_hand(0).size());
}

TEST(participant, double_down)
{
    participant p("Alice", 100);
    p.place_bet(10);
    p.hit(get_card(FIVE, CLUB));
    p.hit(get_card(SIX, HEART));

    p.double_down(get_card(TEN, SPADE));

    EXPECT_EQ(80, p.get_balance());
    EXPECT_EQ(20, p.get_current_bet());
    EXPECT_EQ(20, p.get_hand_bet(0));
    EXPECT_EQ(3u, p.get_hand(0).size());
    EXPECT_EQ(21, p.get_hand(0).get_value());
}

TEST(participant, double_after_hit_rejected)
{
    participant p("Alice", 100);
    p.place_bet(10);
    p.hit(get_card(TWO, CLUB));
    p.hit(get_card(THREE, HEART));
    p.hit(get_card(FOUR, HEART));

    EXPECT_THROW(p.double_down(get_card(TEN, SPADE)), not_doubleable);
    EXPECT_EQ(90, p.get_balance());
    EXPECT_EQ(10, p.get_current_bet());
    EXPECT_EQ(3u, p.get_hand(0).size());
}

TEST(participant, double_insufficient_balance)
{
    participant p("Alice", 15);
    p.place_bet(10);
    p.hit(get_card(FIVE, CLUB));
    p.hit(get_card(SIX, HEART));

    EXPECT_THROW(p.double_down(get_card(TEN, SPADE)), insufficient_balance);
    EXPECT_EQ(5, p.get_balance());
    EXPECT_EQ(2u, p.get_hand(0).size());
}

TEST(participant, double_split_hand)
{
    participant p("Alice", 100);
    p.place_bet(10);
    p.hit(get_card(FIVE, CLUB));
    p.hit(get_card(FIVE, HEART));
    p.split();

    p.activate_hand(1);
    p.hit(get_card(SIX, SPADE));
    p.double_down(get_card(TEN, SPADE));

    EXPECT_EQ(10, p.get_hand_bet(0));
    EXPECT_EQ(20, p.get_hand_bet(1));
    EXPECT_EQ(30, p.get_current_bet());
    EXPECT_EQ(70, p.get_balance());
    EXPECT_EQ(21, p.get_hand(1).get_value());
    EXPECT_EQ(1u, p.get_hand(0).size());
}

TEST(participant, hit_goes_to_active_hand)
{
    participant p("Alice", 100);
    p.place_bet(10);
    p.hit(get_card(ACE, CLUB));
    p.hit(get_card(ACE, HEART));
    p.split();

    p.hit(get_card(KING, CLUB));
    p.activate_hand(1);
    p.hit(get_card(NINE, CLUB));

    EXPECT_EQ(21, p.get_hand(0).get_value());
    EXPECT_EQ(20, p.get_hand(1).get_value());
    EXPECT_THROW(p.activate_hand(2), std::out_of_range);
}

TEST(participant, reset_for_new_round)
{
    participant p("Alice", 100);
    p.place_bet(10);
    p.hit(get_card(EIGHT, CLUB));
    p.hit(get_card(EIGHT, HEART));
    p.split();
    p.log_action(SPLIT, get_card(TEN, CLUB));

    p.reset_for_new_round();

    EXPECT_EQ(1u, p.get_hand_count());
    EXPECT_TRUE(p.get_hand(0).empty());
    EXPECT_EQ(0, p.get_current_bet());
    EXPECT_TRUE(p.get_actions().empty());
    EXPECT_EQ(NO_RESULT, p.get_result());
    EXPECT_EQ(80, p.get_balance());
}

TEST(participant, action_log)
{
    participant p("Alice", 100);
    p.place_bet(10);
    p.hit(get_card(TEN, CLUB));
    p.hit(get_card(TWO, HEART));
    p.hit(get_card(FIVE, HEART));
    p.log_action(HIT, get_card(SEVEN, SPADE));

    ASSERT_EQ(1u, p.get_actions().size());
    const participant::action_record& r = p.get_actions()[0];
    EXPECT_EQ(HIT, r.action);
    EXPECT_EQ(3u, r.cards.size());
    EXPECT_EQ(17, r.value);
    EXPECT_EQ(get_card(SEVEN, SPADE), r.dealer_card);
}

TEST(participant, settle_once)
{
    participant p("Alice", 100);
    p.place_bet(10);

    const settlement s = {WIN, 20};
    p.settle(0, s);

    EXPECT_EQ(110, p.get_balance());
    EXPECT_EQ(WIN, p.get_result());
    EXPECT_THROW(p.settle(0, s), std::logic_error);
    EXPECT_EQ(110, p.get_balance());
}
