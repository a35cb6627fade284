#include "round_engine.h"
#include <stdexcept>
#include <utility>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include "gamelib/action.h"
#include "gamelib/game_error.h"
#include "gamelib/shoe.h"
#include "util/card.h"
#include "strategy_base.h"

namespace
{
    std::string format_chips(double x)
    {
        return (boost::format("$%1%") % x).str();
    }

    const char* get_phase_string(int phase)
    {
        switch (phase)
        {
        case round_engine::RESHUFFLE_CHECK: return "reshuffle check";
        case round_engine::SETUP: return "setup";
        case round_engine::BETTING: return "betting";
        case round_engine::DEAL: return "deal";
        case round_engine::PLAYER_TURNS: return "player turns";
        case round_engine::DEALER_TURN: return "dealer turn";
        case round_engine::SETTLEMENT: return "settlement";
        default: return "?";
        }
    }
}

const int round_engine::DEALER_STAND_VALUE;

round_engine::round_engine(const session_settings& settings, const std::int64_t seed)
    : settings_(settings)
    , engine_(static_cast<unsigned long>(seed))
    , dealer_("Dealer", 0)
    , round_(0)
    , phase_(RESHUFFLE_CHECK)
{
    shoe_.reset(new shoe(settings_.num_decks, engine_()));
}

round_engine::~round_engine()
{
}

void round_engine::add_participant(participant& p, strategy_base& s)
{
    if (phase_ != RESHUFFLE_CHECK)
        throw std::logic_error("participants can only join between rounds");

    const seat st = {&p, &s};
    seats_.push_back(st);
}

void round_engine::require_phase(const phase_t expected) const
{
    if (phase_ != expected)
    {
        throw std::logic_error((boost::format("round is in %1% phase, cannot run %2%")
            % get_phase_string(phase_) % get_phase_string(expected)).str());
    }
}

void round_engine::enter_phase(const phase_t expected, const phase_t next)
{
    require_phase(expected);
    phase_ = next;
}

void round_engine::play()
{
    check_shoe();
    setup_round();
    collect_bets();
    deal();
    play_participants();
    play_dealer();
    settle();
}

bool round_engine::check_shoe()
{
    enter_phase(RESHUFFLE_CHECK, SETUP);

    const std::size_t threshold = (seats_.size() + 1) * 3;

    if (shoe_->size() >= threshold)
        return false;

    BOOST_LOG_TRIVIAL(info) << "Reshuffling shoe (" << shoe_->size() << " cards left)";
    shoe_.reset(new shoe(settings_.num_decks, engine_()));
    return true;
}

void round_engine::reshuffle()
{
    // no cards are out until the deal
    if (phase_ > DEAL)
        throw std::logic_error("cannot reshuffle while cards are in play");

    BOOST_LOG_TRIVIAL(info) << "Reshuffling shoe on request";
    shoe_.reset(new shoe(settings_.num_decks, engine_()));
}

void round_engine::setup_round()
{
    enter_phase(SETUP, BETTING);

    for (std::size_t i = 0; i < seats_.size(); ++i)
        seats_[i].player->reset_for_new_round();

    dealer_.reset_for_new_round();
    ++round_;

    BOOST_LOG_TRIVIAL(info) << "Round #" << round_;
}

void round_engine::collect_bet(seat& s)
{
    participant& p = *s.player;

    for (;;)
    {
        const int amount = s.strategy->get_bet(p.get_name(), p.get_balance());

        if (amount == 0)
        {
            BOOST_LOG_TRIVIAL(info) << p.get_name() << ": sits out";
            return;
        }

        try
        {
            p.place_bet(amount);
            BOOST_LOG_TRIVIAL(info) << p.get_name() << ": bets " << format_chips(amount);
            return;
        }
        catch (const game_error& e)
        {
            BOOST_LOG_TRIVIAL(warning) << p.get_name() << ": bet of " << amount << " rejected: " << e.what();
            s.strategy->bet_rejected(amount, e.what());

            if (!s.strategy->is_interactive())
                return;
        }
    }
}

void round_engine::collect_bets()
{
    // operator commands typed at the bet prompt run during this phase
    require_phase(BETTING);

    for (std::size_t i = 0; i < seats_.size(); ++i)
        collect_bet(seats_[i]);

    enter_phase(BETTING, DEAL);
}

int round_engine::draw_to(participant& p)
{
    const int card = shoe_->draw();
    p.hit(card);
    card_dealt_(p, card);
    return card;
}

void round_engine::deal()
{
    enter_phase(DEAL, PLAYER_TURNS);

    for (int n = 0; n < 2; ++n)
    {
        for (std::size_t i = 0; i < seats_.size(); ++i)
        {
            participant& p = *seats_[i].player;

            if (!p.has_bet())
                continue;

            if (settings_.god_mode && seats_[i].strategy->is_interactive())
            {
                const int card = n == 0 ? get_card(ACE, HEART) : get_card(KING, HEART);
                p.hit(card);
                card_dealt_(p, card);
                continue;
            }

            draw_to(p);
        }

        draw_to(dealer_);
    }

    BOOST_LOG_TRIVIAL(info) << "Dealer shows " << get_card_name(get_dealer_upcard());

    for (std::size_t i = 0; i < seats_.size(); ++i)
    {
        const participant& p = *seats_[i].player;

        if (p.has_bet())
            BOOST_LOG_TRIVIAL(info) << p.get_name() << ": dealt " << p.get_hand(0);
    }
}

int round_engine::get_dealer_upcard() const
{
    const hand& h = dealer_.get_hand(0);
    return h.empty() ? -1 : h.get_card(0);
}

void round_engine::play_hand(seat& s)
{
    participant& p = *s.player;
    const int upcard = get_dealer_upcard();

    for (;;)
    {
        const hand& h = p.get_active_hand();

        if (h.is_blackjack() || h.is_busted())
            return;

        const int action = s.strategy->decide(h, upcard, p.get_balance(), p.get_current_bet());

        try
        {
            switch (action)
            {
            case HIT:
                draw_to(p);
                p.log_action(HIT, upcard);
                BOOST_LOG_TRIVIAL(debug) << p.get_name() << ": hits " << p.get_active_hand();
                break;
            case STAND:
                p.log_action(STAND, upcard);
                BOOST_LOG_TRIVIAL(debug) << p.get_name() << ": stands " << h;
                return;
            case DOUBLE:
                {
                    p.validate_double();
                    const int card = shoe_->draw();
                    p.double_down(card);
                    card_dealt_(p, card);
                    p.log_action(DOUBLE, upcard);
                    BOOST_LOG_TRIVIAL(debug) << p.get_name() << ": doubles " << p.get_active_hand();
                }
                return;
            case SPLIT:
                {
                    if (!s.strategy->decide_split_eligible(h))
                        throw not_splittable("Split is not available for this hand");

                    p.split();
                    const std::size_t current = p.get_active_index();
                    draw_to(p);
                    p.activate_hand(p.get_hand_count() - 1);
                    draw_to(p);
                    p.activate_hand(current);
                    p.log_action(SPLIT, upcard);
                    BOOST_LOG_TRIVIAL(debug) << p.get_name() << ": splits " << p.get_hand(0) << " " << p.get_hand(1);
                }
                break;
            default:
                throw std::logic_error("strategy returned an unknown action");
            }
        }
        catch (const shoe_empty&)
        {
            throw;
        }
        catch (const game_error& e)
        {
            BOOST_LOG_TRIVIAL(warning) << p.get_name() << ": cannot " << get_action_string(action) << ": " << e.what();
            s.strategy->action_rejected(action, e.what());

            if (!s.strategy->is_interactive())
            {
                draw_to(p);
                p.log_action(HIT, upcard);
                BOOST_LOG_TRIVIAL(debug) << p.get_name() << ": hits " << p.get_active_hand();
            }
        }
    }
}

void round_engine::play_participants()
{
    enter_phase(PLAYER_TURNS, DEALER_TURN);

    for (std::size_t i = 0; i < seats_.size(); ++i)
    {
        seat& s = seats_[i];

        if (!s.player->has_bet())
            continue;

        // a split inside the loop appends the hand that is played next
        for (std::size_t k = 0; k < s.player->get_hand_count(); ++k)
        {
            s.player->activate_hand(k);
            play_hand(s);
        }
    }
}

void round_engine::play_dealer()
{
    enter_phase(DEALER_TURN, SETTLEMENT);

    while (dealer_.get_hand(0).get_value() < DEALER_STAND_VALUE)
        draw_to(dealer_);

    const hand& h = dealer_.get_hand(0);

    if (h.is_busted())
        BOOST_LOG_TRIVIAL(info) << "Dealer busts " << h;
    else
        BOOST_LOG_TRIVIAL(info) << "Dealer stands " << h;
}

void round_engine::settle()
{
    enter_phase(SETTLEMENT, RESHUFFLE_CHECK);

    const hand& dealer_hand = dealer_.get_hand(0);

    for (std::size_t i = 0; i < seats_.size(); ++i)
    {
        participant& p = *seats_[i].player;

        if (!p.has_bet())
            continue;

        for (std::size_t k = 0; k < p.get_hand_count(); ++k)
        {
            const settlement s = resolve_outcome(p.get_hand(k), dealer_hand, p.get_hand_bet(k));
            p.settle(k, s);

            BOOST_LOG_TRIVIAL(info) << p.get_name() << ": " << p.get_hand(k) << " " << get_result_string(s.result)
                << ", paid " << format_chips(s.payout) << ", balance " << format_chips(p.get_balance());
        }
    }
}

bool round_engine::can_continue() const
{
    for (std::size_t i = 0; i < seats_.size(); ++i)
    {
        if (seats_[i].player->get_balance() >= settings_.min_balance)
            return true;
    }

    return false;
}

void round_engine::set_shoe(std::unique_ptr<shoe> s)
{
    if (!s)
        throw std::invalid_argument("null shoe");

    shoe_ = std::move(s);
}

const shoe& round_engine::get_shoe() const
{
    return *shoe_;
}

participant* round_engine::find_participant(const std::string& name)
{
    for (std::size_t i = 0; i < seats_.size(); ++i)
    {
        if (boost::algorithm::iequals(seats_[i].player->get_name(), name))
            return seats_[i].player;
    }

    return nullptr;
}

void round_engine::connect_card_dealt(const std::function<void (const participant&, int)>& f)
{
    card_dealt_.connect(f);
}
