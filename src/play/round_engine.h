#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <vector>
#include <functional>
#include <boost/noncopyable.hpp>
#include <boost/signals2.hpp>
#include "gamelib/participant.h"
#include "session_settings.h"

class shoe;
class strategy_base;

// Drives one table: owns the shoe and the dealer, and is the only code that
// draws cards or changes participant balances and hands during a round.
class round_engine : private boost::noncopyable
{
public:
    enum phase_t
    {
        RESHUFFLE_CHECK,
        SETUP,
        BETTING,
        DEAL,
        PLAYER_TURNS,
        DEALER_TURN,
        SETTLEMENT,
    };

    static const int DEALER_STAND_VALUE = 17;

    round_engine(const session_settings& settings, std::int64_t seed);
    ~round_engine();
    void add_participant(participant& p, strategy_base& s);
    void play();
    bool check_shoe();
    void reshuffle();
    void setup_round();
    void collect_bets();
    void deal();
    void play_participants();
    void play_dealer();
    void settle();
    bool can_continue() const;
    void set_shoe(std::unique_ptr<shoe> s);
    void set_god_mode(bool enabled) { settings_.god_mode = enabled; }
    bool get_god_mode() const { return settings_.god_mode; }
    const shoe& get_shoe() const;
    const participant& get_dealer() const { return dealer_; }
    int get_dealer_upcard() const;
    std::size_t get_participant_count() const { return seats_.size(); }
    const participant& get_participant(std::size_t i) const { return *seats_[i].player; }
    participant* find_participant(const std::string& name);
    int get_round() const { return round_; }
    phase_t get_phase() const { return phase_; }
    void connect_card_dealt(const std::function<void (const participant&, int)>& f);

private:
    struct seat
    {
        participant* player;
        strategy_base* strategy;
    };

    void require_phase(phase_t expected) const;
    void enter_phase(phase_t expected, phase_t next);
    int draw_to(participant& p);
    void play_hand(seat& s);
    void collect_bet(seat& s);

    session_settings settings_;
    std::mt19937 engine_;
    std::unique_ptr<shoe> shoe_;
    participant dealer_;
    std::vector<seat> seats_;
    int round_;
    phase_t phase_;
    boost::signals2::signal<void (const participant&, int)> card_dealt_;
};
