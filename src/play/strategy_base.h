#pragma once

#include <string>
#include <boost/noncopyable.hpp>

class hand;

class strategy_base : private boost::noncopyable
{
public:
    strategy_base() {}
    virtual ~strategy_base() {}
    // Returns one of HIT, STAND, DOUBLE or SPLIT
    virtual int decide(const hand& h, int dealer_card, double balance, int current_bet) = 0;
    virtual bool decide_split_eligible(const hand& h) const;
    // Stake for the next round, 0 sits the round out
    virtual int get_bet(const std::string& name, double balance) = 0;
    // Interactive strategies are asked again after a rejected action, others fall back to a hit
    virtual bool is_interactive() const { return false; }
    virtual void action_rejected(int action, const std::string& reason);
    virtual void bet_rejected(int amount, const std::string& reason);
};
