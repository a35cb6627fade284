#pragma once

#include <istream>
#include <ostream>
#include <functional>
#include "strategy_base.h"

// Human player reading decisions and bets from a text stream
class console_strategy : public strategy_base
{
public:
    typedef std::function<void (const std::string&)> command_handler;

    console_strategy(std::istream& in, std::ostream& out);
    void set_command_handler(const command_handler& handler);
    int decide(const hand& h, int dealer_card, double balance, int current_bet);
    int get_bet(const std::string& name, double balance);
    bool is_interactive() const { return true; }
    void action_rejected(int action, const std::string& reason);
    void bet_rejected(int amount, const std::string& reason);

private:
    std::string read_line(const std::string& prompt);

    std::istream& in_;
    std::ostream& out_;
    command_handler handler_;
};
