#pragma once

#include <ostream>
#include <string>
#include <boost/noncopyable.hpp>

class round_engine;

// Thrown by /exit, ends the session loop
struct quit_requested {};

// Operator commands typed at the bet prompt, without the leading slash
class session_commands : private boost::noncopyable
{
public:
    session_commands(round_engine& engine, std::ostream& os);
    void run(const std::string& command);
    void print_balances() const;
    void print_help() const;

private:
    void edit_balance(const std::string& name, const std::string& amount);

    round_engine& engine_;
    std::ostream& os_;
};
