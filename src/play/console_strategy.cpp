#include "console_strategy.h"
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include "gamelib/action.h"
#include "gamelib/hand.h"
#include "util/card.h"

console_strategy::console_strategy(std::istream& in, std::ostream& out)
    : in_(in)
    , out_(out)
{
}

void console_strategy::set_command_handler(const command_handler& handler)
{
    handler_ = handler;
}

std::string console_strategy::read_line(const std::string& prompt)
{
    out_ << prompt << std::flush;

    std::string line;

    if (!std::getline(in_, line))
        throw std::runtime_error("input closed");

    boost::algorithm::trim(line);
    return line;
}

int console_strategy::decide(const hand& h, const int dealer_card, double, int)
{
    out_ << boost::format("\tCurrent hand: %1%, dealer shows %2%\n") % h % get_card_name(dealer_card);

    const std::string prompt = decide_split_eligible(h)
        ? "\tChoose action (1=hit / 2=stand / 3=double / 4=split): "
        : "\tChoose action (1=hit / 2=stand / 3=double): ";

    for (;;)
    {
        const int action = string_to_action(boost::algorithm::to_lower_copy(read_line(prompt)));

        if (action != -1)
            return action;

        out_ << "\tInvalid action. Try again.\n";
    }
}

int console_strategy::get_bet(const std::string& name, const double balance)
{
    const std::string prompt = (boost::format("%1%, enter bet amount ($%2%): ") % name % balance).str();

    for (;;)
    {
        const std::string line = read_line(prompt);

        if (line.empty())
            continue;

        if (line[0] == '/')
        {
            if (handler_)
                handler_(line.substr(1));
            else
                out_ << "Commands are not available.\n";

            continue;
        }

        try
        {
            return boost::lexical_cast<int>(line);
        }
        catch (const boost::bad_lexical_cast&)
        {
            out_ << "Bet must be a number.\n";
        }
    }
}

void console_strategy::action_rejected(const int action, const std::string& reason)
{
    out_ << boost::format("\tCannot %1%: %2%\n") % get_action_string(action) % reason;
}

void console_strategy::bet_rejected(const int amount, const std::string& reason)
{
    out_ << boost::format("Cannot bet $%1%: %2%\n") % amount % reason;
}
