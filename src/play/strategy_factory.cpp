#include "strategy_factory.h"
#include <stdexcept>
#include "random_strategy.h"
#include "session_settings.h"
#include "table_strategy.h"
#include "threshold_strategy.h"

std::unique_ptr<strategy_base> create_bot_strategy(const std::string& name, const session_settings& settings,
    const std::int64_t seed)
{
    std::unique_ptr<strategy_base> s;

    if (name == "default" || name == "threshold")
        s.reset(new threshold_strategy(settings.default_bet, settings.bot_bet_policy));
    else if (name == "by the books" || name == "table")
        s.reset(new table_strategy(settings.default_bet, settings.bot_bet_policy));
    else if (name == "random")
        s.reset(new random_strategy(settings.default_bet, settings.bot_bet_policy, seed));
    else
        throw std::runtime_error("Invalid bot strategy " + name);

    return s;
}
