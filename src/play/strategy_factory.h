#pragma once

#include <memory>
#include <string>
#include <cstdint>

class strategy_base;
struct session_settings;

// Bot strategy by settings name: "default", "by the books" or "random"
std::unique_ptr<strategy_base> create_bot_strategy(const std::string& name, const session_settings& settings,
    std::int64_t seed);
