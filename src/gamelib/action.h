#pragma once

#include <string>

enum action_t
{
    HIT,
    STAND,
    DOUBLE,
    SPLIT,
    ACTIONS
};

inline const std::string get_action_string(const int action)
{
    switch (action)
    {
    case HIT: return "hit";
    case STAND: return "stand";
    case DOUBLE: return "double";
    case SPLIT: return "split";
    default: return "?";
    }
}

// Accepts the action names and the console hotkeys 1-4, returns -1 otherwise
inline int string_to_action(const std::string& s)
{
    if (s == "hit" || s == "1")
        return HIT;
    else if (s == "stand" || s == "2")
        return STAND;
    else if (s == "double" || s == "3")
        return DOUBLE;
    else if (s == "split" || s == "4")
        return SPLIT;

    return -1;
}
