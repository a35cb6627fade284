#pragma once

#include <stdexcept>
#include <string>

// Rejected participant or shoe operation. Thrown before any state is changed.
class game_error : public std::runtime_error
{
public:
    explicit game_error(const std::string& what) : std::runtime_error(what) {}
};

class shoe_empty : public game_error
{
public:
    shoe_empty() : game_error("The shoe is empty, cannot draw card") {}
};

class invalid_bet : public game_error
{
public:
    invalid_bet() : game_error("Bet amount must be greater than zero") {}
};

class insufficient_balance : public game_error
{
public:
    explicit insufficient_balance(const std::string& what) : game_error(what) {}
};

class not_splittable : public game_error
{
public:
    explicit not_splittable(const std::string& what) : game_error(what) {}
};

class not_doubleable : public game_error
{
public:
    not_doubleable() : game_error("Cannot double down after a hit") {}
};

class invalid_balance : public game_error
{
public:
    invalid_balance() : game_error("Balance cannot be negative") {}
};
