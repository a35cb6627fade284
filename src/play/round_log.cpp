#include "round_log.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>
#include <boost/property_tree/json_parser.hpp>
#include <boost/regex.hpp>
#include "gamelib/action.h"
#include "gamelib/participant.h"
#include "util/card.h"
#include "round_engine.h"

namespace
{
    typedef boost::property_tree::ptree ptree;

    template<class T>
    ptree make_array(const T& values)
    {
        ptree array;

        for (const auto& value : values)
        {
            ptree item;
            item.put_value(value);
            array.push_back(std::make_pair(std::string(), item));
        }

        return array;
    }

    ptree make_card_array(const std::vector<int>& cards)
    {
        std::vector<std::string> names;

        for (std::size_t i = 0; i < cards.size(); ++i)
            names.push_back(get_card_name(cards[i]));

        return make_array(names);
    }

    ptree make_participant_record(const participant& p)
    {
        ptree record;
        record.put("name", p.get_name());
        record.put("bet", p.get_current_bet());

        ptree actions;

        for (const auto& a : p.get_actions())
        {
            ptree action;
            action.put("action", get_action_string(a.action));
            action.add_child("player_hand", make_card_array(a.cards));
            action.put("hand_value", a.value);
            action.put("dealer_visible_card", get_card_name(a.dealer_card));
            actions.push_back(std::make_pair(std::string(), action));
        }

        record.add_child("actions", actions);
        record.add_child("final_hand", make_card_array(p.get_hand(0).get_cards()));
        record.put("final_value", p.get_hand(0).get_value());
        record.put("result", get_result_string(p.get_result()));
        record.put("balance", p.get_balance());

        ptree hands;

        for (std::size_t i = 0; i < p.get_hand_count(); ++i)
        {
            const hand& h = p.get_hand(i);
            ptree entry;
            entry.add_child("cards", make_card_array(h.get_cards()));
            entry.put("value", h.get_value());
            entry.put("bet", p.get_hand_bet(i));
            entry.put("result", get_result_string(p.get_hand_result(i)));
            hands.push_back(std::make_pair(std::string(), entry));
        }

        record.add_child("hands", hands);
        return record;
    }
}

round_log::round_log(const std::string& filename)
    : filename_(filename)
{
}

ptree round_log::make_record(const round_engine& engine)
{
    const hand& dealer_hand = engine.get_dealer().get_hand(0);

    std::vector<std::string> initial;

    if (!dealer_hand.empty())
        initial.push_back(get_card_name(dealer_hand.get_card(0)));

    initial.push_back("Hidden");

    ptree dealer;
    dealer.add_child("initial_hand", make_array(initial));
    dealer.add_child("final_hand", make_card_array(dealer_hand.get_cards()));
    dealer.put("final_value", dealer_hand.get_value());

    ptree players;

    for (std::size_t i = 0; i < engine.get_participant_count(); ++i)
        players.push_back(std::make_pair(std::string(), make_participant_record(engine.get_participant(i))));

    ptree record;
    record.put("game_number", engine.get_round());
    record.add_child("dealer", dealer);
    record.add_child("players", players);
    return record;
}

void round_log::add_round(const round_engine& engine)
{
    rounds_.push_back(std::make_pair(std::string(), make_record(engine)));

    if (!filename_.empty())
        save();
}

void round_log::write(std::ostream& os) const
{
    // write_json quotes every value, numeric fields go out unquoted
    static const boost::regex re(
        "(\"(?:game_number|bet|hand_value|final_value|value|balance)\":\\s*)"
        "\"(-?[0-9]+(?:\\.[0-9]+)?(?:e[-+]?[0-9]+)?)\"");

    std::ostringstream ss;
    boost::property_tree::write_json(ss, rounds_);
    os << boost::regex_replace(ss.str(), re, "$1$2");
}

void round_log::save() const
{
    std::ofstream f(filename_);

    if (!f)
        throw std::runtime_error("unable to open round log: " + filename_);

    write(f);
}
