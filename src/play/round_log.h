#pragma once

#include <string>
#include <boost/noncopyable.hpp>
#include <boost/property_tree/ptree.hpp>

class round_engine;

// Session history, one JSON record per settled round
class round_log : private boost::noncopyable
{
public:
    explicit round_log(const std::string& filename = std::string());
    void add_round(const round_engine& engine);
    void save() const;
    void write(std::ostream& os) const;
    std::size_t size() const { return rounds_.size(); }
    const boost::property_tree::ptree& get_rounds() const { return rounds_; }
    static boost::property_tree::ptree make_record(const round_engine& engine);

private:
    std::string filename_;
    boost::property_tree::ptree rounds_;
};
