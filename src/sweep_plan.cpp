#include "sweep_plan.hpp"

#include "cli_options.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <utility>

namespace ble::dtm
{
namespace
{
std::string_view trim(std::string_view text)
{
    while(!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    {
        text.remove_prefix(1);
    }
    while(!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    {
        text.remove_suffix(1);
    }
    return text;
}

std::string malformed(std::string_view name, std::string_view item)
{
    std::ostringstream oss;
    oss << "Invalid value '" << item << "' in " << name;
    return oss.str();
}

} // namespace

std::vector<std::string_view> split_list(std::string_view text)
{
    text = trim(text);
    std::vector<std::string_view> parts;
    size_t start = 0;
    while(start <= text.size())
    {
        size_t comma = text.find(',', start);
        if(comma == std::string_view::npos)
        {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, comma - start));
        start = comma + 1;
    }
    return parts;
}

bool parse_int(std::string_view text, int &out)
{
    text = trim(text);
    if(text.empty())
    {
        return false;
    }
    std::string s(text);
    char *end = nullptr;
    errno = 0;
    const long value = std::strtol(s.c_str(), &end, 10);
    if(end == s.c_str() || *end != '\0' || errno == ERANGE)
    {
        return false;
    }
    if(value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
    {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool parse_double(std::string_view text, double &out)
{
    text = trim(text);
    if(text.empty())
    {
        return false;
    }
    std::string s(text);
    char *end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end != s.c_str() && *end == '\0';
}

bool parse_int_list(std::string_view text, std::string_view name, std::vector<int> &out, std::string &error_message)
{
    std::vector<int> values;
    for(auto part : split_list(text))
    {
        int value = 0;
        if(!parse_int(part, value))
        {
            error_message = malformed(name, part);
            return false;
        }
        values.push_back(value);
    }
    out = std::move(values);
    return true;
}

bool parse_double_list(std::string_view text, std::string_view name, std::vector<double> &out, std::string &error_message)
{
    std::vector<double> values;
    for(auto part : split_list(text))
    {
        double value = 0.0;
        if(!parse_double(part, value))
        {
            error_message = malformed(name, part);
            return false;
        }
        values.push_back(value);
    }
    out = std::move(values);
    return true;
}

std::vector<double> default_attenuations(int step_db)
{
    std::vector<double> levels;
    if(step_db == 0)
    {
        // Fixed pair, the requested range is ignored
        levels = {20.0, 70.0};
    }
    else
    {
        for(int level = kDefaultAttenuationStart; level < kMaxAttenuation; level += step_db)
        {
            levels.push_back(static_cast<double>(level));
            if(step_db >= kMaxAttenuation - level)
            {
                break;
            }
        }
    }
    levels.push_back(static_cast<double>(kMaxAttenuation));
    return levels;
}

SweepPlan build_sweep_plan(const CLIOptions &options)
{
    SweepPlan plan;
    plan.packet_lengths = options.packet_lengths;
    plan.packet_counts = options.packet_counts;
    plan.phys = options.phys;
    plan.tx_powers = options.tx_powers;
    plan.channels = options.channels;
    plan.attenuations = options.attenuations ? *options.attenuations : default_attenuations(options.step_db);
    return plan;
}

std::vector<SweepTuple> expand_tuples(const SweepPlan &plan)
{
    std::vector<SweepTuple> tuples;
    tuples.reserve(plan.packet_lengths.size() * plan.packet_counts.size() * plan.phys.size() *
                   plan.tx_powers.size() * plan.channels.size());
    for(int packet_length : plan.packet_lengths)
    {
        for(int packet_count : plan.packet_counts)
        {
            for(int phy : plan.phys)
            {
                for(int tx_power : plan.tx_powers)
                {
                    for(int channel : plan.channels)
                    {
                        tuples.push_back(SweepTuple{packet_length, packet_count, phy, tx_power, channel});
                    }
                }
            }
        }
    }
    return tuples;
}

std::size_t trial_count(const SweepPlan &plan)
{
    return plan.packet_lengths.size() * plan.packet_counts.size() * plan.phys.size() * plan.tx_powers.size() *
           plan.channels.size() * plan.attenuations.size();
}

} // namespace ble::dtm
