#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ble::dtm
{
struct CLIOptions;

inline constexpr int kDefaultAttenuationStart = 20;
inline constexpr int kMaxAttenuation = 90;

struct SweepTuple
{
    int packet_length = 0;
    int packet_count = 0;
    int phy = 0;
    int tx_power_dbm = 0;
    int channel = 0;
};

struct SweepPlan
{
    std::vector<int> packet_lengths;
    std::vector<int> packet_counts;
    std::vector<int> phys;
    std::vector<int> tx_powers;
    std::vector<int> channels;
    std::vector<double> attenuations;
};

std::vector<std::string_view> split_list(std::string_view text);

bool parse_int(std::string_view text, int &out);
bool parse_double(std::string_view text, double &out);

bool parse_int_list(std::string_view text, std::string_view name, std::vector<int> &out, std::string &error_message);
bool parse_double_list(std::string_view text, std::string_view name, std::vector<double> &out, std::string &error_message);

/**
 * Attenuation levels used when none are given explicitly: 20 dB upwards in
 * `step_db` increments while below 90 dB, then 90 dB. A step of zero yields
 * the fixed pair 20, 70 before the 90 dB level.
 */
std::vector<double> default_attenuations(int step_db);

SweepPlan build_sweep_plan(const CLIOptions &options);

/**
 * Cartesian product of the plan's parameter lists. Packet length varies
 * slowest, channel fastest.
 */
std::vector<SweepTuple> expand_tuples(const SweepPlan &plan);

std::size_t trial_count(const SweepPlan &plan);

} // namespace ble::dtm
