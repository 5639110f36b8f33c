#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ble::dtm
{
struct CLIOptions
{
    std::string slave_serial;
    std::string master_serial;
    std::string results_path;
    int delay_s = 5;
    double per_limit = 0.0;
    std::vector<int> phys{1};
    std::vector<int> channels{0};
    std::vector<int> tx_powers{0};
    std::optional<std::vector<double>> attenuations;
    int step_db = 10;
    std::vector<int> packet_lengths{250};
    std::vector<int> packet_counts{5000};
    std::string master_trace_port;
    std::string slave_trace_port;
    int baud_rate = 115200;
    bool use_attenuator = false;
    std::optional<std::string> attenuator_serial;
    bool write_header = false;
    bool progress_ndjson = false;
    std::optional<std::string> logs_path;
    std::optional<std::string> json_out_path;
};

bool parse_cli_options(int argc, char **argv, CLIOptions &options, std::string &error_message);

} // namespace ble::dtm
