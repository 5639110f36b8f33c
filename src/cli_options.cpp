#include "cli_options.hpp"

#include "ble_dtm/hci_commands.hpp"
#include "sweep_plan.hpp"

#include <algorithm>
#include <sstream>
#include <string_view>
#include <utility>

namespace ble::dtm
{

bool parse_cli_options(int argc, char **argv, CLIOptions &options, std::string &error_message)
{
    options = {};
    std::vector<std::string_view> positional;
    for(int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        auto require_value = [&](std::string_view name) -> std::string_view {
            if(i + 1 >= argc)
            {
                std::ostringstream oss;
                oss << "Missing value for option '" << name << "'";
                error_message = oss.str();
                return {};
            }
            return std::string_view(argv[++i]);
        };

        if(arg == "-d" || arg == "--delay")
        {
            auto value = require_value(arg);
            if(value.empty() || !parse_int(value, options.delay_s) || options.delay_s < 0)
            {
                error_message = "Invalid value for --delay";
                return false;
            }
        }
        else if(arg == "-l" || arg == "--limit")
        {
            auto value = require_value(arg);
            if(value.empty() || !parse_double(value, options.per_limit))
            {
                error_message = "Invalid value for --limit";
                return false;
            }
        }
        else if(arg == "-p" || arg == "--phys")
        {
            auto value = require_value(arg);
            if(value.empty() || !parse_int_list(value, "--phys", options.phys, error_message))
            {
                return false;
            }
        }
        else if(arg == "-c" || arg == "--channel")
        {
            auto value = require_value(arg);
            if(value.empty() || !parse_int_list(value, "--channel", options.channels, error_message))
            {
                return false;
            }
        }
        else if(arg == "-t" || arg == "--txpows")
        {
            auto value = require_value(arg);
            if(value.empty() || !parse_int_list(value, "--txpows", options.tx_powers, error_message))
            {
                return false;
            }
        }
        else if(arg == "-a" || arg == "--attens")
        {
            auto value = require_value(arg);
            std::vector<double> attenuations;
            if(value.empty() || !parse_double_list(value, "--attens", attenuations, error_message))
            {
                return false;
            }
            options.attenuations = std::move(attenuations);
        }
        else if(arg == "-s" || arg == "--step")
        {
            auto value = require_value(arg);
            if(value.empty() || !parse_int(value, options.step_db) || options.step_db < 0)
            {
                error_message = "Invalid value for --step";
                return false;
            }
        }
        else if(arg == "-e" || arg == "--pktlen")
        {
            auto value = require_value(arg);
            if(value.empty() || !parse_int_list(value, "--pktlen", options.packet_lengths, error_message))
            {
                return false;
            }
        }
        else if(arg == "-n" || arg == "--numpkt")
        {
            auto value = require_value(arg);
            if(value.empty() || !parse_int_list(value, "--numpkt", options.packet_counts, error_message))
            {
                return false;
            }
        }
        else if(arg == "--mtp")
        {
            auto value = require_value(arg);
            if(value.empty())
            {
                error_message = "Invalid value for --mtp";
                return false;
            }
            options.master_trace_port = std::string(value);
        }
        else if(arg == "--stp")
        {
            auto value = require_value(arg);
            if(value.empty())
            {
                error_message = "Invalid value for --stp";
                return false;
            }
            options.slave_trace_port = std::string(value);
        }
        else if(arg == "--baud")
        {
            auto value = require_value(arg);
            if(value.empty() || !parse_int(value, options.baud_rate) || options.baud_rate <= 0)
            {
                error_message = "Invalid value for --baud";
                return false;
            }
        }
        else if(arg == "--attenuator")
        {
            options.use_attenuator = true;
        }
        else if(arg == "--attenuator-serial")
        {
            auto value = require_value(arg);
            if(value.empty())
            {
                error_message = "Invalid value for --attenuator-serial";
                return false;
            }
            options.use_attenuator = true;
            options.attenuator_serial = std::string(value);
        }
        else if(arg == "--header")
        {
            options.write_header = true;
        }
        else if(arg == "--logs")
        {
            auto value = require_value(arg);
            if(value.empty())
            {
                error_message = "Invalid value for --logs";
                return false;
            }
            options.logs_path = std::string(value);
        }
        else if(arg == "--json-out")
        {
            auto value = require_value(arg);
            if(value.empty())
            {
                error_message = "Invalid value for --json-out";
                return false;
            }
            options.json_out_path = std::string(value);
        }
        else if(arg == "--progress-ndjson")
        {
            options.progress_ndjson = true;
        }
        else if(arg == "--help" || arg == "-h")
        {
            error_message.clear();
            return false;
        }
        else if(arg.size() > 1 && arg.front() == '-')
        {
            std::ostringstream oss;
            oss << "Unknown argument: " << arg;
            error_message = oss.str();
            return false;
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if(positional.size() != 3)
    {
        error_message = "Expected <slaveSerial> <masterSerial> <results>";
        return false;
    }
    options.slave_serial = std::string(positional[0]);
    options.master_serial = std::string(positional[1]);
    options.results_path = std::string(positional[2]);

    if(std::any_of(options.packet_counts.begin(), options.packet_counts.end(),
                   [](int count) { return count <= 0 || count > kMaxPacketCount; }))
    {
        error_message = "--numpkt values must be between 1 and 65535";
        return false;
    }

    return true;
}

} // namespace ble::dtm
