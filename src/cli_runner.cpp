#include "cli_runner.hpp"

#include "ble_dtm/attenuator.hpp"
#include "ble_dtm/dut_session.hpp"
#include "json_writer.hpp"
#include "log.hpp"
#include "number_format.hpp"
#include "result_sink.hpp"
#include "sweep_controller.hpp"
#include "sweep_plan.hpp"
#include "sweep_result.hpp"

#include <fstream>
#include <iostream>
#include <memory>

namespace ble::dtm
{
namespace
{
void log_configuration(const CLIOptions &options, const SweepPlan &plan)
{
    log_line("slaveSerial   : " + options.slave_serial);
    log_line("masterSerial  : " + options.master_serial);
    log_line("results       : " + options.results_path);
    log_line("delay         : " + std::to_string(options.delay_s));
    log_line("packetLengths : " + format_list(plan.packet_lengths));
    log_line("numPackets    : " + format_list(plan.packet_counts));
    log_line("phys          : " + format_list(plan.phys));
    log_line("attens        : " + format_list(plan.attenuations));
    log_line("txPowers      : " + format_list(plan.tx_powers));
    log_line("Channel       : " + format_list(plan.channels));
    log_line("PER limit     : " + format_number(options.per_limit));
    log_line(std::string("attenuator    : ") + (options.use_attenuator ? "yes" : "no"));
}

bool open_session(HciUartSession &session,
                  const std::string &name,
                  const std::string &port,
                  const std::string &trace_port,
                  int baud_rate)
{
    HciUartSettings settings;
    settings.name = name;
    settings.serial_port = port;
    settings.trace_port = trace_port;
    settings.baud_rate = baud_rate;
    if(!session.open(settings))
    {
        log_error("Failed to open " + name + ": " + session.last_error_message());
        return false;
    }
    return true;
}

} // namespace

int run_cli(const CLIOptions &options)
{
    if(options.logs_path)
    {
        std::string error_message;
        if(!open_log_file(*options.logs_path, error_message))
        {
            log_error(error_message);
            return 2;
        }
    }

    const SweepPlan plan = build_sweep_plan(options);
    log_configuration(options, plan);

    std::ofstream results(options.results_path, std::ios::out | std::ios::app);
    if(!results)
    {
        log_error("Failed to open results file " + options.results_path);
        return 2;
    }
    if(options.write_header)
    {
        write_parameter_header(results, options, plan);
    }

    HciUartSession slave;
    HciUartSession master;
    if(!open_session(slave, "slave", options.slave_serial, options.slave_trace_port, options.baud_rate) ||
       !open_session(master, "master", options.master_serial, options.master_trace_port, options.baud_rate))
    {
        return 2;
    }

    std::unique_ptr<RcdatAttenuator> attenuator;
    if(options.use_attenuator)
    {
        attenuator = std::make_unique<RcdatAttenuator>();
        if(!attenuator->connect(options.attenuator_serial.value_or("")))
        {
            log_error("Failed to connect attenuator: " + attenuator->last_error_message());
            return 2;
        }
    }

    SweepSettings settings;
    settings.test_delay = std::chrono::seconds(options.delay_s);

    CsvResultSink sink(results);
    SweepController controller(master, slave, attenuator.get(), sink, settings);
    if(options.progress_ndjson)
    {
        controller.set_trial_callback([](const TrialRecord &record, std::size_t current, std::size_t total) {
            std::cerr << build_progress_json(record, current, total).dump() << '\n';
        });
    }

    const SweepOutcome outcome = controller.run(plan);
    results.close();

    const SweepSummary summary = evaluate_sweep(options.per_limit, outcome);
    if(summary.gave_up_count > 0)
    {
        log_line("Trials given up: " + std::to_string(summary.gave_up_count));
    }

    if(options.json_out_path)
    {
        std::string error_message;
        const auto payload = build_json_payload(options, plan, summary, outcome);
        if(!write_json_to_file(payload, *options.json_out_path, error_message))
        {
            log_error(error_message);
            return 10;
        }
    }

    if(!summary.overall_pass)
    {
        log_error("PER too high!");
    }
    return exit_code_for(summary);
}

std::string usage()
{
    return R"(ble-dtm-sweep - BLE Direct Test Mode PER sweep between two devices

Usage: ble-dtm-sweep [options] <slaveSerial> <masterSerial> <results>

Positional arguments:
  slaveSerial                Serial port of the slave device
  masterSerial               Serial port of the master device
  results                    CSV file the results are appended to

The PER of each device is measured with the other device in TX test mode
sending a fixed number of packets (vendor specific command, MAX32 devices):
  PER = (numPackets - numPacketsReceived) / numPackets * 100

Options:
  -d, --delay <s>            Seconds to wait before ending each test (default 5)
  -l, --limit <per>          PER limit for the return value, 0 disables (default 0)
  -p, --phys <list>          PHYs to test with, comma separated, 1-4 (default 1)
  -c, --channel <list>       Test channels, comma separated, 0-39 (default 0)
  -t, --txpows <list>        TX powers in dBm, comma separated (default 0)
  -a, --attens <list>        Attenuation settings in dB, comma separated
  -s, --step <dB>            Attenuation sweep step size (default 10)
  -e, --pktlen <list>        Packet lengths, comma separated (default 250)
  -n, --numpkt <list>        Number of packets per test, comma separated (default 5000)
      --mtp <port>           Master trace serial port
      --stp <port>           Slave trace serial port
      --baud <rate>          Serial baud rate (default 115200)
      --attenuator           Drive a Mini-Circuits RCDAT USB attenuator
      --attenuator-serial <sn>
                             Select the attenuator by serial number
      --header               Write a parameter block and column names first
      --json-out <path>      Write a JSON summary of the sweep
      --logs <path>          Append the console log to a file
      --progress-ndjson      Emit NDJSON progress updates to stderr
  -h, --help                 Show this message

Environment:
  BLE_DTM_DEBUG=1            Hex dump HCI traffic
)";
}

} // namespace ble::dtm
