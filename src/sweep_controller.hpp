#pragma once

#include "ble_dtm/attenuator.hpp"
#include "ble_dtm/dut_session.hpp"
#include "result_sink.hpp"
#include "sweep_plan.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace ble::dtm
{
inline constexpr double kGiveUpPer = 100.0;

struct SweepSettings
{
    // Air time allowed for each directional test.
    std::chrono::seconds test_delay{5};
    // Pause after an attenuation change or a device reset.
    std::chrono::milliseconds settle_delay{100};
    int retry_budget = 2;
};

struct TrialResult
{
    double per_master = 0.0;
    double per_slave = 0.0;
    int attempts = 0;
    bool gave_up = false;
};

struct SweepOutcome
{
    double per_max = 0.0;
    std::vector<TrialRecord> trials;
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;
using TrialCallback = std::function<void(const TrialRecord &record, std::size_t current, std::size_t total)>;

/**
 * Packet error rate in percent: the share of the requested packets the
 * receiver did not report.
 */
double per_from_count(std::uint16_t received, int requested);

/**
 * Runs the DTM trial protocol over every (tuple, attenuation) pair of a plan.
 * `attenuator` may be null when no attenuator is fitted; the devices and the
 * sink must outlive the controller.
 */
class SweepController
{
public:
    SweepController(DutSession &master,
                    DutSession &slave,
                    Attenuator *attenuator,
                    ResultSink &sink,
                    SweepSettings settings,
                    SleepFunction sleep = {});

    void set_trial_callback(TrialCallback callback);

    /**
     * Measure both directions for one tuple at one attenuation. A measurement
     * without a packet count is retried while the retry budget lasts; when it
     * runs out both PER values are forced to 100.
     */
    TrialResult run_trial(const SweepTuple &tuple, double attenuation_db);

    /**
     * Run every trial of the plan, append one row per trial to the sink and
     * return the highest PER seen. Devices are reset after the last trial.
     */
    SweepOutcome run(const SweepPlan &plan);

private:
    std::optional<TrialResult> attempt(const SweepTuple &tuple, double attenuation_db);
    std::optional<double> measure(DutSession &receiver, DutSession &transmitter, const SweepTuple &tuple);
    void reset_devices();
    void pause(std::chrono::milliseconds duration);

    DutSession &m_master;
    DutSession &m_slave;
    Attenuator *m_attenuator;
    ResultSink &m_sink;
    SweepSettings m_settings;
    SleepFunction m_sleep;
    TrialCallback m_trial_callback;
};

} // namespace ble::dtm
