#include "sweep_controller.hpp"

#include "log.hpp"
#include "number_format.hpp"

#include <algorithm>
#include <sstream>
#include <thread>
#include <utility>

namespace ble::dtm
{
namespace
{
constexpr const char *kSeparator =
    "--------------------------------------------------------------------------------------------";

std::string describe(const SweepTuple &tuple, double attenuation_db)
{
    std::ostringstream oss;
    oss << "packetLen: " << tuple.packet_length
        << ", numPackets: " << tuple.packet_count
        << ", phy: " << tuple.phy
        << ", atten: " << format_number(attenuation_db)
        << ", txPower: " << tuple.tx_power_dbm
        << ", Channel: " << tuple.channel;
    return oss.str();
}

} // namespace

double per_from_count(std::uint16_t received, int requested)
{
    if(requested <= 0)
    {
        return kGiveUpPer;
    }
    const int missing = std::max(0, requested - static_cast<int>(received));
    return 100.0 * static_cast<double>(missing) / static_cast<double>(requested);
}

SweepController::SweepController(DutSession &master,
                                 DutSession &slave,
                                 Attenuator *attenuator,
                                 ResultSink &sink,
                                 SweepSettings settings,
                                 SleepFunction sleep)
    : m_master(master),
      m_slave(slave),
      m_attenuator(attenuator),
      m_sink(sink),
      m_settings(settings),
      m_sleep(std::move(sleep))
{
    if(!m_sleep)
    {
        m_sleep = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
}

void SweepController::set_trial_callback(TrialCallback callback)
{
    m_trial_callback = std::move(callback);
}

void SweepController::pause(std::chrono::milliseconds duration)
{
    m_sleep(duration);
}

void SweepController::reset_devices()
{
    log_line("Reset the devices.");
    m_slave.reset(ResetRequest{});
    m_master.reset(ResetRequest{});
    pause(m_settings.settle_delay);
}

std::optional<double> SweepController::measure(DutSession &receiver, DutSession &transmitter, const SweepTuple &tuple)
{
    log_line("Set " + receiver.name() + " to RX.");
    receiver.rx_test(RxTestRequest{tuple.channel, tuple.phy});

    log_line("Set " + transmitter.name() + " to TX, start test.");
    TxTestRequest tx_request;
    tx_request.channel = tuple.channel;
    tx_request.phy = tuple.phy;
    tx_request.packet_length = tuple.packet_length;
    tx_request.packet_count = tuple.packet_count;
    transmitter.tx_test(tx_request);

    log_line("Wait " + std::to_string(m_settings.test_delay.count()) + " secs for the DTM Test to complete.");
    pause(m_settings.test_delay);

    log_line("End test.");
    (void)transmitter.end_test(EndTestRequest{});
    const auto received = receiver.end_test(EndTestRequest{});
    if(!received)
    {
        return std::nullopt;
    }
    return per_from_count(*received, tuple.packet_count);
}

std::optional<TrialResult> SweepController::attempt(const SweepTuple &tuple, double attenuation_db)
{
    log_line("Set the requested attenuation.");
    if(m_attenuator)
    {
        m_attenuator->set_attenuation(attenuation_db);
    }
    pause(m_settings.settle_delay);

    reset_devices();

    log_line("Set the PHY.");
    m_master.set_phy(SetPhyRequest{tuple.phy});

    log_line("Set the txPower.");
    m_slave.set_tx_power(SetTxPowerRequest{tuple.tx_power_dbm, 0});
    m_master.set_tx_power(SetTxPowerRequest{tuple.tx_power_dbm, 0});

    const auto per_slave = measure(m_slave, m_master, tuple);

    reset_devices();

    const auto per_master = measure(m_master, m_slave, tuple);

    log_line("perMaster  : " + (per_master ? format_number(*per_master) : std::string("none")));
    log_line("perSlave   : " + (per_slave ? format_number(*per_slave) : std::string("none")));

    if(!per_master || !per_slave)
    {
        return std::nullopt;
    }

    TrialResult result;
    result.per_master = *per_master;
    result.per_slave = *per_slave;
    return result;
}

TrialResult SweepController::run_trial(const SweepTuple &tuple, double attenuation_db)
{
    int attempts = 0;
    while(attempts < m_settings.retry_budget)
    {
        ++attempts;
        auto result = attempt(tuple, attenuation_db);
        if(result)
        {
            result->attempts = attempts;
            return *result;
        }
        log_line("Retry: " + std::to_string(attempts));
    }

    log_line("Tried " + std::to_string(attempts) + " times, give up.");
    TrialResult forced;
    forced.per_master = kGiveUpPer;
    forced.per_slave = kGiveUpPer;
    forced.attempts = attempts;
    forced.gave_up = true;
    return forced;
}

SweepOutcome SweepController::run(const SweepPlan &plan)
{
    SweepOutcome outcome;
    const auto tuples = expand_tuples(plan);
    const std::size_t total = trial_count(plan);
    outcome.trials.reserve(total);

    for(const auto &tuple : tuples)
    {
        for(const double attenuation : plan.attenuations)
        {
            const auto start = std::chrono::steady_clock::now();
            log_line(kSeparator);
            log_line(describe(tuple, attenuation));

            const TrialResult result = run_trial(tuple, attenuation);
            outcome.per_max = std::max({outcome.per_max, result.per_master, result.per_slave});
            log_line("perMax     : " + format_number(outcome.per_max));

            TrialRecord record;
            record.tuple = tuple;
            record.attenuation_db = attenuation;
            record.per_master = result.per_master;
            record.per_slave = result.per_slave;
            record.attempts = result.attempts;
            record.gave_up = result.gave_up;
            m_sink.write_row(record);
            outcome.trials.push_back(record);

            if(m_trial_callback)
            {
                m_trial_callback(record, outcome.trials.size(), total);
            }

            const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start);
            log_line("Used " + std::to_string(elapsed.count()) + " seconds.");
        }
    }

    log_line(kSeparator);
    reset_devices();
    m_sink.finish();

    log_line("perMax: " + format_number(outcome.per_max));
    return outcome;
}

} // namespace ble::dtm
