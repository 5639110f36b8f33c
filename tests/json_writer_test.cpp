#include "json_writer.hpp"

#include <gtest/gtest.h>

namespace ble::dtm
{
namespace
{

TrialRecord sample_record()
{
    TrialRecord record;
    record.tuple = SweepTuple{250, 5000, 1, 0, 0};
    record.attenuation_db = 20;
    record.per_master = 1.5;
    record.per_slave = 0;
    record.attempts = 1;
    return record;
}

TEST(JsonWriter, ProgressLine)
{
    const auto progress = build_progress_json(sample_record(), 2, 8);
    EXPECT_EQ(progress["type"], "progress");
    EXPECT_EQ(progress["current_trial"], 2);
    EXPECT_EQ(progress["total_trials"], 8);
    EXPECT_EQ(progress["trial"]["attenuation_db"], 20.0);
    EXPECT_EQ(progress["trial"]["per_master"], 1.5);
    EXPECT_EQ(progress["trial"]["gave_up"], false);
}

TEST(JsonWriter, SummaryPayload)
{
    CLIOptions options;
    options.slave_serial = "/dev/ttyUSB0";
    options.master_serial = "/dev/ttyUSB1";
    options.per_limit = 1.0;

    SweepPlan plan;
    plan.packet_lengths = {250};
    plan.packet_counts = {5000};
    plan.phys = {1};
    plan.tx_powers = {0};
    plan.channels = {0};
    plan.attenuations = {20, 90};

    SweepOutcome outcome;
    outcome.per_max = 1.5;
    outcome.trials = {sample_record()};

    const auto summary = evaluate_sweep(options.per_limit, outcome);
    const auto payload = build_json_payload(options, plan, summary, outcome);

    EXPECT_EQ(payload["devices"]["slave"]["serial"], "/dev/ttyUSB0");
    EXPECT_EQ(payload["config"]["attenuations"].size(), 2u);
    EXPECT_EQ(payload["results"]["per_max"], 1.5);
    EXPECT_EQ(payload["results"]["limit_enabled"], true);
    EXPECT_EQ(payload["results"]["pass"], false);
    ASSERT_EQ(payload["trials"].size(), 1u);
    EXPECT_EQ(payload["trials"][0]["packet_length"], 250);
}

} // namespace
} // namespace ble::dtm
