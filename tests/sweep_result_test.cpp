#include "sweep_result.hpp"

#include <gtest/gtest.h>

namespace ble::dtm
{
namespace
{

SweepOutcome outcome_with(double per_max, int gave_up = 0)
{
    SweepOutcome outcome;
    outcome.per_max = per_max;
    outcome.trials.resize(3);
    for(int i = 0; i < gave_up; ++i)
    {
        outcome.trials[static_cast<std::size_t>(i)].gave_up = true;
    }
    return outcome;
}

TEST(SweepResult, ZeroLimitDisablesCheck)
{
    const auto summary = evaluate_sweep(0.0, outcome_with(100.0));
    EXPECT_FALSE(summary.limit_enabled);
    EXPECT_TRUE(summary.overall_pass);
    EXPECT_EQ(exit_code_for(summary), 0);
}

TEST(SweepResult, AboveLimitFails)
{
    const auto summary = evaluate_sweep(5.0, outcome_with(5.01));
    EXPECT_TRUE(summary.limit_enabled);
    EXPECT_FALSE(summary.overall_pass);
    EXPECT_EQ(exit_code_for(summary), 1);
}

TEST(SweepResult, AtLimitPasses)
{
    EXPECT_EQ(exit_code_for(evaluate_sweep(5.0, outcome_with(5.0))), 0);
    EXPECT_EQ(exit_code_for(evaluate_sweep(5.0, outcome_with(0.0))), 0);
}

TEST(SweepResult, CountsGivenUpTrials)
{
    const auto summary = evaluate_sweep(30.0, outcome_with(100.0, 2));
    EXPECT_EQ(summary.trial_count, 3u);
    EXPECT_EQ(summary.gave_up_count, 2u);
    EXPECT_EQ(exit_code_for(summary), 1);
}

} // namespace
} // namespace ble::dtm
