#include "sweep_result.hpp"

#include <algorithm>

namespace ble::dtm
{

SweepSummary evaluate_sweep(double per_limit, const SweepOutcome &outcome)
{
    SweepSummary summary;
    summary.per_max = outcome.per_max;
    summary.per_limit = per_limit;
    summary.limit_enabled = per_limit != 0.0;
    summary.trial_count = outcome.trials.size();
    summary.gave_up_count = static_cast<std::size_t>(
        std::count_if(outcome.trials.begin(), outcome.trials.end(), [](const TrialRecord &record) { return record.gave_up; }));

    if(summary.limit_enabled && summary.per_max > per_limit)
    {
        summary.overall_pass = false;
    }
    return summary;
}

int exit_code_for(const SweepSummary &summary)
{
    return summary.overall_pass ? 0 : 1;
}

} // namespace ble::dtm
