#pragma once

#include "sweep_controller.hpp"

namespace ble::dtm
{
struct SweepSummary
{
    double per_max = 0.0;
    double per_limit = 0.0;
    bool limit_enabled = false;
    bool overall_pass = true;
    std::size_t trial_count = 0;
    std::size_t gave_up_count = 0;
};

/**
 * Compare the worst PER of a sweep against the limit. A limit of zero turns
 * the check off and the sweep always passes.
 */
SweepSummary evaluate_sweep(double per_limit, const SweepOutcome &outcome);

int exit_code_for(const SweepSummary &summary);

} // namespace ble::dtm
