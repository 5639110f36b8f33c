#pragma once

#include "cli_options.hpp"
#include "sweep_plan.hpp"
#include "sweep_result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace ble::dtm
{
nlohmann::json trial_to_json(const TrialRecord &record);

nlohmann::json build_progress_json(const TrialRecord &record, std::size_t current, std::size_t total);

nlohmann::json build_json_payload(const CLIOptions &options,
                                  const SweepPlan &plan,
                                  const SweepSummary &summary,
                                  const SweepOutcome &outcome);

bool write_json_to_file(const nlohmann::json &payload, const std::filesystem::path &path, std::string &error);

} // namespace ble::dtm
