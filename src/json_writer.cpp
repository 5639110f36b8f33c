#include "json_writer.hpp"

#include <fstream>
#include <utility>

namespace ble::dtm
{

nlohmann::json trial_to_json(const TrialRecord &record)
{
    return {
        {"packet_length", record.tuple.packet_length},
        {"packet_count", record.tuple.packet_count},
        {"phy", record.tuple.phy},
        {"attenuation_db", record.attenuation_db},
        {"tx_power_dbm", record.tuple.tx_power_dbm},
        {"channel", record.tuple.channel},
        {"per_master", record.per_master},
        {"per_slave", record.per_slave},
        {"attempts", record.attempts},
        {"gave_up", record.gave_up}
    };
}

nlohmann::json build_progress_json(const TrialRecord &record, std::size_t current, std::size_t total)
{
    nlohmann::json progress = {
        {"type", "progress"},
        {"current_trial", current},
        {"total_trials", total}
    };
    progress["trial"] = trial_to_json(record);
    return progress;
}

nlohmann::json build_json_payload(const CLIOptions &options,
                                  const SweepPlan &plan,
                                  const SweepSummary &summary,
                                  const SweepOutcome &outcome)
{
    nlohmann::json payload;
    payload["devices"] = {
        {"slave", {{"serial", options.slave_serial}, {"trace", options.slave_trace_port}}},
        {"master", {{"serial", options.master_serial}, {"trace", options.master_trace_port}}},
        {"attenuator", options.use_attenuator}
    };
    payload["config"] = {
        {"delay_s", options.delay_s},
        {"packet_lengths", plan.packet_lengths},
        {"packet_counts", plan.packet_counts},
        {"phys", plan.phys},
        {"tx_powers", plan.tx_powers},
        {"channels", plan.channels},
        {"attenuations", plan.attenuations}
    };
    payload["results"] = {
        {"per_max", summary.per_max},
        {"limit", summary.per_limit},
        {"limit_enabled", summary.limit_enabled},
        {"pass", summary.overall_pass},
        {"trials", summary.trial_count},
        {"gave_up", summary.gave_up_count}
    };

    nlohmann::json trials = nlohmann::json::array();
    for(const auto &record : outcome.trials)
    {
        trials.push_back(trial_to_json(record));
    }
    payload["trials"] = std::move(trials);
    return payload;
}

bool write_json_to_file(const nlohmann::json &payload, const std::filesystem::path &path, std::string &error)
{
    std::ofstream ofs(path);
    if(!ofs)
    {
        error = "Failed to open JSON output path";
        return false;
    }
    ofs << payload.dump(2);
    if(!ofs)
    {
        error = "Failed to write JSON payload";
        return false;
    }
    return true;
}

} // namespace ble::dtm
