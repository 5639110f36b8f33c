#pragma once

#include "sweep_plan.hpp"

#include <ostream>
#include <string>

namespace ble::dtm
{
struct CLIOptions;

inline constexpr const char *kCsvColumns = "packetLen,numPkt,phy,atten,txPower,channel,perMaster,perSlave";

// One line of the results file.
struct TrialRecord
{
    SweepTuple tuple;
    double attenuation_db = 0.0;
    double per_master = 0.0;
    double per_slave = 0.0;
    int attempts = 0;
    bool gave_up = false;
};

class ResultSink
{
public:
    virtual ~ResultSink() = default;

    virtual void write_row(const TrialRecord &record) = 0;
    // Called once after the last trial.
    virtual void finish() = 0;
};

/**
 * Appends one comma separated line per trial. The attenuation column carries
 * a leading minus sign (path loss), and `finish()` terminates the run with a
 * blank line.
 */
class CsvResultSink : public ResultSink
{
public:
    explicit CsvResultSink(std::ostream &stream);

    void write_row(const TrialRecord &record) override;
    void finish() override;

private:
    std::ostream &m_stream;
};

std::string format_csv_row(const TrialRecord &record);

// "# key : value" lines describing the run, followed by the column names.
void write_parameter_header(std::ostream &stream, const CLIOptions &options, const SweepPlan &plan);

} // namespace ble::dtm
