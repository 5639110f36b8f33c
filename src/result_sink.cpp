#include "result_sink.hpp"

#include "cli_options.hpp"
#include "number_format.hpp"

#include <sstream>
#include <stdexcept>

namespace ble::dtm
{

CsvResultSink::CsvResultSink(std::ostream &stream)
    : m_stream(stream)
{
}

void CsvResultSink::write_row(const TrialRecord &record)
{
    m_stream << format_csv_row(record) << '\n';
    m_stream.flush();
    if(!m_stream)
    {
        throw std::runtime_error("Failed to write result row");
    }
}

void CsvResultSink::finish()
{
    m_stream << '\n';
    m_stream.flush();
}

std::string format_csv_row(const TrialRecord &record)
{
    std::ostringstream oss;
    oss << record.tuple.packet_length << ','
        << record.tuple.packet_count << ','
        << record.tuple.phy << ','
        << '-' << format_number(record.attenuation_db) << ','
        << record.tuple.tx_power_dbm << ','
        << record.tuple.channel << ','
        << format_number(record.per_master) << ','
        << format_number(record.per_slave);
    return oss.str();
}

void write_parameter_header(std::ostream &stream, const CLIOptions &options, const SweepPlan &plan)
{
    stream << "# slaveSerial   : " << options.slave_serial << '\n'
           << "# masterSerial  : " << options.master_serial << '\n'
           << "# results       : " << options.results_path << '\n'
           << "# delay         : " << options.delay_s << '\n'
           << "# packetLengths : " << format_list(plan.packet_lengths) << '\n'
           << "# numPackets    : " << format_list(plan.packet_counts) << '\n'
           << "# phys          : " << format_list(plan.phys) << '\n'
           << "# attens        : " << format_list(plan.attenuations) << '\n'
           << "# txPowers      : " << format_list(plan.tx_powers) << '\n'
           << "# Channel       : " << format_list(plan.channels) << '\n'
           << "# PER limit     : " << format_number(options.per_limit) << '\n'
           << kCsvColumns << '\n';
}

} // namespace ble::dtm
