#include "cli_options.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <vector>

namespace ble::dtm
{
namespace
{
using ::testing::ElementsAre;

class Arguments
{
public:
    Arguments(std::initializer_list<std::string> args)
        : m_storage{"ble-dtm-sweep"}
    {
        m_storage.insert(m_storage.end(), args.begin(), args.end());
        for(auto &arg : m_storage)
        {
            m_pointers.push_back(arg.data());
        }
    }

    int argc() const
    {
        return static_cast<int>(m_pointers.size());
    }

    char **argv()
    {
        return m_pointers.data();
    }

private:
    std::vector<std::string> m_storage;
    std::vector<char *> m_pointers;
};

bool parse(Arguments &args, CLIOptions &options, std::string &error)
{
    return parse_cli_options(args.argc(), args.argv(), options, error);
}

TEST(CliOptions, PositionalsAndDefaults)
{
    Arguments args{"/dev/ttyUSB0", "/dev/ttyUSB1", "results.csv"};
    CLIOptions options;
    std::string error;
    ASSERT_TRUE(parse(args, options, error)) << error;

    EXPECT_EQ(options.slave_serial, "/dev/ttyUSB0");
    EXPECT_EQ(options.master_serial, "/dev/ttyUSB1");
    EXPECT_EQ(options.results_path, "results.csv");
    EXPECT_EQ(options.delay_s, 5);
    EXPECT_DOUBLE_EQ(options.per_limit, 0.0);
    EXPECT_THAT(options.phys, ElementsAre(1));
    EXPECT_THAT(options.channels, ElementsAre(0));
    EXPECT_THAT(options.tx_powers, ElementsAre(0));
    EXPECT_THAT(options.packet_lengths, ElementsAre(250));
    EXPECT_THAT(options.packet_counts, ElementsAre(5000));
    EXPECT_FALSE(options.attenuations.has_value());
    EXPECT_EQ(options.step_db, 10);
    EXPECT_FALSE(options.use_attenuator);
    EXPECT_EQ(options.baud_rate, 115200);
}

TEST(CliOptions, ShortAndLongOptions)
{
    Arguments args{"-d", "2", "--limit", "1.5", "-p", "1,2", "--channel", "0,19,39", "-t", "-10,0",
                   "-a", "20,90", "-e", "37", "--numpkt", "1000", "--mtp", "/dev/ttyUSB2", "--stp",
                   "/dev/ttyUSB3", "--attenuator-serial", "11904250012", "--header", "--json-out",
                   "out.json", "--progress-ndjson", "s", "m", "r.csv"};
    CLIOptions options;
    std::string error;
    ASSERT_TRUE(parse(args, options, error)) << error;

    EXPECT_EQ(options.delay_s, 2);
    EXPECT_DOUBLE_EQ(options.per_limit, 1.5);
    EXPECT_THAT(options.phys, ElementsAre(1, 2));
    EXPECT_THAT(options.channels, ElementsAre(0, 19, 39));
    EXPECT_THAT(options.tx_powers, ElementsAre(-10, 0));
    ASSERT_TRUE(options.attenuations.has_value());
    EXPECT_THAT(*options.attenuations, ElementsAre(20.0, 90.0));
    EXPECT_THAT(options.packet_lengths, ElementsAre(37));
    EXPECT_THAT(options.packet_counts, ElementsAre(1000));
    EXPECT_EQ(options.master_trace_port, "/dev/ttyUSB2");
    EXPECT_EQ(options.slave_trace_port, "/dev/ttyUSB3");
    EXPECT_TRUE(options.use_attenuator);
    EXPECT_EQ(options.attenuator_serial.value_or(""), "11904250012");
    EXPECT_TRUE(options.write_header);
    EXPECT_EQ(options.json_out_path.value_or(""), "out.json");
    EXPECT_TRUE(options.progress_ndjson);
    EXPECT_EQ(options.results_path, "r.csv");
}

TEST(CliOptions, MissingPositionalsFail)
{
    Arguments args{"/dev/ttyUSB0", "/dev/ttyUSB1"};
    CLIOptions options;
    std::string error;
    EXPECT_FALSE(parse(args, options, error));
    EXPECT_FALSE(error.empty());
}

TEST(CliOptions, MalformedListFailsAtParseTime)
{
    Arguments args{"-p", "1,two", "a", "b", "c"};
    CLIOptions options;
    std::string error;
    EXPECT_FALSE(parse(args, options, error));
    EXPECT_EQ(error, "Invalid value 'two' in --phys");
}

TEST(CliOptions, MalformedScalarsFail)
{
    CLIOptions options;
    std::string error;

    Arguments delay{"-d", "soon", "a", "b", "c"};
    EXPECT_FALSE(parse(delay, options, error));
    EXPECT_EQ(error, "Invalid value for --delay");

    Arguments limit{"-l", "1%", "a", "b", "c"};
    EXPECT_FALSE(parse(limit, options, error));
    EXPECT_EQ(error, "Invalid value for --limit");

    Arguments step{"-s", "-5", "a", "b", "c"};
    EXPECT_FALSE(parse(step, options, error));
    EXPECT_EQ(error, "Invalid value for --step");
}

TEST(CliOptions, ZeroPacketCountIsRejected)
{
    Arguments args{"-n", "5000,0", "a", "b", "c"};
    CLIOptions options;
    std::string error;
    EXPECT_FALSE(parse(args, options, error));
    EXPECT_EQ(error, "--numpkt values must be between 1 and 65535");
}

TEST(CliOptions, PacketCountMustFitTestEndCounter)
{
    CLIOptions options;
    std::string error;

    Arguments too_many{"-n", "70000", "a", "b", "c"};
    EXPECT_FALSE(parse(too_many, options, error));
    EXPECT_EQ(error, "--numpkt values must be between 1 and 65535");

    Arguments largest{"-n", "65535", "a", "b", "c"};
    ASSERT_TRUE(parse(largest, options, error)) << error;
    EXPECT_THAT(options.packet_counts, ElementsAre(65535));
}

TEST(CliOptions, EmptyTracePortIsReported)
{
    CLIOptions options;
    std::string error;

    Arguments master{"--mtp", "", "a", "b", "c"};
    EXPECT_FALSE(parse(master, options, error));
    EXPECT_EQ(error, "Invalid value for --mtp");

    Arguments slave{"--stp", "", "a", "b", "c"};
    EXPECT_FALSE(parse(slave, options, error));
    EXPECT_EQ(error, "Invalid value for --stp");
}

TEST(CliOptions, UnknownOptionFails)
{
    Arguments args{"--verbose", "a", "b", "c"};
    CLIOptions options;
    std::string error;
    EXPECT_FALSE(parse(args, options, error));
    EXPECT_EQ(error, "Unknown argument: --verbose");
}

TEST(CliOptions, MissingValueFails)
{
    Arguments args{"a", "b", "c", "--delay"};
    CLIOptions options;
    std::string error;
    EXPECT_FALSE(parse(args, options, error));
    EXPECT_EQ(error, "Invalid value for --delay");
}

TEST(CliOptions, HelpReturnsWithoutError)
{
    Arguments args{"--help"};
    CLIOptions options;
    std::string error = "stale";
    EXPECT_FALSE(parse(args, options, error));
    EXPECT_TRUE(error.empty());
}

} // namespace
} // namespace ble::dtm
