#include "ble_dtm/dut_session.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <unistd.h>

namespace ble::dtm
{
namespace
{

// Pseudo-terminal pair standing in for a device: the session opens the
// slave side by path, the test plays the controller on the master side.
class FakeUart
{
public:
    FakeUart()
    {
        char name[128] = {0};
        if(openpty(&m_master, &m_slave, name, nullptr, nullptr) == 0)
        {
            m_path = name;
        }
    }

    ~FakeUart()
    {
        if(m_master != -1)
        {
            ::close(m_master);
        }
        if(m_slave != -1)
        {
            ::close(m_slave);
        }
    }

    FakeUart(const FakeUart &) = delete;
    FakeUart &operator=(const FakeUart &) = delete;

    [[nodiscard]] bool valid() const
    {
        return !m_path.empty();
    }

    [[nodiscard]] const std::string &path() const
    {
        return m_path;
    }

    void send(const std::vector<std::uint8_t> &bytes)
    {
        ASSERT_EQ(::write(m_master, bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
    }

    void send(const std::string &text)
    {
        send(std::vector<std::uint8_t>(text.begin(), text.end()));
    }

    // Everything the session wrote so far.
    std::vector<std::uint8_t> received()
    {
        std::vector<std::uint8_t> bytes;
        pollfd descriptor{m_master, POLLIN, 0};
        while(::poll(&descriptor, 1, 50) > 0 && (descriptor.revents & POLLIN))
        {
            std::uint8_t buffer[256];
            const ssize_t count = ::read(m_master, buffer, sizeof(buffer));
            if(count <= 0)
            {
                break;
            }
            bytes.insert(bytes.end(), buffer, buffer + count);
        }
        return bytes;
    }

private:
    int m_master = -1;
    int m_slave = -1;
    std::string m_path;
};

const std::vector<std::uint8_t> kTestEnd5000 = {0x04, 0x0E, 0x06, 0x01, 0x1F, 0x20, 0x00, 0x88, 0x13};

class HciUartSessionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(device.valid());
        settings.name = "master";
        settings.serial_port = device.path();
        settings.response_timeout = std::chrono::milliseconds(200);
    }

    void open_session()
    {
        ASSERT_TRUE(session.open(settings)) << session.last_error_message();
    }

    FakeUart device;
    HciUartSettings settings;
    HciUartSession session;
};

TEST_F(HciUartSessionTest, CommandsAreWrittenAsH4Packets)
{
    open_session();
    device.send(std::vector<std::uint8_t>{0x04, 0x0E, 0x04, 0x01, 0x03, 0x0C, 0x00});

    session.reset(ResetRequest{});

    EXPECT_EQ(device.received(), (std::vector<std::uint8_t>{0x01, 0x03, 0x0C, 0x00}));
}

TEST_F(HciUartSessionTest, EndTestReportsReceivedPackets)
{
    open_session();
    device.send(kTestEnd5000);

    const auto count = session.end_test(EndTestRequest{});

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 5000);
    EXPECT_EQ(device.received(), (std::vector<std::uint8_t>{0x01, 0x1F, 0x20, 0x00}));
}

TEST_F(HciUartSessionTest, EndTestSkipsStrayBytesAndUnrelatedEvents)
{
    open_session();
    device.send(std::vector<std::uint8_t>{0xAA, 0x00});
    // Completion of another command, then an LE meta event.
    device.send(std::vector<std::uint8_t>{0x04, 0x0E, 0x04, 0x01, 0x03, 0x0C, 0x00});
    device.send(std::vector<std::uint8_t>{0x04, 0x3E, 0x02, 0x01, 0x00});
    device.send(kTestEnd5000);

    const auto count = session.end_test(EndTestRequest{});

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 5000);
}

TEST_F(HciUartSessionTest, EndTestWithoutReplyHasNoCount)
{
    settings.response_timeout = std::chrono::milliseconds(50);
    open_session();

    EXPECT_FALSE(session.end_test(EndTestRequest{}).has_value());
}

TEST_F(HciUartSessionTest, EndTestWithErrorStatusHasNoCount)
{
    open_session();
    device.send(std::vector<std::uint8_t>{0x04, 0x0E, 0x06, 0x01, 0x1F, 0x20, 0x0C, 0x88, 0x13});

    EXPECT_FALSE(session.end_test(EndTestRequest{}).has_value());
}

TEST_F(HciUartSessionTest, TruncatedTestEndHasNoCount)
{
    settings.response_timeout = std::chrono::milliseconds(50);
    open_session();
    // Header announces six parameter bytes, only three arrive.
    device.send(std::vector<std::uint8_t>{0x04, 0x0E, 0x06, 0x01, 0x1F, 0x20});

    EXPECT_FALSE(session.end_test(EndTestRequest{}).has_value());
}

TEST_F(HciUartSessionTest, MissingReplyToConfigurationIsNotFatal)
{
    settings.response_timeout = std::chrono::milliseconds(50);
    open_session();

    EXPECT_NO_THROW(session.set_phy(SetPhyRequest{2}));
    EXPECT_EQ(device.received(), (std::vector<std::uint8_t>{0x01, 0x31, 0x20, 0x03, 0x00, 0x02, 0x02}));
}

TEST_F(HciUartSessionTest, TraceLinesAreForwardedToTheLog)
{
    FakeUart trace;
    ASSERT_TRUE(trace.valid());
    settings.trace_port = trace.path();
    open_session();

    trace.send("adv stopped\r\nrx test on ch 19\npartial");
    // The trace port is read without waiting.
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    device.send(std::vector<std::uint8_t>{0x04, 0x0E, 0x04, 0x01, 0x03, 0x0C, 0x00});

    ::testing::internal::CaptureStdout();
    session.reset(ResetRequest{});
    const std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("[master trace] adv stopped\n"), std::string::npos);
    EXPECT_NE(output.find("[master trace] rx test on ch 19\n"), std::string::npos);
    EXPECT_EQ(output.find("partial"), std::string::npos);
}

TEST_F(HciUartSessionTest, OpenFailsForMissingPort)
{
    settings.serial_port = "/dev/ble-dtm-no-such-port";

    EXPECT_FALSE(session.open(settings));
    EXPECT_NE(session.last_error_message().find("/dev/ble-dtm-no-such-port"), std::string::npos);
}

} // namespace
} // namespace ble::dtm
