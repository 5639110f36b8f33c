#include "ble_dtm/dut_session.hpp"

#include "log.hpp"
#include "serial_port.hpp"

#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace ble::dtm
{
namespace
{
constexpr std::size_t kTraceReadChunk = 256;

std::string opcode_text(std::uint16_t opcode)
{
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(4) << opcode;
    return oss.str();
}

} // namespace

struct HciUartSession::Impl
{
    HciUartSettings settings;
    SerialPort command_port;
    SerialPort trace_port;
    std::string trace_pending;
    std::string last_error;

    bool open(const HciUartSettings &requested)
    {
        last_error.clear();
        close();
        settings = requested;

        if(!command_port.open(settings.serial_port, settings.baud_rate, last_error))
        {
            return false;
        }
        log_line("Opened " + settings.name + " port " + settings.serial_port);

        if(!settings.trace_port.empty())
        {
            if(!trace_port.open(settings.trace_port, settings.baud_rate, last_error))
            {
                command_port.close();
                return false;
            }
            log_line("Opened " + settings.name + " trace port " + settings.trace_port);
        }
        return true;
    }

    void close()
    {
        command_port.close();
        trace_port.close();
        trace_pending.clear();
    }

    // Reads one H4 event, skipping anything that is not an event packet.
    std::optional<std::vector<std::uint8_t>> read_event(std::chrono::steady_clock::time_point deadline)
    {
        std::uint8_t type = 0;
        while(true)
        {
            if(!command_port.read_exact(&type, 1, deadline))
            {
                return std::nullopt;
            }
            if(type == kHciEventPacket)
            {
                break;
            }
            if(debug_enabled())
            {
                log_hex(settings.name + " discarded byte", {type});
            }
        }

        std::vector<std::uint8_t> packet(3);
        packet[0] = type;
        if(!command_port.read_exact(&packet[1], 2, deadline))
        {
            return std::nullopt;
        }
        const std::size_t length = packet[2];
        packet.resize(3 + length);
        if(length > 0 && !command_port.read_exact(&packet[3], length, deadline))
        {
            return std::nullopt;
        }
        return packet;
    }

    std::optional<CommandComplete> send(const std::vector<std::uint8_t> &command)
    {
        const std::uint16_t opcode = command_opcode(command);
        if(debug_enabled())
        {
            log_hex(settings.name + " command", command);
        }
        command_port.write(command);

        std::optional<CommandComplete> result;
        const auto deadline = std::chrono::steady_clock::now() + settings.response_timeout;
        while(!result)
        {
            auto event = read_event(deadline);
            if(!event)
            {
                break;
            }
            if(debug_enabled())
            {
                log_hex(settings.name + " event", *event);
            }
            auto complete = parse_command_complete(*event);
            if(complete && complete->opcode == opcode)
            {
                result = std::move(complete);
            }
        }

        drain_trace();
        return result;
    }

    void execute(const std::string &label, const std::vector<std::uint8_t> &command)
    {
        const auto complete = send(command);
        if(!complete)
        {
            log_error(settings.name + ": no response to " + label + " (" + opcode_text(command_opcode(command)) + ")");
            return;
        }
        if(complete->status != 0)
        {
            log_error(settings.name + ": " + label + " failed with status " + std::to_string(complete->status));
        }
    }

    void drain_trace()
    {
        if(!trace_port.is_open())
        {
            return;
        }
        std::array<std::uint8_t, kTraceReadChunk> chunk{};
        std::size_t count = 0;
        while((count = trace_port.read(chunk.data(), chunk.size(), std::chrono::milliseconds(0))) > 0)
        {
            trace_pending.append(reinterpret_cast<const char *>(chunk.data()), count);
        }

        std::size_t newline = trace_pending.find('\n');
        while(newline != std::string::npos)
        {
            std::string line = trace_pending.substr(0, newline);
            trace_pending.erase(0, newline + 1);
            if(!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            if(!line.empty())
            {
                log_line("[" + settings.name + " trace] " + line);
            }
            newline = trace_pending.find('\n');
        }
    }
};

HciUartSession::HciUartSession()
    : impl(std::make_unique<Impl>())
{
}

HciUartSession::~HciUartSession() = default;

bool HciUartSession::open(const HciUartSettings &settings)
{
    return impl->open(settings);
}

void HciUartSession::reset(const ResetRequest &request)
{
    impl->execute("reset", encode(request));
}

void HciUartSession::set_phy(const SetPhyRequest &request)
{
    impl->execute("set PHY", encode(request));
}

void HciUartSession::set_tx_power(const SetTxPowerRequest &request)
{
    impl->execute("set TX power", encode(request));
}

void HciUartSession::rx_test(const RxTestRequest &request)
{
    impl->execute("receiver test", encode(request));
}

void HciUartSession::tx_test(const TxTestRequest &request)
{
    impl->execute("transmitter test", encode(request));
}

std::optional<std::uint16_t> HciUartSession::end_test(const EndTestRequest &request)
{
    const auto complete = impl->send(encode(request));
    if(!complete)
    {
        log_error(impl->settings.name + ": no response to end test");
        return std::nullopt;
    }
    const auto count = received_packets(*complete);
    if(!count)
    {
        log_error(impl->settings.name + ": end test did not report a packet count (status "
                  + std::to_string(complete->status) + ")");
        return std::nullopt;
    }
    log_line(impl->settings.name + ": packets received = " + std::to_string(*count));
    return count;
}

std::string HciUartSession::name() const
{
    return impl->settings.name;
}

std::string HciUartSession::last_error_message() const
{
    return impl->last_error;
}

} // namespace ble::dtm
