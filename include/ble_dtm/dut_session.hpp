#pragma once

#include "hci_commands.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ble::dtm
{

/**
 * Command level access to one device under test running DTM firmware.
 */
class DutSession
{
public:
    virtual ~DutSession() = default;

    virtual void reset(const ResetRequest &request) = 0;
    virtual void set_phy(const SetPhyRequest &request) = 0;
    virtual void set_tx_power(const SetTxPowerRequest &request) = 0;
    virtual void rx_test(const RxTestRequest &request) = 0;
    virtual void tx_test(const TxTestRequest &request) = 0;

    /**
     * End the running test.
     *
     * @return the number of packets the device received, or std::nullopt when
     *         the device did not report a count.
     */
    virtual std::optional<std::uint16_t> end_test(const EndTestRequest &request) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

struct HciUartSettings
{
    std::string name;
    std::string serial_port;
    std::string trace_port;
    int baud_rate = 115200;
    std::chrono::milliseconds response_timeout{1000};
};

/**
 * DutSession speaking H4 HCI over a serial port, with an optional trace port
 * whose output is forwarded to the log.
 */
class HciUartSession : public DutSession
{
public:
    HciUartSession();
    ~HciUartSession() override;

    bool open(const HciUartSettings &settings);

    void reset(const ResetRequest &request) override;
    void set_phy(const SetPhyRequest &request) override;
    void set_tx_power(const SetTxPowerRequest &request) override;
    void rx_test(const RxTestRequest &request) override;
    void tx_test(const TxTestRequest &request) override;
    std::optional<std::uint16_t> end_test(const EndTestRequest &request) override;

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] std::string last_error_message() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace ble::dtm
