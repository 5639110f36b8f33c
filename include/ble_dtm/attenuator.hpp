#pragma once

#include <memory>
#include <string>

namespace ble::dtm
{

/**
 * Programmable RF step attenuator placed between the two devices.
 */
class Attenuator
{
public:
    virtual ~Attenuator() = default;

    virtual void set_attenuation(double attenuation_db) = 0;
};

/**
 * Mini-Circuits RCDAT USB attenuator, driven with SCPI commands over its HID
 * interrupt endpoints.
 */
class RcdatAttenuator : public Attenuator
{
public:
    RcdatAttenuator();
    ~RcdatAttenuator() override;

    /**
     * Open the first RCDAT on the bus, or the one whose USB serial number
     * equals `serial` when it is not empty.
     */
    bool connect(const std::string &serial);

    void set_attenuation(double attenuation_db) override;

    [[nodiscard]] std::string last_error_message() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace ble::dtm
