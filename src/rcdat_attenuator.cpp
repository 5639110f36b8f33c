#include "ble_dtm/attenuator.hpp"

#include "log.hpp"
#include "number_format.hpp"

#include <libusb-1.0/libusb.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

namespace ble::dtm
{
namespace
{
constexpr std::uint16_t kRcdatVendorId = 0x20CE;
constexpr std::uint16_t kRcdatProductId = 0x0023;

constexpr std::uint8_t kEndpointOut = 0x01;
constexpr std::uint8_t kEndpointIn = 0x81;
constexpr int kTransferTimeoutMs = 1000;
constexpr std::size_t kReportSize = 64;
// First byte of a report carrying an SCPI command or reply.
constexpr std::uint8_t kScpiReport = '*';

std::string libusb_error_to_string(int code)
{
    const char *name = libusb_error_name(code);
    if(name)
    {
        return std::string(name);
    }
    return "libusb_error_" + std::to_string(code);
}

std::string read_serial_number(libusb_device_handle *handle, std::uint8_t index)
{
    if(index == 0)
    {
        return {};
    }
    unsigned char buffer[64] = {0};
    const int length = libusb_get_string_descriptor_ascii(handle, index, buffer, sizeof(buffer));
    if(length <= 0)
    {
        return {};
    }
    return std::string(reinterpret_cast<const char *>(buffer), static_cast<std::size_t>(length));
}

// Opens the first RCDAT whose serial number matches the filter (any when empty).
libusb_device_handle *open_rcdat(libusb_device **list, ssize_t count, const std::string &serial_filter, std::string &serial)
{
    for(ssize_t index = 0; index < count; ++index)
    {
        libusb_device_descriptor descriptor{};
        if(libusb_get_device_descriptor(list[index], &descriptor) != LIBUSB_SUCCESS ||
           descriptor.idVendor != kRcdatVendorId || descriptor.idProduct != kRcdatProductId)
        {
            continue;
        }

        libusb_device_handle *handle = nullptr;
        if(libusb_open(list[index], &handle) != LIBUSB_SUCCESS)
        {
            continue;
        }
        serial = read_serial_number(handle, descriptor.iSerialNumber);
        if(serial_filter.empty() || serial_filter == serial)
        {
            return handle;
        }
        libusb_close(handle);
    }
    serial.clear();
    return nullptr;
}

} // namespace

struct RcdatAttenuator::Impl
{
    libusb_context *context = nullptr;
    libusb_device_handle *handle = nullptr;
    std::string last_error;

    ~Impl()
    {
        release();
    }

    void release()
    {
        if(handle)
        {
            libusb_release_interface(handle, 0);
            libusb_close(handle);
            handle = nullptr;
        }
        if(context)
        {
            libusb_exit(context);
            context = nullptr;
        }
    }

    bool connect(const std::string &serial_filter)
    {
        release();
        last_error.clear();

        int rc = libusb_init(&context);
        if(rc != LIBUSB_SUCCESS)
        {
            context = nullptr;
            last_error = "Failed to initialise libusb: " + libusb_error_to_string(rc);
            return false;
        }
        libusb_set_option(context, LIBUSB_OPTION_LOG_LEVEL, LIBUSB_LOG_LEVEL_NONE);

        libusb_device **list = nullptr;
        const ssize_t count = libusb_get_device_list(context, &list);
        if(count < 0)
        {
            last_error = "Failed to enumerate USB devices: " + libusb_error_to_string(static_cast<int>(count));
            return false;
        }
        std::string serial;
        handle = open_rcdat(list, count, serial_filter, serial);
        libusb_free_device_list(list, 1);

        if(!handle)
        {
            last_error = serial_filter.empty() ? "No RCDAT attenuator found"
                                               : "No RCDAT attenuator with serial '" + serial_filter + "'";
            return false;
        }

        // HID class device: usbhid has to let go of it first.
        libusb_set_auto_detach_kernel_driver(handle, 1);
        rc = libusb_claim_interface(handle, 0);
        if(rc != LIBUSB_SUCCESS)
        {
            last_error = "Failed to claim attenuator interface: " + libusb_error_to_string(rc);
            libusb_close(handle);
            handle = nullptr;
            return false;
        }

        log_line("Connected to RCDAT attenuator" + (serial.empty() ? std::string() : " " + serial));
        return true;
    }

    std::string query(const std::string &command)
    {
        if(!handle)
        {
            throw std::runtime_error("Attenuator not connected");
        }

        std::array<std::uint8_t, kReportSize> report{};
        report[0] = kScpiReport;
        std::memcpy(report.data() + 1, command.data(), std::min(command.size(), kReportSize - 1));

        int transferred = 0;
        int rc = libusb_interrupt_transfer(handle, kEndpointOut, report.data(), static_cast<int>(report.size()),
                                           &transferred, kTransferTimeoutMs);
        if(rc != LIBUSB_SUCCESS)
        {
            throw std::runtime_error("Failed to send '" + command + "' to attenuator: " + libusb_error_to_string(rc));
        }

        std::array<std::uint8_t, kReportSize> reply{};
        rc = libusb_interrupt_transfer(handle, kEndpointIn, reply.data(), static_cast<int>(reply.size()),
                                       &transferred, kTransferTimeoutMs);
        if(rc != LIBUSB_SUCCESS)
        {
            throw std::runtime_error("No reply from attenuator to '" + command + "': " + libusb_error_to_string(rc));
        }
        if(transferred < 1 || reply[0] != kScpiReport)
        {
            throw std::runtime_error("Unexpected reply from attenuator to '" + command + "'");
        }

        std::string text;
        for(int i = 1; i < transferred && reply[i] != 0; ++i)
        {
            text.push_back(static_cast<char>(reply[i]));
        }
        return text;
    }
};

RcdatAttenuator::RcdatAttenuator()
    : impl(std::make_unique<Impl>())
{
}

RcdatAttenuator::~RcdatAttenuator() = default;

bool RcdatAttenuator::connect(const std::string &serial)
{
    return impl->connect(serial);
}

void RcdatAttenuator::set_attenuation(double attenuation_db)
{
    const std::string value = format_number(attenuation_db);
    const std::string reply = impl->query(":SETATT=" + value + ";");
    if(reply.empty() || reply[0] != '1')
    {
        throw std::runtime_error("Attenuator refused setting " + value + " dB (reply '" + reply + "')");
    }
    log_line("Attenuation set to " + value + " dB");
}

std::string RcdatAttenuator::last_error_message() const
{
    return impl->last_error;
}

} // namespace ble::dtm
