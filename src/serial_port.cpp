#include "serial_port.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace ble::dtm
{
namespace
{
bool baud_to_speed(int baud_rate, speed_t &speed)
{
    switch(baud_rate)
    {
    case 9600:
        speed = B9600;
        return true;
    case 19200:
        speed = B19200;
        return true;
    case 38400:
        speed = B38400;
        return true;
    case 57600:
        speed = B57600;
        return true;
    case 115200:
        speed = B115200;
        return true;
    case 230400:
        speed = B230400;
        return true;
    case 460800:
        speed = B460800;
        return true;
    case 921600:
        speed = B921600;
        return true;
    case 1000000:
        speed = B1000000;
        return true;
    case 3000000:
        speed = B3000000;
        return true;
    default:
        return false;
    }
}

std::string errno_text()
{
    return std::string(std::strerror(errno)) + " (" + std::to_string(errno) + ")";
}

} // namespace

SerialPort::~SerialPort()
{
    if(m_handle != -1)
    {
        close();
    }
}

bool SerialPort::open(const std::string &path, int baud_rate, std::string &error_message)
{
    close();

    speed_t speed = B115200;
    if(!baud_to_speed(baud_rate, speed))
    {
        error_message = "Unsupported baud rate " + std::to_string(baud_rate);
        return false;
    }

    const int handle = ::open(path.c_str(), O_RDWR | O_NOCTTY);
    if(handle == -1)
    {
        error_message = "Port " + path + " could not be opened: " + errno_text();
        return false;
    }

    termios tio{};
    if(tcgetattr(handle, &tio) != 0)
    {
        error_message = "Failed to read settings of " + path + ": " + errno_text();
        ::close(handle);
        return false;
    }
    cfmakeraw(&tio);
    tio.c_cflag |= CLOCAL | CREAD;
    tio.c_cflag &= ~(CSTOPB | CRTSCTS | PARENB);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);
    if(tcsetattr(handle, TCSANOW, &tio) != 0)
    {
        error_message = "Failed to configure " + path + ": " + errno_text();
        ::close(handle);
        return false;
    }
    tcflush(handle, TCIOFLUSH);

    m_handle = handle;
    m_path = path;
    return true;
}

void SerialPort::close()
{
    if(m_handle != -1)
    {
        ::close(m_handle);
        m_handle = -1;
    }
}

bool SerialPort::is_open() const
{
    return m_handle != -1;
}

void SerialPort::write(const std::vector<std::uint8_t> &bytes)
{
    if(m_handle == -1)
    {
        throw std::runtime_error("Serial port not open");
    }
    std::size_t offset = 0;
    while(offset < bytes.size())
    {
        const ssize_t written = ::write(m_handle, bytes.data() + offset, bytes.size() - offset);
        if(written < 0)
        {
            if(errno == EINTR)
            {
                continue;
            }
            throw std::runtime_error("Write to " + m_path + " failed: " + errno_text());
        }
        offset += static_cast<std::size_t>(written);
    }
    tcdrain(m_handle);
}

std::size_t SerialPort::read(std::uint8_t *buffer, std::size_t length, std::chrono::milliseconds timeout)
{
    if(m_handle == -1)
    {
        throw std::runtime_error("Serial port not open");
    }

    pollfd descriptor{};
    descriptor.fd = m_handle;
    descriptor.events = POLLIN;
    const int ready = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
    if(ready < 0)
    {
        if(errno == EINTR)
        {
            return 0;
        }
        throw std::runtime_error("Poll on " + m_path + " failed: " + errno_text());
    }
    if(ready == 0)
    {
        return 0;
    }
    if(descriptor.revents & (POLLERR | POLLHUP | POLLNVAL))
    {
        throw std::runtime_error("Serial port " + m_path + " disconnected");
    }

    const ssize_t count = ::read(m_handle, buffer, length);
    if(count < 0)
    {
        if(errno == EINTR || errno == EAGAIN)
        {
            return 0;
        }
        throw std::runtime_error("Read from " + m_path + " failed: " + errno_text());
    }
    return static_cast<std::size_t>(count);
}

bool SerialPort::read_exact(std::uint8_t *buffer, std::size_t length, std::chrono::steady_clock::time_point deadline)
{
    std::size_t received = 0;
    while(received < length)
    {
        const auto now = std::chrono::steady_clock::now();
        if(now >= deadline)
        {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        received += read(buffer + received, length - received, std::max(remaining, std::chrono::milliseconds(1)));
    }
    return true;
}

} // namespace ble::dtm
