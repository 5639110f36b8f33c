#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ble::dtm
{

//
// Raw 8N1 serial port. Read and write failures throw std::runtime_error.
//
class SerialPort
{
public:
    SerialPort() = default;
    ~SerialPort();

    SerialPort(const SerialPort &) = delete;
    SerialPort &operator=(const SerialPort &) = delete;

    bool open(const std::string &path, int baud_rate, std::string &error_message);
    void close();
    [[nodiscard]] bool is_open() const;

    void write(const std::vector<std::uint8_t> &bytes);

    // Reads up to `length` bytes, waiting at most `timeout` for the first one.
    // Returns 0 when nothing arrived in time.
    std::size_t read(std::uint8_t *buffer, std::size_t length, std::chrono::milliseconds timeout);

    // Reads exactly `length` bytes unless the deadline passes first.
    bool read_exact(std::uint8_t *buffer, std::size_t length, std::chrono::steady_clock::time_point deadline);

private:
    int m_handle = -1;
    std::string m_path;
};

} // namespace ble::dtm
