#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ble::dtm
{
namespace
{
std::ofstream &log_file()
{
    static std::ofstream stream;
    return stream;
}

std::string timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

void emit(std::ostream &console, const std::string &message)
{
    const std::string line = timestamp() + " " + message;
    console << line << '\n';
    console.flush();
    auto &file = log_file();
    if(file.is_open())
    {
        file << line << '\n';
        file.flush();
    }
}

} // namespace

bool open_log_file(const std::filesystem::path &path, std::string &error_message)
{
    auto &file = log_file();
    if(file.is_open())
    {
        file.close();
    }
    file.open(path, std::ios::out | std::ios::app);
    if(!file)
    {
        error_message = "Failed to open log file " + path.string();
        return false;
    }
    return true;
}

void log_line(const std::string &message)
{
    emit(std::cout, message);
}

void log_error(const std::string &message)
{
    emit(std::cerr, message);
}

bool debug_enabled()
{
    static const bool enabled = [] {
        const char *raw = std::getenv("BLE_DTM_DEBUG");
        if(!raw)
        {
            return false;
        }
        std::string value(raw);
        value.erase(std::remove_if(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); }),
                    value.end());
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
        return value == "1" || value == "true" || value == "yes";
    }();
    return enabled;
}

void log_hex(const std::string &label, const std::vector<std::uint8_t> &bytes)
{
    std::ostringstream oss;
    oss << label << " (" << bytes.size() << " bytes)";
    oss << std::hex << std::uppercase << std::setfill('0');
    for(std::size_t i = 0; i < bytes.size(); ++i)
    {
        if(i % 16 == 0)
        {
            if(i != 0)
            {
                oss << " >";
            }
            oss << "\n    " << std::setw(4) << i << " <";
        }
        oss << ' ' << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    if(!bytes.empty())
    {
        oss << " >";
    }
    log_line(oss.str());
}

} // namespace ble::dtm
