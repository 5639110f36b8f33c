#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ble::dtm
{
// Timestamped console narration, optionally mirrored into a log file.

bool open_log_file(const std::filesystem::path &path, std::string &error_message);

void log_line(const std::string &message);
void log_error(const std::string &message);

// True when BLE_DTM_DEBUG is set to 1, true or yes.
bool debug_enabled();

// 0000 < 01 03 0C 00 >
void log_hex(const std::string &label, const std::vector<std::uint8_t> &bytes);

} // namespace ble::dtm
