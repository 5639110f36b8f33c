#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace ble::dtm
{
// Shortest decimal text: 30, 12.5, 99.98.
std::string format_number(double value);

// [20, 30.5, 90]
template<typename T>
std::string format_list(const std::vector<T> &values)
{
    std::ostringstream oss;
    oss << '[';
    for(std::size_t i = 0; i < values.size(); ++i)
    {
        if(i != 0)
        {
            oss << ", ";
        }
        oss << format_number(static_cast<double>(values[i]));
    }
    oss << ']';
    return oss.str();
}

} // namespace ble::dtm
