#include "number_format.hpp"

#include <cmath>
#include <sstream>

namespace ble::dtm
{

std::string format_number(double value)
{
    if(std::isfinite(value) && std::fabs(value) < 1e15 && value == std::floor(value))
    {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream oss;
    oss.precision(10);
    oss << value;
    return oss.str();
}

} // namespace ble::dtm
