#include "base_conversion.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace toyrsa { namespace util {

uint64_t base10_decode(const std::string& s, uint64_t max_value)
{
    // operator>> skips whitespace and wraps "-1" into an unsigned value, only let digits through
    const bool digits_only = !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });

    std::istringstream iss(s);
    unsigned long long value = 0;
    if (!digits_only || !(iss >> value) || !iss.eof() || value > max_value) {
        throw std::invalid_argument("Invalid decimal number '" + s + "'");
    }
    return value;
}

} } // namespace toyrsa::util
