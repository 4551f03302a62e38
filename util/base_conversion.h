#ifndef TOYRSA_UTIL_BASE_CONVERSION_H_INCLUDED
#define TOYRSA_UTIL_BASE_CONVERSION_H_INCLUDED

#include <cstdint>
#include <limits>
#include <string>

namespace toyrsa { namespace util {

// Parses a non-empty string of decimal digits (no sign, no whitespace) not
// exceeding max_value. Throws std::invalid_argument otherwise.
uint64_t base10_decode(const std::string& s, uint64_t max_value);

template<typename IntType>
IntType base10_decode(const std::string& s)
{
    return static_cast<IntType>(base10_decode(s, std::numeric_limits<IntType>::max()));
}

} } // namespace toyrsa::util

#endif
