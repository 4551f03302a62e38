#ifndef TOYRSA_INT_UTIL_INT_H_INCLUDED
#define TOYRSA_INT_UTIL_INT_H_INCLUDED

#include <boost/multiprecision/cpp_int.hpp>

namespace toyrsa {

// Used where the width isn't known up front (random sampling, primality testing)
using large_uint = boost::multiprecision::cpp_int;

// Double width accumulators for 64-bit modular arithmetic. The checked backend
// throws std::overflow_error instead of wrapping.
using wide_uint = boost::multiprecision::checked_uint128_t;
using wide_int  = boost::multiprecision::checked_int128_t;

} // namespace toyrsa

#endif
