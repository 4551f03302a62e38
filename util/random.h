#ifndef TOYRSA_UTIL_RANDOM_H_INCLUDED
#define TOYRSA_UTIL_RANDOM_H_INCLUDED

#include <cstddef>
#include <type_traits>

namespace toyrsa { namespace util {

// Fill dest with count bytes from the system entropy source (/dev/urandom).
// Throws std::runtime_error if the source can't be read.
void get_random_bytes(void* dest, size_t count);

template<typename T>
T get_random()
{
    static_assert(std::is_integral<T>::value, "get_random needs an integral type");
    T value;
    get_random_bytes(&value, sizeof(value));
    return value;
}

} } // namespace toyrsa::util

#endif
