#ifndef TOYRSA_INT_UTIL_INT_UTIL_H_INCLUDED
#define TOYRSA_INT_UTIL_INT_UTIL_H_INCLUDED

#include <cassert>
#include <cstdint>
#include <vector>
#include <boost/optional.hpp>
#include <boost/multiprecision/miller_rabin.hpp>
#include <util/random.h>
#include <util/test.h>

namespace toyrsa {

// (base^exponent) mod modulus by square-and-multiply.
// Throws std::invalid_argument if modulus is 0. Intermediate products are
// formed in a checked 128-bit type, so an overflow throws std::overflow_error
// rather than producing a wrong result.
uint64_t modexp(uint64_t base, uint64_t exponent, uint64_t modulus);

// Inverse of a modulo m (extended Euclid), normalized into [0, m).
// None if m is 0 or gcd(a, m) != 1.
boost::optional<uint64_t> mod_inverse(uint64_t a, uint64_t m);

template<typename IntType>
IntType gcd(IntType a, IntType b) {
    for (;;) {
        if (b == 0) return a;
        IntType temp = a % b;
        a = b;
        b = temp;
    }
}

template<typename IntType>
IntType be_uint_from_bytes(const std::vector<uint8_t>& bytes)
{
    IntType res = 0;
    for (const auto& byte : bytes ) {
        res <<= 8;
        res |= byte;
    }
    return res;
}

template<typename IntType>
size_t ilog256(IntType n)
{
    assert(n >= 0);
    size_t size = 1;
    while (n > 255) {
        ++size;
        n >>= 8;
    }
    return size;
}

// Uniformly distributed in [0, less_than)
template<typename IntType>
IntType rand_int_less(const IntType& less_than) {
    assert(less_than != 0);
    const auto byte_count   = static_cast<uint32_t>(ilog256<IntType>(less_than - 1));
    const auto leading_byte = static_cast<uint8_t>(((less_than-1) >> (8*(byte_count-1))) & 0xff);

    uint8_t lead_byte_mask = 0xFF;
    while ((lead_byte_mask>>1) > leading_byte) {
        lead_byte_mask >>= 1;
    }
    assert(lead_byte_mask);

    std::vector<uint8_t> bytes(byte_count);
    IntType res;
    int iter = 0;
    do {
        TOYRSA_CHECK_BINARY(++iter, <=, 1000, "No random number generated below the limit");
        util::get_random_bytes(&bytes[0], bytes.size());
        bytes[0] &= lead_byte_mask;
        res = be_uint_from_bytes<IntType>(bytes);
    } while (res >= less_than);
    return res;
}

// Uniformly distributed in [no_less_than, no_greater_equal_than)
template<typename IntType>
IntType rand_positive_int_in_interval(const IntType& no_less_than, const IntType& no_greater_equal_than) {
    assert(no_less_than + 1 < no_greater_equal_than && "Empty range");
    return no_less_than + rand_int_less<IntType>(no_greater_equal_than - no_less_than);
}

template<typename IntType>
IntType rand_positive_int_less(const IntType& n) {
    return rand_positive_int_in_interval<IntType>(1, n);
}

// Probabilistic (Miller-Rabin, 25 rounds)
template<typename IntType>
bool is_prime(const IntType& n) {
    return boost::multiprecision::miller_rabin_test(n, 25);
}

// Exact, only practical for n below 2^64
template<typename IntType>
bool is_prime_trial_division(const IntType& n) {
    if (n < 2) return false;
    if (n % 2 == 0) return n == 2;
    for (IntType f = 3; f <= n / f; f += 2) {
        if (n % f == 0) return false;
    }
    return true;
}

template<typename IntType>
IntType random_prime(const IntType& no_less_than, const IntType& no_greater_equal_than)
{
    constexpr int maxiter = 10000; // Primes near 2^32 have density ~ 1/22, near 2^4096 ~ 1/2800
    for (int iter = 0; iter < maxiter; ++iter) {
        auto res = rand_positive_int_in_interval(no_less_than, no_greater_equal_than);
        if (is_prime(res)) {
            return res;
        }
    }
    TOYRSA_CHECK_FAILURE("No prime generated within " + std::to_string(maxiter) + " iterations");
}

} // namespace toyrsa

#endif
