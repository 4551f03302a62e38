#include "int_util.h"
#include "int.h"
#include <stdexcept>

namespace toyrsa {

uint64_t modexp(uint64_t base, uint64_t exponent, uint64_t modulus)
{
    TOYRSA_CHECK_BINARY_THROWS(modulus, !=, 0, "modexp: modulus can't be zero", std::invalid_argument);

    const wide_uint m(modulus);
    // Every product below is at most (m-1)^2
    wide_uint result = wide_uint{1} % m;
    wide_uint x = base % m;

    while (exponent) {
        if (exponent & 1) {
            result = (result * x) % m;
        }
        exponent >>= 1;
        x = (x * x) % m;
    }

    assert(result < m);
    return result.convert_to<uint64_t>();
}

boost::optional<uint64_t> mod_inverse(uint64_t a, uint64_t m)
{
    if (m == 0) {
        return boost::none;
    }

    // Only the coefficient of a is tracked. The coefficients alternate in sign,
    // hence the signed type.
    wide_int r(m), newr(a);
    wide_int t = 0, newt = 1;
    while (newr != 0) {
        const wide_int quotient = r / newr;
        wide_int saved = newt;
        newt = t - quotient * saved;
        t = saved;
        saved = newr;
        newr = r - quotient * saved;
        r = saved;
    }

    if (r > 1) {
        return boost::none; // gcd(a, m) != 1
    }

    // |t| < m, so a single correction is enough
    if (t < 0) {
        t += m;
    }
    assert(t >= 0 && t < m);
    return t.convert_to<uint64_t>();
}

} // namespace toyrsa
