#include "rsa.h"
#include <int_util/int.h>
#include <int_util/int_util.h>
#include <util/test.h>
#include <ostream>
#include <sstream>
#include <limits>

using namespace toyrsa;

namespace {

// Returns why key can't be used, nullptr if it can
const char* rejection_reason(const rsa::key_pair& key)
{
    const uint64_t lambda = key.totient();

    if (!mod_inverse(rsa::public_exponent, lambda)) {
        return "public exponent not invertible modulo the totient";
    }
    if (rsa::public_exponent >= lambda) {
        return "totient too small";
    }
    if (gcd(rsa::public_exponent, lambda) != 1) {
        return "public exponent and totient not coprime";
    }
    if (key.p == key.q) {
        return "p == q";
    }
    return nullptr;
}

} // unnamed namespace

namespace toyrsa { namespace rsa {

bool operator==(const key_pair& lhs, const key_pair& rhs)
{
    return lhs.p == rhs.p && lhs.q == rhs.q;
}

bool operator!=(const key_pair& lhs, const key_pair& rhs)
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const key_pair& key)
{
    return os << "(" << key.p << ", " << key.q << ")";
}

uint32_t random_prime_supplier::next_prime()
{
    const auto prime = random_prime<large_uint>(prime_lower_bound, prime_upper_bound);
    assert(prime >= prime_lower_bound && prime < prime_upper_bound);
    return static_cast<uint32_t>(prime);
}

constexpr unsigned key_generator::default_max_attempts;

key_generator::key_generator(prime_supplier& primes, unsigned max_attempts)
    : primes_(primes)
    , max_attempts_(max_attempts)
    , log_(nullptr)
    , last_attempt_count_(0)
{
}

uint32_t key_generator::draw_prime()
{
    const uint32_t prime = primes_.next_prime();
    TOYRSA_CHECK_BINARY(prime, >=, prime_lower_bound, "Prime supplier returned a value out of range");
    return prime;
}

key_pair key_generator::generate()
{
    for (unsigned attempt = 1; ; ++attempt) {
        if (max_attempts_) {
            TOYRSA_CHECK_BINARY(attempt, <=, max_attempts_, "Couldn't generate key pair");
        }

        const uint32_t p = draw_prime();
        const uint32_t q = draw_prime();
        const key_pair key{p, q};

        if (const char* reason = rejection_reason(key)) {
            if (log_) {
                (*log_) << "Rejecting " << key << ": " << reason << std::endl;
            }
            continue;
        }

        if (log_) {
            (*log_) << "Accepted " << key << " after " << attempt << " attempt(s)" << std::endl;
        }
        last_attempt_count_ = attempt;
        return key;
    }
}

key_pair genkey(prime_supplier& primes)
{
    return key_generator{primes}.generate();
}

key_pair genkey()
{
    random_prime_supplier primes;
    return genkey(primes);
}

uint64_t private_exponent(const key_pair& key)
{
    const auto d = mod_inverse(public_exponent, key.totient());
    if (!d) {
        std::ostringstream oss;
        oss << "Invalid key pair " << key << ": public exponent has no inverse modulo " << key.totient();
        TOYRSA_CHECK_FAILURE(oss.str());
    }
    return *d;
}

uint64_t encrypt(uint64_t modulus, uint32_t message)
{
    return modexp(message, public_exponent, modulus);
}

uint32_t decrypt(const key_pair& key, uint64_t ciphertext)
{
    const uint64_t message = modexp(ciphertext, private_exponent(key), key.modulus());
    TOYRSA_CHECK_BINARY(message, <=, std::numeric_limits<uint32_t>::max(), "Decrypted message doesn't fit in 32 bits");
    return static_cast<uint32_t>(message);
}

} } // namespace toyrsa::rsa
