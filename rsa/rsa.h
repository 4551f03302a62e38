#ifndef TOYRSA_RSA_RSA_H_INCLUDED
#define TOYRSA_RSA_RSA_H_INCLUDED

#include <cstdint>
#include <iosfwd>

namespace toyrsa { namespace rsa {

constexpr uint64_t public_exponent = 65537; // e, same as openssl's default

// Primes are drawn from [prime_lower_bound, prime_upper_bound)
constexpr uint64_t prime_lower_bound = UINT64_C(1) << 31;
constexpr uint64_t prime_upper_bound = UINT64_C(1) << 32;

// The private key. The public key is (modulus(), public_exponent).
struct key_pair {
    uint32_t p;
    uint32_t q;

    uint64_t modulus() const { return static_cast<uint64_t>(p) * q; }

    // lambda = (p-1)(q-1)
    uint64_t totient() const { return static_cast<uint64_t>(p - 1) * (q - 1); }
};

bool operator==(const key_pair& lhs, const key_pair& rhs);
bool operator!=(const key_pair& lhs, const key_pair& rhs);
std::ostream& operator<<(std::ostream& os, const key_pair& key);

class prime_supplier {
public:
    virtual ~prime_supplier() {}

    // Must return a prime in [prime_lower_bound, prime_upper_bound)
    virtual uint32_t next_prime() = 0;
};

// Uniformly sampled primes, randomness from /dev/urandom, Miller-Rabin tested
class random_prime_supplier : public prime_supplier {
public:
    uint32_t next_prime() override;
};

class key_generator {
public:
    static constexpr unsigned default_max_attempts = 10000;

    // max_attempts == 0 retries forever
    explicit key_generator(prime_supplier& primes, unsigned max_attempts = default_max_attempts);

    void set_log(std::ostream& log) { log_ = &log; }

    // Draws prime pairs until e is invertible modulo the totient and e < totient.
    // Throws std::runtime_error if max_attempts pairs were rejected.
    key_pair generate();

    // Number of pairs drawn by the last successful generate()
    unsigned last_attempt_count() const { return last_attempt_count_; }

private:
    prime_supplier& primes_;
    unsigned        max_attempts_;
    std::ostream*   log_;
    unsigned        last_attempt_count_;

    uint32_t draw_prime();
};

key_pair genkey();
key_pair genkey(prime_supplier& primes);

// d such that e*d = 1 (mod lambda). Throws std::runtime_error if the key pair
// has no private exponent (never the case for generated keys).
uint64_t private_exponent(const key_pair& key);

// message^e mod modulus. message < modulus is the caller's responsibility.
uint64_t encrypt(uint64_t modulus, uint32_t message);

// ciphertext^d mod pq. Throws std::runtime_error if the key pair is invalid or
// the result doesn't fit in 32 bits.
uint32_t decrypt(const key_pair& key, uint64_t ciphertext);

} } // namespace toyrsa::rsa

#endif
