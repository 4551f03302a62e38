#include <iostream>
#include <stdexcept>
#include <cstdlib>
#include <string>
#include <rsa/rsa.h>
#include <int_util/int_util.h>
#include <util/base_conversion.h>
#include <util/ostream_adapter.h>
#include <util/test.h>

using namespace toyrsa;

namespace {

// Set by -v
std::ostream* verbose_log = nullptr;

template<typename IntType>
IntType parse_number(const std::string& arg, const char* what)
{
    try {
        return util::base10_decode<IntType>(arg);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument(std::string("Invalid ") + what + " '" + arg + "'");
    }
}

rsa::key_pair generate_key()
{
    rsa::random_prime_supplier primes;
    rsa::key_generator generator{primes};
    if (verbose_log) {
        generator.set_log(*verbose_log);
    }
    return generator.generate();
}

void print_key(const rsa::key_pair& key)
{
    std::cout << "p: " << key.p << "\n";
    std::cout << "q: " << key.q << "\n";
    std::cout << "n: " << key.modulus() << "\n";
    std::cout << "e: " << rsa::public_exponent << "\n";
    std::cout << "d: " << rsa::private_exponent(key) << "\n";
}

void demo(uint32_t message)
{
    const auto key = generate_key();
    if (verbose_log) {
        (*verbose_log) << "p: " << key.p << ", q: " << key.q << std::endl;
        (*verbose_log) << "n: " << key.modulus() << ", totient: " << key.totient() << std::endl;
        (*verbose_log) << "e: " << rsa::public_exponent << ", d: " << rsa::private_exponent(key) << std::endl;
    }

    const auto encrypted = rsa::encrypt(key.modulus(), message);
    const auto decrypted = rsa::decrypt(key, encrypted);

    std::cout << "Original: " << message << "\n";
    std::cout << "Encrypted: " << encrypted << "\n";
    std::cout << "Decrypted: " << decrypted << "\n";
    TOYRSA_CHECK_BINARY(message, ==, decrypted, "Round trip failed");
}

} // unnamed namespace

int main(int argc, char** argv)
{
    auto usage = [program_name = argv[0]] {
        std::cout << "Usage: " << program_name << " [-v] <command> [<args>]\n";
        std::cout << "Commands:\n";
        std::cout << "   genkey                        Generate a key pair\n";
        std::cout << "   encrypt <n> <message>         Encrypt 32-bit message with public modulus n\n";
        std::cout << "   decrypt <p> <q> <ciphertext>  Decrypt ciphertext with private key (p, q)\n";
        std::cout << "   modexp <x> <y> <m>            Calculate x^y mod m\n";
        std::cout << "   mod-inverse <a> <m>           Calculate a^-1 mod m\n";
        std::cout << "   check-prime <n>               Test n for primality\n";
        std::cout << "   demo [message]                Round trip message (default 42) through a fresh key\n";
        exit(1);
    };

    auto consume_argv = [&argc, &argv, &usage] {
        if (argc < 1) {
            usage();
        }
        const char* const arg = argv[0];
        argv++;
        argc--;
        return arg;
    };

    consume_argv();
    std::string command = consume_argv();

    util::ostream_adapter log{util::prefixed_output(std::cerr, "toyrsa")};
    if (command == "-v") {
        verbose_log = &log;
        command = consume_argv();
    }

    try {
        if (command == "genkey") {
            print_key(generate_key());
        } else if (command == "encrypt") {
            const auto n       = parse_number<uint64_t>(consume_argv(), "modulus");
            const auto message = parse_number<uint32_t>(consume_argv(), "message");
            std::cout << rsa::encrypt(n, message) << "\n";
        } else if (command == "decrypt") {
            const auto p          = parse_number<uint32_t>(consume_argv(), "prime");
            const auto q          = parse_number<uint32_t>(consume_argv(), "prime");
            const auto ciphertext = parse_number<uint64_t>(consume_argv(), "ciphertext");
            std::cout << rsa::decrypt(rsa::key_pair{p, q}, ciphertext) << "\n";
        } else if (command == "modexp") {
            const auto x = parse_number<uint64_t>(consume_argv(), "base");
            const auto y = parse_number<uint64_t>(consume_argv(), "exponent");
            const auto m = parse_number<uint64_t>(consume_argv(), "modulus");
            std::cout << modexp(x, y, m) << "\n";
        } else if (command == "mod-inverse") {
            const auto a = parse_number<uint64_t>(consume_argv(), "number");
            const auto m = parse_number<uint64_t>(consume_argv(), "modulus");
            if (const auto inverse = mod_inverse(a, m)) {
                std::cout << *inverse << "\n";
            } else {
                std::cout << "none\n";
            }
        } else if (command == "check-prime") {
            const auto n = parse_number<uint64_t>(consume_argv(), "number");
            std::cout << n << (is_prime_trial_division(n) ? " is prime" : " is not prime") << "\n";
        } else if (command == "demo") {
            uint32_t message = 42;
            if (argc >= 1) {
                message = parse_number<uint32_t>(consume_argv(), "message");
            }
            demo(message);
        } else {
            std::cout << "Unknown command '" << command << "'\n";
            usage();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
