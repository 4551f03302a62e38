#include "random.h"
#include <fstream>
#include <stdexcept>

namespace toyrsa { namespace util {

void get_random_bytes(void* dest, size_t count) {
    if (!count) {
        return;
    }
    std::ifstream urandom("/dev/urandom", std::ifstream::binary);
    if (!urandom || !urandom.is_open()) {
        throw std::runtime_error("Could not open /dev/urandom");
    }
    if (!urandom.read(static_cast<char*>(dest), static_cast<std::streamsize>(count))) {
        throw std::runtime_error("Could not read from /dev/urandom");
    }
}

} } // namespace toyrsa::util
