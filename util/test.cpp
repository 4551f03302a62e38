#include "test.h"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <stdexcept>

namespace toyrsa { namespace test {

std::string failure_message(const char* what, const char* func, const char* file, int line, const std::string& message)
{
    std::ostringstream oss;
    oss << what << " in " << func << " " << file << " line " << line << std::endl;
    oss << message;
    return oss.str();
}

void assert_failed(const char* func, const char* file, int line, const std::string& message)
{
    std::cerr << failure_message("Assertion failed", func, file, line, message) << std::endl;
    std::abort();
}

void check_failed(const char* func, const char* file, int line, const std::string& message)
{
    check_failed_as<std::runtime_error>(func, file, line, message);
}

} } // namespace toyrsa::test
