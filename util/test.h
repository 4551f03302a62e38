#ifndef TOYRSA_UTIL_TEST_H_INCLUDED
#define TOYRSA_UTIL_TEST_H_INCLUDED

#include <sstream>
#include <string>
#include <cstdlib>

namespace toyrsa { namespace test {

std::string failure_message(const char* what, const char* func, const char* file, int line, const std::string& message);

void check_failed(const char* func, const char* file, int line, const std::string& message);
void assert_failed(const char* func, const char* file, int line, const std::string& message);

// Like check_failed, but lets the caller pick the exception type (e.g. std::invalid_argument for contract violations)
template<typename exception_type>
void check_failed_as(const char* func, const char* file, int line, const std::string& message)
{
    throw exception_type(failure_message("Check failed", func, file, line, message));
}

} } // namespace toyrsa::test

#define TOYRSA_CHECK_FAILURE(msg) do {                                  \
    toyrsa::test::check_failed(__PRETTY_FUNCTION__, __FILE__,           \
                    __LINE__, msg);                                     \
    std::abort();                                                       \
    } while (0)

#define TOYRSA_ASSERT_THROWS_MESSAGE(expr, exception_type, message)     \
    do {                                                                \
        try {                                                           \
            expr;                                                       \
            std::ostringstream _toyrsa_oss;                             \
            _toyrsa_oss << "Expected " << #expr                         \
                << " to throw exception of type "                       \
                << #exception_type                                      \
                << "\n" << message;                                     \
            toyrsa::test::assert_failed(__PRETTY_FUNCTION__, __FILE__,  \
                    __LINE__, _toyrsa_oss.str());                       \
        } catch (const exception_type &) {}                             \
    } while(0)

#define TOYRSA_ASSERT_THROWS(expr, exception_type) \
    TOYRSA_ASSERT_THROWS_MESSAGE(expr, exception_type, "")

#define TOYRSA_CHECK_BINARY_(expected, bin_op, actual, message, fail)   \
    do {                                                                \
        const auto _a_val = (expected);                                 \
        const auto _b_val = (actual);                                   \
        if (!(_a_val bin_op _b_val)) {                                  \
            std::ostringstream _toyrsa_oss;                             \
            _toyrsa_oss << "Expected:\n" << #expected << " "            \
                << #bin_op << " " << #actual << "\n"                    \
                << "Failure:\n"                                         \
                << "\"" << _a_val << "\"\n" << #bin_op << "\n\""        \
                << _b_val << "\"\n" << message;                         \
            fail(__PRETTY_FUNCTION__, __FILE__, __LINE__,               \
                    _toyrsa_oss.str());                                 \
        }                                                               \
    } while (0)

#define TOYRSA_ASSERT_BINARY_MESSAGE(expected, bin_op, actual, message) \
    TOYRSA_CHECK_BINARY_(expected, bin_op, actual, message, toyrsa::test::assert_failed)

#define TOYRSA_ASSERT_EQUAL(expected, actual) TOYRSA_ASSERT_BINARY_MESSAGE(expected, ==, actual, "")
#define TOYRSA_ASSERT_EQUAL_MESSAGE(expected, actual, message) TOYRSA_ASSERT_BINARY_MESSAGE(expected, ==, actual, message)

#define TOYRSA_ASSERT_NOT_EQUAL(expected, actual) TOYRSA_ASSERT_BINARY_MESSAGE(expected, !=, actual, "")

#define TOYRSA_CHECK_BINARY(expected, bin_op, actual, message) \
    TOYRSA_CHECK_BINARY_(expected, bin_op, actual, message, toyrsa::test::check_failed)

#define TOYRSA_CHECK_BINARY_THROWS(expected, bin_op, actual, message, exception_type) \
    TOYRSA_CHECK_BINARY_(expected, bin_op, actual, message, toyrsa::test::check_failed_as<exception_type>)

#endif
