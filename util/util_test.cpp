#include "base_conversion.h"
#include "ostream_adapter.h"
#include "random.h"
#include "test.h"
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>
#include <set>

using namespace toyrsa;

void check_macros_test()
{
    TOYRSA_CHECK_BINARY(1, ==, 1, "Not thrown");
    TOYRSA_ASSERT_THROWS(TOYRSA_CHECK_BINARY(1, ==, 2, "Expected"), std::runtime_error);
    TOYRSA_ASSERT_THROWS(TOYRSA_CHECK_FAILURE("Expected"), std::runtime_error);
    TOYRSA_ASSERT_THROWS(TOYRSA_CHECK_BINARY_THROWS(0, !=, 0, "Expected", std::invalid_argument), std::invalid_argument);
    TOYRSA_ASSERT_THROWS(TOYRSA_CHECK_BINARY_THROWS(0, !=, 0, "Expected", std::overflow_error), std::overflow_error);

    try {
        TOYRSA_CHECK_BINARY(3, <, 2, "three isn't less than two");
        TOYRSA_CHECK_FAILURE("Not reached");
    } catch (const std::runtime_error& e) {
        const std::string what = e.what();
        TOYRSA_ASSERT_NOT_EQUAL(std::string::npos, what.find("Check failed in"));
        TOYRSA_ASSERT_NOT_EQUAL(std::string::npos, what.find("three isn't less than two"));
        TOYRSA_ASSERT_NOT_EQUAL(std::string::npos, what.find("\"3\"\n<\n\"2\""));
    }
}

void ostream_adapter_test()
{
    std::vector<std::string> lines;
    {
        util::ostream_adapter os{[&lines](const std::string& s) { lines.push_back(s); }};
        os << "first line\n" << "second ";
        os.flush();
        TOYRSA_ASSERT_EQUAL(1U, lines.size());
        TOYRSA_ASSERT_EQUAL("first line\n", lines[0]);

        os << "line" << std::endl;
        TOYRSA_ASSERT_EQUAL(2U, lines.size());
        TOYRSA_ASSERT_EQUAL("second line\n", lines[1]);

        os << "a\nb\nunterminated";
        os.flush();
        TOYRSA_ASSERT_EQUAL(4U, lines.size());
        TOYRSA_ASSERT_EQUAL("a\n", lines[2]);
        TOYRSA_ASSERT_EQUAL("b\n", lines[3]);
    }
    // The rest is delivered on destruction
    TOYRSA_ASSERT_EQUAL(5U, lines.size());
    TOYRSA_ASSERT_EQUAL("unterminated", lines[4]);

    std::ostringstream out;
    {
        util::ostream_adapter log{util::prefixed_output(out, "keygen")};
        log << "Rejecting (1, 2)" << std::endl;
        log << "Accepted (3, 5)" << std::endl;
    }
    TOYRSA_ASSERT_EQUAL("keygen: Rejecting (1, 2)\nkeygen: Accepted (3, 5)\n", out.str());

    // An output function failing on the tail must not escape the destructor
    std::ostringstream err;
    auto old_cerr = std::cerr.rdbuf(err.rdbuf());
    lines.clear();
    {
        util::ostream_adapter os{[&lines](const std::string& s) {
            if (s.back() != '\n') throw std::runtime_error("sink closed");
            lines.push_back(s);
        }};
        os << "complete\npartial";
        os.flush();
    }
    std::cerr.rdbuf(old_cerr);
    TOYRSA_ASSERT_EQUAL(1U, lines.size());
    TOYRSA_ASSERT_EQUAL("complete\n", lines[0]);
    TOYRSA_ASSERT_NOT_EQUAL(std::string::npos, err.str().find("sink closed"));
}

void random_test()
{
    std::vector<uint8_t> buffer(1000);
    util::get_random_bytes(&buffer[0], buffer.size());
    const std::set<uint8_t> distinct(buffer.begin(), buffer.end());
    TOYRSA_ASSERT_BINARY_MESSAGE(distinct.size(), >, 128U, "1000 random bytes with too few distinct values");

    util::get_random_bytes(nullptr, 0);

    std::set<uint64_t> values;
    for (int i = 0; i < 100; ++i) {
        values.insert(util::get_random<uint64_t>());
    }
    TOYRSA_ASSERT_EQUAL(100U, values.size());
}

void base10_decode_test()
{
    TOYRSA_ASSERT_EQUAL(0U, util::base10_decode<uint32_t>("0"));
    TOYRSA_ASSERT_EQUAL(65537U, util::base10_decode<uint32_t>("65537"));
    TOYRSA_ASSERT_EQUAL(4294967295U, util::base10_decode<uint32_t>("4294967295"));
    TOYRSA_ASSERT_EQUAL(18446744073709551615ULL, util::base10_decode<uint64_t>("18446744073709551615"));
    TOYRSA_ASSERT_EQUAL(7ULL, util::base10_decode<uint64_t>("007"));

    // Signs and whitespace are not digits, even where operator>> would accept them
    for (const char* s : { "", "-1", " -1", "+7", " 7", "7 ", "1 2", "\t3", "12a", "0x10", "1e3" }) {
        TOYRSA_ASSERT_THROWS(util::base10_decode<uint64_t>(s), std::invalid_argument);
    }

    TOYRSA_ASSERT_THROWS(util::base10_decode<uint32_t>("4294967296"), std::invalid_argument);
    TOYRSA_ASSERT_THROWS(util::base10_decode<uint64_t>("18446744073709551616"), std::invalid_argument);
    TOYRSA_ASSERT_THROWS(util::base10_decode(std::string("11"), 10), std::invalid_argument);
}

int main()
{
    check_macros_test();
    ostream_adapter_test();
    random_test();
    base10_decode_test();
}
