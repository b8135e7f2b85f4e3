#ifndef SNUFFLE_UTIL_TEST_H_INCLUDED
#define SNUFFLE_UTIL_TEST_H_INCLUDED

#include <sstream>
#include <string>
#include <stdexcept>
#include <cstdlib>

namespace snuffle {

// Thrown when a caller hands the library arguments it can never accept
// (bad key/nonce length, unsupported round count, overlapping buffers).
class configuration_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

namespace test {

void check_failed(const char* func, const char* file, int line, const std::string& message);
void assert_failed(const char* func, const char* file, int line, const std::string& message);

} } // namespace snuffle::test

#define SNUFFLE_ASSERT_THROWS_MESSAGE(expr, exception_type, message)    \
    do {                                                                \
        try {                                                           \
            expr;                                                       \
            std::ostringstream _snuffle_oss;                            \
            _snuffle_oss << "Expected " << #expr                        \
                << " to throw exception of type "                       \
                << #exception_type                                      \
                << "\n" << message;                                     \
            snuffle::test::assert_failed(__PRETTY_FUNCTION__, __FILE__, \
                    __LINE__, _snuffle_oss.str());                      \
        } catch (const exception_type &) {}                             \
    } while(0)

#define SNUFFLE_ASSERT_THROWS(expr, exception_type) \
    SNUFFLE_ASSERT_THROWS_MESSAGE(expr, exception_type, "")

#define SNUFFLE_CHECK_BINARY_(expected, bin_op, actual, message, fail)  \
    do {                                                                \
        const auto _a_val = (expected);                                 \
        const auto _b_val = (actual);                                   \
        if (!(_a_val bin_op _b_val)) {                                  \
            std::ostringstream _snuffle_oss;                            \
            _snuffle_oss << "Expected:\n" << #expected << " "           \
                << #bin_op << " " << #actual << "\n"                    \
                << "Failure:\n"                                         \
                << "\"" << _a_val << "\"\n" << #bin_op << "\n\""        \
                << _b_val << "\"\n" << message;                         \
            fail(__PRETTY_FUNCTION__, __FILE__, __LINE__,               \
                    _snuffle_oss.str());                                \
        }                                                               \
    } while (0)

#define SNUFFLE_ASSERT_BINARY_MESSAGE(expected, bin_op, actual, message) \
    SNUFFLE_CHECK_BINARY_(expected, bin_op, actual, message, snuffle::test::assert_failed)

#define SNUFFLE_ASSERT_EQUAL(expected, actual) SNUFFLE_ASSERT_BINARY_MESSAGE(expected, ==, actual, "")
#define SNUFFLE_ASSERT_EQUAL_MESSAGE(expected, actual, message) SNUFFLE_ASSERT_BINARY_MESSAGE(expected, ==, actual, message)

#define SNUFFLE_ASSERT_NOT_EQUAL(expected, actual) SNUFFLE_ASSERT_BINARY_MESSAGE(expected, !=, actual, "")
#define SNUFFLE_ASSERT_NOT_EQUAL_MESSAGE(expected, actual, message) SNUFFLE_ASSERT_BINARY_MESSAGE(expected, !=, actual, message)

// Argument checks in library code. Failure throws snuffle::configuration_error.
#define SNUFFLE_CHECK_BINARY(expected, bin_op, actual, message) \
    SNUFFLE_CHECK_BINARY_(expected, bin_op, actual, message, snuffle::test::check_failed)

#define SNUFFLE_CHECK(cond, message) \
    SNUFFLE_CHECK_BINARY(static_cast<bool>(cond), ==, true, message)

#endif
