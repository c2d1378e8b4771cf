#pragma once
#include <string>
#include <functional>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include "util/logger.hpp"

namespace binio {
namespace test {

struct TestCase {
    std::string name;
    std::string description;
    std::function<bool()> test_func;
    bool required{true};
    std::chrono::milliseconds timeout{5000};  // 5 seconds default
};

struct TestSuite {
    std::string name;
    std::vector<TestCase> test_cases;
    std::function<bool()> setup;
    std::function<bool()> teardown;
};

class TestRunner {
public:
    // Test registration
    void add_test_suite(const TestSuite& suite);
    void add_test_case(const std::string& suite_name, const TestCase& test);

    // Test execution
    bool run_all_tests();
    bool run_test_suite(const std::string& suite_name);
    bool run_single_test(const std::string& suite_name, const std::string& test_name);

    // Test results
    struct TestResult {
        std::string suite_name;
        std::string test_name;
        bool passed{false};
        std::string error_message;
        std::chrono::milliseconds duration{0};
    };
    std::vector<TestResult> get_results() const;
    void print_summary() const;

private:
    std::vector<TestSuite> test_suites_;
    std::vector<TestResult> results_;

    bool run_test_case(const TestCase& test, const std::string& suite_name);
    void log_result(const TestResult& result);
};

// Streamable form of a value for assertion messages
template<typename T>
const T& printable(const T& value) { return value; }
inline int printable(uint8_t value) { return value; }
inline int printable(int8_t value) { return value; }
inline std::string printable(const std::vector<uint8_t>& bytes) {
    std::string out = "[";
    char hex[8];
    for (size_t i = 0; i < bytes.size(); ++i) {
        std::snprintf(hex, sizeof(hex), i == 0 ? "%02x" : " %02x", bytes[i]);
        out += hex;
    }
    return out + "]";
}

// Test assertion macros
#define TEST_ASSERT(condition) \
    do { \
        if (!(condition)) { \
            BINIO_LOG_ERROR("Assertion failed: {} ({}:{})", #condition, __FILE__, __LINE__); \
            return false; \
        } \
    } while (0)

#define TEST_ASSERT_EQ(expected, actual) \
    do { \
        const auto expected_value_ = (expected); \
        const auto actual_value_ = (actual); \
        if (!(expected_value_ == actual_value_)) { \
            BINIO_LOG_ERROR("Expected {} but got {}: {} ({}:{})", \
                            ::binio::test::printable(expected_value_), \
                            ::binio::test::printable(actual_value_), #actual, __FILE__, __LINE__); \
            return false; \
        } \
    } while (0)

#define TEST_ASSERT_THROWS(expr, exception_type) \
    do { \
        try { \
            expr; \
            BINIO_LOG_ERROR("Expected exception {} not thrown: {}", #exception_type, #expr); \
            return false; \
        } catch (const exception_type&) { \
        } catch (const std::exception& e) { \
            BINIO_LOG_ERROR("Wrong exception type caught from {}: {}", #expr, e.what()); \
            return false; \
        } \
    } while (0)

} // namespace test
} // namespace binio
