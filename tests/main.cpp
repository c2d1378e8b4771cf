#include "test_framework.hpp"
#include "codec_tests.hpp"
#include "reader_tests.hpp"
#include "writer_tests.hpp"
#include "config/codec_config.hpp"
#include <algorithm>
#include <iostream>

using namespace binio::test;

int main(int argc, char* argv[]) {
    binio::LoggingConfig logging;
    if (argc > 1) {
        logging.log_file = argv[1];
    }
    binio::Logger::instance().initialize(logging.log_file, logging.min_level);

    TestRunner runner;

    runner.add_test_suite(CodecTests::create_suite());
    runner.add_test_suite(ReaderTests::create_suite());
    runner.add_test_suite(WriterTests::create_suite());

    bool success = runner.run_all_tests();

    auto results = runner.get_results();
    size_t total = results.size();
    size_t passed = std::count_if(results.begin(), results.end(),
                                 [](const TestRunner::TestResult& r) { return r.passed; });

    std::cout << "\nTest Results: " << passed << "/" << total
              << " tests passed" << std::endl;

    return success ? 0 : 1;
}
