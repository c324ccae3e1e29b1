#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "rtk/log/TaggedLogger.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
        std::lock_guard<std::mutex> lock(RTK::TaggedLogger::coutMutex);
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void report_query(const doctest::QueryData&) override {
    }
    void test_run_start() override {
    }
    void test_run_end(const doctest::TestRunStats&) override {
    }
    void test_case_reenter(const doctest::TestCaseData&) override {
    }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
    }
    void test_case_exception(const doctest::TestCaseException&) override {
    }
    void subcase_start(const doctest::SubcaseSignature& in) override {
        std::lock_guard<std::mutex> lock(RTK::TaggedLogger::coutMutex);
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }
    void subcase_end() override {
    }
    void log_assert(const doctest::AssertData&) override {
    }
    void log_message(const doctest::MessageData&) override {
    }
    void test_case_skipped(const doctest::TestCaseData&) override {
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
    // Quiet unless RTK_LOG asks for output; the pipeline warns on purpose in some tests.
    RTK::set_logging_enabled(false);

    doctest::Context context;
    context.applyCommandLine(argc, argv);

    RTK::set_thread_name("TestMain");
    bool enableLog = false;
    if (const char* _env_log = std::getenv("RTK_LOG")) {
        if (std::strcmp(_env_log, "0") != 0)
            enableLog = true;
    }

    if (context.shouldExit()) {
        return context.run();
    }

    if (enableLog) {
        RTK::set_logging_enabled(true);
        rtk_log("Starting test execution", "TEST", "INFO");
    }

    int res = context.run();

    if (enableLog) {
        if (res == 0) {
            rtk_log("All tests passed successfully", "TEST", "SUCCESS");
        } else {
            rtk_log("Some tests failed", "TEST", "FAILURE");
        }
        RTK::logger().flush();
    }
    return res;
}
