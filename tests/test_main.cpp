#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#include <iostream>
#include <mutex>

// Prints each test case and subcase as it starts so a hang in a loader or
// monitor test points at the test that caused it.
struct ShowTestStart : public doctest::IReporter {
    explicit ShowTestStart(const doctest::ContextOptions&) {}

    void test_case_start(const doctest::TestCaseData& in) override { print("Test: ", in.m_name); }
    void subcase_start(const doctest::SubcaseSignature& in) override { print("\tSubcase: ", in.m_name.c_str()); }

    void report_query(const doctest::QueryData&) override {}
    void test_run_start() override {}
    void test_run_end(const doctest::TestRunStats&) override {}
    void test_case_reenter(const doctest::TestCaseData&) override {}
    void test_case_end(const doctest::CurrentTestCaseStats&) override {}
    void test_case_exception(const doctest::TestCaseException&) override {}
    void subcase_end() override {}
    void log_assert(const doctest::AssertData&) override {}
    void log_message(const doctest::MessageData&) override {}
    void test_case_skipped(const doctest::TestCaseData&) override {}

private:
    static void print(const char* prefix, const char* name) {
#ifdef JL_LOG_DEBUG
        std::lock_guard<std::mutex> lock(JL::TaggedLogger::coutMutex);
#endif
        std::cout << prefix << name << std::endl;
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
#ifdef JL_LOG_DEBUG
    JL::set_thread_name("TestMain");
    // Off unless JSONLENS_LOG asks for it; JSONLENS_LOG_TAGS narrows the output.
    JL::set_logging_enabled(false);
    JL::configure_logging_from_environment();
#endif

    doctest::Context context;
    context.applyCommandLine(argc, argv);
    if (context.shouldExit())
        return context.run();

    jl_log("Starting test execution", "Test");
    int const res = context.run();
    jl_log(res == 0 ? "All tests passed" : "Some tests failed", "Test");
    return res;
}
