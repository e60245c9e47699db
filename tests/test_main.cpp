#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "log/TaggedLogger.hpp"

#include <iostream>
#include <mutex>

namespace {

// Prints test and subcase names so a hang or crash can be placed. Shares the
// logger's output lock so the names do not interleave with log lines.
struct AnnounceTests : doctest::IReporter {
    explicit AnnounceTests(const doctest::ContextOptions&) {}

    void test_case_start(const doctest::TestCaseData& in) override { announce("Test: ", in.m_name); }
    void subcase_start(const doctest::SubcaseSignature& in) override { announce("\tSubcase: ", in.m_name); }

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
    template <typename Name>
    static void announce(const char* prefix, const Name& name) {
#ifdef WV_LOG_DEBUG
        std::lock_guard<std::mutex> lock(WV::output_mutex());
#endif
        std::cout << prefix << name << std::endl;
    }
};

} // namespace

REGISTER_LISTENER("announce_tests", 1, AnnounceTests);

int main(int argc, char** argv) {
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    if (context.shouldExit())
        return context.run();

#ifdef WV_LOG_DEBUG
    // WEAVE_LOG=1 turns logging on; WEAVE_LOG_TAGS / WEAVE_LOG_SKIP_TAGS narrow it.
    WV::set_thread_name("TestMain");
    auto const logging = WV::logger().configure_from_environment();
    if (logging)
        wv_log("Starting test execution", "TEST", "INFO");
#endif

    int const result = context.run();

#ifdef WV_LOG_DEBUG
    if (logging)
        wv_log(result == 0 ? "All tests passed" : "Some tests failed", "TEST", result == 0 ? "SUCCESS" : "FAILURE");
#endif
    return result;
}
