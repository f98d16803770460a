#include "pch.h"
#include "Test.h"

namespace test {

struct TestEntry
{
    std::string name;
    std::function<void()> body;
};

static std::vector<TestEntry>& GetTests()
{
    static std::vector<TestEntry> s_tests;
    return s_tests;
}

static int g_failures;

nanosec Now()
{
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

void RegisterTestEntryImpl(const char* name, const std::function<void()>& body)
{
    GetTests().push_back({ name, body });
}

void PrintImpl(const char* format, ...)
{
    va_list args;
    va_start(args, format);
    vprintf(format, args);
    va_end(args);
    fflush(stdout);
}

void FailImpl(const char* file, int line, const char* expr)
{
    PrintImpl("%s(%d): failed - %s\n", file, line, expr);
    ++g_failures;
}

static void RunTest(const TestEntry& t)
{
    int before = g_failures;
    testPrint("%s begin\n", t.name.c_str());
    auto begin = Now();
    t.body();
    auto end = Now();
    testPrint("%s %s (%.2fms)\n\n", t.name.c_str(), g_failures == before ? "passed" : "FAILED", NS2MS(end - begin));
}

} // namespace test

// usage: TatataTest [test names...]
// runs the named tests, or all of them when none is given.
int main(int argc, char* argv[])
{
    using namespace test;

    int num_run = 0;
    if (argc > 1) {
        for (int i = 1; i < argc; ++i) {
            for (auto& t : GetTests()) {
                if (t.name == argv[i]) {
                    RunTest(t);
                    ++num_run;
                }
            }
        }
    }
    else {
        for (auto& t : GetTests()) {
            RunTest(t);
            ++num_run;
        }
    }

    testPrint("%d test(s), %d failure(s)\n", num_run, g_failures);
    return g_failures == 0 && num_run > 0 ? 0 : 1;
}
