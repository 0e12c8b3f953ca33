#include "core/benchmark.hpp"

#include <gtest/gtest.h>

#include <new>
#include <stdexcept>
#include <string>
#include <vector>

using namespace CSD;

namespace {

struct Recorded {
    std::string name;
    double seconds = -1.0;
};

} // namespace

TEST(BenchmarkTest, ReportsOnceOnReturnAndPassesValueThrough) {
    std::vector<Recorded> recorded;
    Benchmark::Sink sink = [&](const std::string& name, double seconds) {
        recorded.push_back({ name, seconds });
    };

    int value = Benchmark::Measure("Create type model", [] { return 42; }, sink);

    EXPECT_EQ(value, 42);
    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded[0].name, "Create type model");
    EXPECT_GE(recorded[0].seconds, 0.0);
}

TEST(BenchmarkTest, ReportsWhenCallableThrows) {
    std::vector<Recorded> recorded;
    Benchmark::Sink sink = [&](const std::string& name, double seconds) {
        recorded.push_back({ name, seconds });
    };

    EXPECT_THROW(Benchmark::Measure("Generate C# code", []() -> int {
        throw std::runtime_error("disk full");
    }, sink), std::runtime_error);

    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded[0].name, "Generate C# code");
}

TEST(BenchmarkTest, VoidCallablesAreSupported) {
    int reports = 0;
    bool ran = false;
    Benchmark::Sink sink = [&](const std::string&, double) { ++reports; };

    Benchmark::Measure("Generate Python script", [&] { ran = true; }, sink);

    EXPECT_TRUE(ran);
    EXPECT_EQ(reports, 1);
}

TEST(BenchmarkTest, EmptySinkIsIgnored) {
    Benchmark::Sink sink;
    EXPECT_EQ(Benchmark::Measure("Analyze IL2CPP data", [] { return 1; }, sink), 1);
}

TEST(BenchmarkTest, ThrowingSinkDoesNotEscape) {
    Benchmark::Sink sink = [](const std::string&, double) {
        throw std::runtime_error("sink failed");
    };

    EXPECT_EQ(Benchmark::Measure("Create type model", [] { return 7; }, sink), 7);
}

TEST(BenchmarkTest, ThrowingSinkDuringUnwindKeepsOriginalException) {
    Benchmark::Sink sink = [](const std::string&, double) {
        throw std::bad_alloc();
    };

    EXPECT_THROW(Benchmark::Measure("Generate C# code", []() -> int {
        throw std::invalid_argument("bad layout");
    }, sink), std::invalid_argument);
}
