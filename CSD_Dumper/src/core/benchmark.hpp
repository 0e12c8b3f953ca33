#pragma once

// ============================================================================
// Scoped Phase Timing
// ============================================================================
// Measure() runs a callable and reports its wall-clock duration when the
// call finishes, whether it returns normally, returns early or throws.
//
// Usage:
//   auto images = Benchmark::Measure("Analyze IL2CPP data", [&] {
//       return analyzer.LoadFromFile(bin, meta);
//   });

#include "core/csd_log.h"

#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <utility>

namespace CSD {
namespace Benchmark {

/// Receives the phase name and its duration in seconds.
using Sink = std::function<void(const std::string& name, double seconds)>;

/// Default sink: "<name>: <seconds> sec" at INFO level.
inline void LogSink(const std::string& name, double seconds) {
    LOG_INFO("%s: %.2f sec", name.c_str(), seconds);
}

namespace detail {

class CompletionGuard {
public:
    CompletionGuard(std::string name, const Sink& sink)
        : m_name(std::move(name)), m_sink(sink),
          m_start(std::chrono::steady_clock::now()) {}

    ~CompletionGuard() {
        auto elapsed = std::chrono::steady_clock::now() - m_start;
        double seconds = std::chrono::duration<double>(elapsed).count();
        if (!m_sink) return;

        // Runs during unwinding too: a throwing sink must not escape
        try {
            m_sink(m_name, seconds);
        } catch (const std::exception& e) {
            LOG_WARN("Timing report for %s failed: %s", m_name.c_str(), e.what());
        }
    }

    CompletionGuard(const CompletionGuard&) = delete;
    CompletionGuard& operator=(const CompletionGuard&) = delete;

private:
    std::string m_name;
    const Sink& m_sink;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace detail

template <typename Fn>
auto Measure(const std::string& name, Fn&& fn, const Sink& sink) -> decltype(fn()) {
    detail::CompletionGuard guard(name, sink);
    return std::forward<Fn>(fn)();
}

template <typename Fn>
auto Measure(const std::string& name, Fn&& fn) -> decltype(fn()) {
    static const Sink log_sink = &LogSink;
    return Measure(name, std::forward<Fn>(fn), log_sink);
}

} // namespace Benchmark
} // namespace CSD
