#pragma once

#include <atomic>
#include <format>
#include <print>
#include <utility>

// Process-wide log gate. Info lines only appear with --verbose; warnings
// and errors are always written to stderr.
namespace logging {

inline std::atomic<bool> g_verbose{false};

inline void set_verbose(bool v) { g_verbose.store(v, std::memory_order_relaxed); }
inline bool verbose() { return g_verbose.load(std::memory_order_relaxed); }

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (!verbose()) return;
    std::println(stderr, "[scribed] {}", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    std::println(stderr, "[scribed] warning: {}", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    std::println(stderr, "[scribed] error: {}", std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
