#pragma once

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

#include "spdlog/spdlog.h"

// Monotonic clock for every timestamp that ends up in a timing record
using timer = std::chrono::steady_clock;

inline double to_us(auto dt)   { return std::chrono::duration_cast<std::chrono::microseconds>(dt).count(); }
inline double to_ms(auto dt)   { return std::chrono::duration<double, std::milli>(dt).count(); }
inline double to_secs(auto dt) { return std::chrono::duration<double>(dt).count(); }

inline timer::duration from_secs(double secs) {
    return std::chrono::duration_cast<timer::duration>(std::chrono::duration<double>(secs));
}

// Logging
void log_init();

template <typename... T> void log_trace(fmt::format_string<T...> f, T&&... t)    { spdlog::trace(f, std::forward<T>(t)...); }
template <typename... T> void log_debug(fmt::format_string<T...> f, T&&... t)    { spdlog::debug(f, std::forward<T>(t)...); }
template <typename... T> void log_info(fmt::format_string<T...> f, T&&... t)     { spdlog::info(f, std::forward<T>(t)...); }
template <typename... T> void log_warn(fmt::format_string<T...> f, T&&... t)     { spdlog::warn(f, std::forward<T>(t)...); }
template <typename... T> void log_critical(fmt::format_string<T...> f, T&&... t) { spdlog::critical(f, std::forward<T>(t)...); }
template <typename... T> void log_error(fmt::format_string<T...> f, T&&... t) {
    auto msg = fmt::format(f, std::forward<T>(t)...);
    spdlog::error(msg);
    throw std::runtime_error(msg);
}
template <typename... T> void log_logic_error(fmt::format_string<T...> f, T&&... t) {
    auto msg = fmt::format(f, std::forward<T>(t)...);
    spdlog::error(msg);
    throw std::logic_error(msg);
}
template <typename... T> [[noreturn]] void log_fatal(fmt::format_string<T...> f, T&&... t) {
    spdlog::critical(f, std::forward<T>(t)...);
    spdlog::shutdown();
    std::abort();
}

std::string thread_name();
