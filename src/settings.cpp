#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fmt/format.h>

#include "utils.hpp"

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}
}

bool parse_bool(const std::string& name, const std::string& value) {
    auto v = lower(value);
    if (v == "1" || v == "true"  || v == "yes" || v == "on")  return true;
    if (v == "0" || v == "false" || v == "no"  || v == "off") return false;
    throw settings_error{fmt::format("{}: expected a boolean, got '{}'", name, value)};
}

int parse_int(const std::string& name, const std::string& value) {
    try {
        std::size_t used = 0;
        auto result = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument{value};
        return result;
    }
    catch (const std::logic_error&) {
        throw settings_error{fmt::format("{}: expected an integer, got '{}'", name, value)};
    }
}

double parse_double(const std::string& name, const std::string& value) {
    try {
        std::size_t used = 0;
        auto result = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument{value};
        return result;
    }
    catch (const std::logic_error&) {
        throw settings_error{fmt::format("{}: expected a number, got '{}'", name, value)};
    }
}

settings settings::from_lookup(const std::function<std::optional<std::string>(const std::string&)>& lookup) {
    settings result;
    auto with = [&](const std::string& name, auto&& apply) {
        if (auto value = lookup(name); value && !value->empty()) {
            apply(name, *value);
            log_debug("Setting {}={}", name, *value);
        }
    };
    with("PSYFRAME_MONITOR",       [&](const auto& n, const auto& v) { result.monitor = parse_int(n, v); });
    with("PSYFRAME_FULLSCREEN",    [&](const auto& n, const auto& v) { result.fullscreen = parse_bool(n, v); });
    with("PSYFRAME_WINDOW_WIDTH",  [&](const auto& n, const auto& v) { result.window_width = parse_int(n, v); });
    with("PSYFRAME_WINDOW_HEIGHT", [&](const auto& n, const auto& v) { result.window_height = parse_int(n, v); });
    with("PSYFRAME_VSYNC",         [&](const auto& n, const auto& v) { result.vsync = parse_bool(n, v); });
    with("PSYFRAME_WIDTH_MM",      [&](const auto& n, const auto& v) { result.physical_width_mm = parse_double(n, v); });
    with("PSYFRAME_DISTANCE_MM",   [&](const auto& n, const auto& v) { result.viewing_distance_mm = parse_double(n, v); });
    with("PSYFRAME_KEY_BUFFER",    [&](const auto& n, const auto& v) {
        auto capacity = parse_int(n, v);
        if (capacity < 1) throw settings_error{fmt::format("{}: must be at least 1, got {}", n, capacity)};
        result.key_buffer = capacity;
    });
    result.validate();
    return result;
}

settings settings::from_env() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        if (auto value = std::getenv(name.c_str())) return std::string{value};
        return {};
    });
}

void settings::validate() const {
    if (window_width < 1 || window_height < 1) {
        throw settings_error{fmt::format("window size must be positive, got {}x{}", window_width, window_height)};
    }
    if (!(physical_width_mm > 0.0)) {
        throw settings_error{fmt::format("physical display width must be positive, got {} mm", physical_width_mm)};
    }
    if (!(viewing_distance_mm > 0.0)) {
        throw settings_error{fmt::format("viewing distance must be positive, got {} mm", viewing_distance_mm)};
    }
    if (key_buffer < 1) throw settings_error{"keyboard buffer must hold at least one event"};
}
