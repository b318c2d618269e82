#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

struct settings_error: std::runtime_error {
    explicit settings_error(const std::string& what): std::runtime_error{what} {}
};

struct settings {
    int  monitor       = 1;      // index into the connected monitors
    bool fullscreen    = false;
    int  window_width  = 1280;
    int  window_height = 720;
    bool vsync         = true;

    double physical_width_mm   = 300.0;
    double viewing_distance_mm = 570.0;

    std::size_t key_buffer = 100;  // per listener

    // Defaults overridden by PSYFRAME_* environment variables.
    static settings from_env();
    // Same, reading variables through `lookup`.
    static settings from_lookup(const std::function<std::optional<std::string>(const std::string&)>& lookup);

    void validate() const;
};

bool parse_bool(const std::string& name, const std::string& value);
int parse_int(const std::string& name, const std::string& value);
double parse_double(const std::string& name, const std::string& value);
