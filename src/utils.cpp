#include "utils.hpp"

#include <sstream>
#include <thread>

#include "spdlog/cfg/env.h"

void log_init() {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S.%f] [%^%l%$] [%t] %v");
    // SPDLOG_LEVEL=debug or SPDLOG_LEVEL=trace override the default
    spdlog::cfg::load_env_levels();
}

std::string thread_name() {
    std::stringstream ss;
    ss << std::this_thread::get_id();
    return ss.str();
}
