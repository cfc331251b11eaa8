/*
 * settings.hpp - Tunable runtime settings
 *
 * Loaded from settings.conf in the config directory, one key:value pair per
 * line. Missing keys keep their defaults; unknown keys and malformed values
 * are skipped and reported as warnings so the caller can log them once the
 * logger is up.
 */

#pragma once

#include "input_debouncer.hpp"
#include "state.hpp"
#include "task_coordinator.hpp"
#include <chrono>
#include <string>
#include <vector>

struct Settings {
    static constexpr const char* FILENAME = "settings.conf";

    DebounceConfig debounce;
    std::chrono::milliseconds frame_interval{8};
    StateLimits limits;
    std::chrono::seconds cache_ttl{300};
    TaskTimings timings;
    std::string log_level = "info";

    static Settings from_lines(const std::vector<std::string>& lines, std::vector<std::string>& warnings);
    static Settings load(const std::string& filepath, std::vector<std::string>& warnings);
    static Settings load_default(std::vector<std::string>& warnings);
};
