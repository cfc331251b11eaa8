/*
 * settings.cpp - Tunable runtime settings implementation
 */

#include "settings.hpp"
#include "config.hpp"
#include <cerrno>
#include <cstdlib>
#include <functional>
#include <map>

namespace {

bool parse_number(const std::string& text, long long min, long long max, long long& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

bool parse_bool(const std::string& text, bool& out) {
    if (text == "true" || text == "yes" || text == "1" || text == "on") {
        out = true;
        return true;
    }
    if (text == "false" || text == "no" || text == "0" || text == "off") {
        out = false;
        return true;
    }
    return false;
}

} // namespace

Settings Settings::from_lines(const std::vector<std::string>& lines, std::vector<std::string>& warnings) {
    Settings s;

    using Setter = std::function<bool(const std::string&)>;
    auto number = [](long long min, long long max, std::function<void(long long)> apply) -> Setter {
        return [min, max, apply](const std::string& value) {
            long long n = 0;
            if (!parse_number(value, min, max, n)) {
                return false;
            }
            apply(n);
            return true;
        };
    };

    const std::map<std::string, Setter> setters = {
        {"max_events_per_frame", number(1, 1000, [&s](long long n) { s.debounce.max_events_per_frame = static_cast<size_t>(n); })},
        {"nav_spacing_ms", number(0, 1000, [&s](long long n) { s.debounce.nav_spacing = std::chrono::milliseconds(n); })},
        {"input_budget_ms", number(1, 1000, [&s](long long n) { s.debounce.frame_budget = std::chrono::milliseconds(n); })},
        {"coalesce_navigation", [&s](const std::string& value) { return parse_bool(value, s.debounce.coalesce_navigation); }},
        {"frame_interval_ms", number(1, 1000, [&s](long long n) { s.frame_interval = std::chrono::milliseconds(n); })},
        {"auto_refresh_secs", number(1, 3600, [&s](long long n) { s.limits.auto_refresh_interval = std::chrono::seconds(n); })},
        {"pending_refresh_secs", number(1, 3600, [&s](long long n) { s.limits.pending_refresh_interval = std::chrono::seconds(n); })},
        {"cache_ttl_secs", number(1, 86400, [&s](long long n) { s.cache_ttl = std::chrono::seconds(n); })},
        {"max_notifications", number(1, 100, [&s](long long n) { s.limits.max_notifications = static_cast<size_t>(n); })},
        {"notification_secs", number(1, 3600, [&s](long long n) { s.limits.notification_dismiss = std::chrono::seconds(n); })},
        {"max_log_entries", number(10, 1000000, [&s](long long n) { s.limits.max_log_entries = static_cast<size_t>(n); })},
        {"settle_delay_ms", number(0, 60000, [&s](long long n) { s.timings.settle_delay = std::chrono::milliseconds(n); })},
        {"log_level", [&s](const std::string& value) {
            static const char* levels[] = {"trace", "debug", "info", "warn", "error", "off"};
            for (const char* level : levels) {
                if (value == level) {
                    s.log_level = value;
                    return true;
                }
            }
            return false;
        }}
    };

    for (const auto& line : lines) {
        std::vector<std::string> fields = Config::parse_fields(line, ':');
        if (fields.size() != 2) {
            warnings.push_back("malformed setting line: " + line);
            continue;
        }

        std::string key = Config::trim(fields[0]);
        std::string value = Config::trim(fields[1]);

        auto it = setters.find(key);
        if (it == setters.end()) {
            warnings.push_back("unknown setting: " + key);
            continue;
        }
        if (!it->second(value)) {
            warnings.push_back("invalid value for " + key + ": " + value);
        }
    }

    return s;
}

Settings Settings::load(const std::string& filepath, std::vector<std::string>& warnings) {
    return from_lines(Config::read_config_lines(filepath), warnings);
}

Settings Settings::load_default(std::vector<std::string>& warnings) {
    if (!Config::install_default_config(FILENAME)) {
        warnings.push_back(std::string("could not install default ") + FILENAME);
    }
    return load(Config::get_config_path(FILENAME), warnings);
}
