/*
 * tests.cpp - Unit tests for emu
 *
 * Uses the attest.h single-header testing framework. The pure pieces
 * (debouncer, merge, cache, notifications, state logic, form) run against a
 * ManualClock; the coordination tests run real background threads against
 * simulated device managers and poll for the expected state.
 */

#define ATTEST_IMPLEMENTATION
#include "attest.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <ncurses.h>
#include <spdlog/spdlog.h>

// Include project headers
#include "../src/clock.hpp"
#include "../src/config.hpp"
#include "../src/device.hpp"
#include "../src/device_actions.hpp"
#include "../src/device_cache.hpp"
#include "../src/device_merge.hpp"
#include "../src/input_debouncer.hpp"
#include "../src/keys.hpp"
#include "../src/notification.hpp"
#include "../src/settings.hpp"
#include "../src/simulated_device_manager.hpp"
#include "../src/state.hpp"
#include "../src/state_store.hpp"
#include "../src/task_coordinator.hpp"

using namespace std::chrono_literals;

namespace {

// Keep the default stdout logger quiet while tests run
const bool logging_silenced = []() {
    spdlog::set_level(spdlog::level::off);
    return true;
}();

Device make_device(Platform platform, const std::string& identity, bool running) {
    Device d;
    d.platform = platform;
    d.identity = identity;
    d.name = identity;
    d.device_type = platform == Platform::ANDROID ? "pixel_4" : "iPhone 14";
    d.version = platform == Platform::ANDROID ? "33" : "iOS 17.2";
    d.status = running ? DeviceStatus::RUNNING : DeviceStatus::STOPPED;
    d.is_running = running;
    return d;
}

class ScriptedInput : public InputSource {
public:
    explicit ScriptedInput(std::vector<int> keys) : keys_(keys.begin(), keys.end()) {}

    int read_key() override {
        if (keys_.empty()) {
            return NO_KEY;
        }
        int key = keys_.front();
        keys_.pop_front();
        return key;
    }

    bool has_pending() override { return !keys_.empty(); }

private:
    std::deque<int> keys_;
};

// Tags every streamed line with the identity of the device it came from
class TaggedLogManager : public SimulatedDeviceManager {
public:
    TaggedLogManager(Platform platform, const Clock& clock)
        : SimulatedDeviceManager(platform, clock, false) {}

    bool stream_logs(const Device& device, const LineCallback& on_line,
                     const KeepGoing& keep_going, std::string& error) override {
        std::string tag = "[" + device.identity + "] ";
        auto tagged = [&on_line, &tag](const LogLine& line) {
            return on_line(LogLine{line.level, tag + line.message});
        };
        return SimulatedDeviceManager::stream_logs(device, tagged, keep_going, error);
    }
};

// Keeps emitting lines until one is refused, whatever keep_going says
class StubbornLogManager : public SimulatedDeviceManager {
public:
    StubbornLogManager(Platform platform, const Clock& clock)
        : SimulatedDeviceManager(platform, clock, false) {}

    bool stream_logs(const Device& device, const LineCallback& on_line,
                     const KeepGoing&, std::string&) override {
        for (int i = 0; i < 1000; ++i) {
            LogLine line{LogLevel::INFO, "[" + device.identity + "] line " + std::to_string(i)};
            if (!on_line(line)) {
                finished = true;
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        finished = true;
        return true;
    }

    std::atomic<bool> finished{false};
};

template <typename Predicate>
bool wait_until(Predicate pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

TaskTimings fast_timings() {
    TaskTimings t;
    t.detail_debounce = 5ms;
    t.fast_detail_debounce = 2ms;
    t.log_delay = 5ms;
    t.fast_log_delay = 2ms;
    t.settle_delay = 10ms;
    return t;
}

bool all_tagged(const std::vector<LogEntry>& logs, const std::string& identity) {
    std::string tag = "[" + identity + "] ";
    for (const auto& entry : logs) {
        if (entry.message.compare(0, tag.size(), tag) != 0) {
            return false;
        }
    }
    return true;
}

} // namespace

// =============================================================================
// Config and Settings Tests
// =============================================================================

REGISTER_TEST(config_parse_fields_basic)
{
    std::vector<std::string> fields = Config::parse_fields("nav_spacing_ms:30", ':');
    ATTEST_EQUAL(fields.size(), 2u);
    ATTEST_EQUAL(fields[0], "nav_spacing_ms");
    ATTEST_EQUAL(fields[1], "30");
}

REGISTER_TEST(config_parse_fields_escaped_delimiter)
{
    std::vector<std::string> fields = Config::parse_fields("a\\:b:c", ':');
    ATTEST_EQUAL(fields.size(), 2u);
    ATTEST_EQUAL(fields[0], "a:b");
    ATTEST_EQUAL(fields[1], "c");
}

REGISTER_TEST(config_trim)
{
    ATTEST_EQUAL(Config::trim("  value \t"), "value");
    ATTEST_EQUAL(Config::trim("   "), "");
}

REGISTER_TEST(settings_defaults)
{
    std::vector<std::string> warnings;
    Settings s = Settings::from_lines({}, warnings);
    ATTEST_TRUE(warnings.empty());
    ATTEST_EQUAL(s.debounce.max_events_per_frame, 5u);
    ATTEST_EQUAL(s.debounce.nav_spacing.count(), 30);
    ATTEST_TRUE(s.debounce.coalesce_navigation);
    ATTEST_EQUAL(s.limits.max_notifications, 10u);
    ATTEST_EQUAL(s.cache_ttl.count(), 300);
    ATTEST_EQUAL(s.log_level, "info");
}

REGISTER_TEST(settings_overrides_and_warnings)
{
    std::vector<std::string> warnings;
    Settings s = Settings::from_lines({
        "nav_spacing_ms: 50",
        "coalesce_navigation: no",
        "log_level: debug",
        "bogus: 1",
        "max_notifications: 0",
        "no delimiter here"
    }, warnings);

    ATTEST_EQUAL(s.debounce.nav_spacing.count(), 50);
    ATTEST_FALSE(s.debounce.coalesce_navigation);
    ATTEST_EQUAL(s.log_level, "debug");
    ATTEST_EQUAL(s.limits.max_notifications, 10u);
    ATTEST_EQUAL(warnings.size(), 3u);
}

// =============================================================================
// Input Debouncer Tests
// =============================================================================

REGISTER_TEST(debouncer_burst_preserves_displacement)
{
    ManualClock clock;
    DebounceConfig config;
    config.max_events_per_frame = 100;
    InputDebouncer debouncer(config, clock);

    ScriptedInput input(std::vector<int>(10, KEY_DOWN));
    std::vector<InputAction> applied;
    auto classify = [](int key) { return navigation_delta(key, Mode::NORMAL); };
    auto apply = [&applied](const InputAction& a) { applied.push_back(a); };

    DrainResult result = debouncer.drain(input, classify, apply);
    ATTEST_EQUAL(result.processed, 10u);
    ATTEST_FALSE(result.more_pending);

    // One move immediately, the rest waits for the spacing interval
    ATTEST_EQUAL(applied.size(), 1u);
    ATTEST_EQUAL(applied[0].delta, 1);
    ATTEST_EQUAL(debouncer.pending_delta(), 9);
    ATTEST_EQUAL(debouncer.skipped_events(), 9u);

    clock.advance(10ms);
    ATTEST_FALSE(debouncer.flush().has_value());

    clock.advance(20ms);
    std::optional<InputAction> rest = debouncer.flush();
    ATTEST_TRUE(rest.has_value());
    ATTEST_EQUAL(rest->delta, 9);
    ATTEST_EQUAL(debouncer.pending_delta(), 0);
}

REGISTER_TEST(debouncer_flushes_before_other_keys)
{
    ManualClock clock;
    InputDebouncer debouncer(DebounceConfig(), clock);
    std::vector<InputAction> out;

    debouncer.feed(KEY_DOWN, 1, out);
    debouncer.feed(KEY_DOWN, 1, out);
    debouncer.feed(KEY_DOWN, 1, out);
    ATTEST_EQUAL(out.size(), 1u);

    debouncer.feed('s', 0, out);
    ATTEST_EQUAL(out.size(), 3u);
    ATTEST_TRUE(out[1].kind == InputAction::Kind::MOVE);
    ATTEST_EQUAL(out[1].delta, 2);
    ATTEST_TRUE(out[2].kind == InputAction::Kind::KEY);
    ATTEST_EQUAL(out[2].key, 's');
}

REGISTER_TEST(debouncer_without_coalescing_drops_skipped)
{
    ManualClock clock;
    DebounceConfig config;
    config.coalesce_navigation = false;
    InputDebouncer debouncer(config, clock);
    std::vector<InputAction> out;

    debouncer.feed(KEY_UP, -1, out);
    debouncer.feed(KEY_UP, -1, out);
    ATTEST_EQUAL(out.size(), 1u);
    ATTEST_EQUAL(debouncer.pending_delta(), 0);
    ATTEST_EQUAL(debouncer.last_direction(), -1);
}

REGISTER_TEST(debouncer_respects_frame_cap)
{
    ManualClock clock;
    InputDebouncer debouncer(DebounceConfig(), clock);
    ScriptedInput input(std::vector<int>(8, 'x'));
    size_t applied = 0;

    DrainResult result = debouncer.drain(input, [](int) { return 0; },
                                         [&applied](const InputAction&) { applied++; });
    ATTEST_EQUAL(result.processed, 5u);
    ATTEST_EQUAL(applied, 5u);
    ATTEST_TRUE(result.more_pending);
}

REGISTER_TEST(navigation_keys_depend_on_mode)
{
    ATTEST_EQUAL(navigation_delta(KEY_DOWN, Mode::NORMAL), 1);
    ATTEST_EQUAL(navigation_delta('k', Mode::NORMAL), -1);
    ATTEST_EQUAL(navigation_delta(KEY_UP, Mode::MANAGE_API_LEVELS), -1);
    ATTEST_EQUAL(navigation_delta('j', Mode::CREATE_DEVICE), 0);
    ATTEST_EQUAL(navigation_delta('x', Mode::NORMAL), 0);
}

// =============================================================================
// Notification Tests
// =============================================================================

REGISTER_TEST(notifications_capped_oldest_evicted)
{
    NotificationQueue queue(3);
    auto now = std::chrono::steady_clock::now();
    for (int i = 0; i < 5; ++i) {
        queue.push(Notification::make(NotificationType::INFO, "m" + std::to_string(i), now));
    }
    ATTEST_EQUAL(queue.size(), 3u);
    ATTEST_EQUAL(queue.entries().front().message, "m2");
    ATTEST_EQUAL(queue.entries().back().message, "m4");
}

REGISTER_TEST(notifications_expire_after_duration)
{
    ManualClock clock;
    StateLimits limits;
    limits.notification_dismiss = 3000ms;
    StateStore store(clock, limits);

    store.notify(NotificationType::SUCCESS, "done");
    store.notify_persistent(NotificationType::ERROR, "sticky");

    clock.advance(2900ms);
    ATTEST_EQUAL(store.dismiss_expired_notifications(), 0u);
    ATTEST_EQUAL(store.notification_count(), 2u);

    // Exactly at the duration it is still shown
    clock.advance(100ms);
    ATTEST_EQUAL(store.dismiss_expired_notifications(), 0u);

    clock.advance(100ms);
    ATTEST_EQUAL(store.dismiss_expired_notifications(), 1u);
    AppSnapshot snap = store.snapshot(0);
    ATTEST_EQUAL(snap.notifications.size(), 1u);
    ATTEST_EQUAL(snap.notifications[0].message, "sticky");
}

// =============================================================================
// Device Cache Tests
// =============================================================================

REGISTER_TEST(cache_ttl_and_invalidate)
{
    ManualClock clock;
    DeviceCache cache(clock, std::chrono::seconds(10));

    ATTEST_FALSE(cache.get(Platform::ANDROID).has_value());
    ATTEST_TRUE(cache.is_stale(Platform::ANDROID));

    cache.update(Platform::ANDROID, {{"pixel_4", "Pixel 4"}}, {{"33", "API 33"}});
    ATTEST_TRUE(cache.get(Platform::ANDROID).has_value());
    ATTEST_FALSE(cache.get(Platform::IOS).has_value());

    clock.advance(std::chrono::seconds(11));
    ATTEST_FALSE(cache.get(Platform::ANDROID).has_value());
    ATTEST_TRUE(cache.get_last_known(Platform::ANDROID).has_value());

    cache.update(Platform::ANDROID, {{"pixel_6", "Pixel 6"}}, {{"34", "API 34"}});
    ATTEST_FALSE(cache.is_stale(Platform::ANDROID));

    cache.invalidate(Platform::ANDROID);
    ATTEST_FALSE(cache.get(Platform::ANDROID).has_value());
    std::optional<CacheEntry> last = cache.get_last_known(Platform::ANDROID);
    ATTEST_TRUE(last.has_value());
    ATTEST_EQUAL(last->device_types[0].id, "pixel_6");
}

REGISTER_TEST(cache_single_loader)
{
    ManualClock clock;
    DeviceCache cache(clock);
    ATTEST_TRUE(cache.begin_loading(Platform::IOS));
    ATTEST_FALSE(cache.begin_loading(Platform::IOS));
    ATTEST_TRUE(cache.begin_loading(Platform::ANDROID));
    cache.finish_loading(Platform::IOS);
    ATTEST_FALSE(cache.is_loading(Platform::IOS));
    ATTEST_TRUE(cache.begin_loading(Platform::IOS));
}

// =============================================================================
// Device Merge Tests
// =============================================================================

REGISTER_TEST(merge_updates_in_place_and_drops_missing)
{
    std::vector<Device> previous = {
        make_device(Platform::ANDROID, "A", false),
        make_device(Platform::ANDROID, "B", true)
    };
    std::vector<Device> fresh = {
        make_device(Platform::ANDROID, "A", true),
        make_device(Platform::ANDROID, "C", false)
    };

    MergeResult result = merge_devices(previous, fresh);
    ATTEST_EQUAL(result.devices.size(), 2u);
    ATTEST_EQUAL(result.devices[0].identity, "A");
    ATTEST_TRUE(result.devices[0].is_running);
    ATTEST_EQUAL(result.devices[0].revision, 1u);
    ATTEST_EQUAL(result.devices[1].identity, "C");
    ATTEST_EQUAL(result.added.size(), 1u);
    ATTEST_EQUAL(result.removed.size(), 1u);
    ATTEST_EQUAL(result.removed[0].identity, "B");
    ATTEST_EQUAL(result.started.size(), 1u);
    ATTEST_EQUAL(result.started[0].identity, "A");
}

REGISTER_TEST(merge_unchanged_keeps_revision)
{
    std::vector<Device> previous = {make_device(Platform::IOS, "U1", true)};
    previous[0].revision = 7;

    MergeResult result = merge_devices(previous, {make_device(Platform::IOS, "U1", true)});
    ATTEST_FALSE(result.changed());
    ATTEST_EQUAL(result.devices[0].revision, 7u);
}

// =============================================================================
// App State Tests
// =============================================================================

REGISTER_TEST(selection_wraps_around)
{
    AppState state;
    state.android_devices = {
        make_device(Platform::ANDROID, "A", false),
        make_device(Platform::ANDROID, "B", false),
        make_device(Platform::ANDROID, "C", false)
    };

    ATTEST_TRUE(state.move_selection(-1));
    ATTEST_EQUAL(state.android_selected, 2u);
    ATTEST_TRUE(state.move_selection(1));
    ATTEST_EQUAL(state.android_selected, 0u);
    ATTEST_TRUE(state.move_selection(4));
    ATTEST_EQUAL(state.android_selected, 1u);
}

REGISTER_TEST(refresh_selection_follows_identity)
{
    AppState state;
    auto now = std::chrono::steady_clock::now();
    state.apply_refresh(std::vector<Device>{make_device(Platform::ANDROID, "A", false),
                                            make_device(Platform::ANDROID, "B", false)},
                        std::nullopt, now);
    state.move_selection(1);

    RefreshOutcome outcome = state.apply_refresh(
        std::vector<Device>{make_device(Platform::ANDROID, "N", false),
                            make_device(Platform::ANDROID, "A", false),
                            make_device(Platform::ANDROID, "B", false)},
        std::nullopt, now);

    ATTEST_TRUE(outcome.changed);
    ATTEST_FALSE(outcome.selection_changed);
    ATTEST_EQUAL(state.android_selected, 2u);
    ATTEST_EQUAL(state.selected_device()->identity, "B");
}

REGISTER_TEST(refresh_failed_platform_keeps_list)
{
    AppState state;
    auto now = std::chrono::steady_clock::now();
    state.apply_refresh(std::vector<Device>{make_device(Platform::ANDROID, "A", false),
                                            make_device(Platform::ANDROID, "B", false)},
                        std::vector<Device>{make_device(Platform::IOS, "U1", false)}, now);
    state.move_selection(1);

    // Android poll failed, iOS came back empty
    state.apply_refresh(std::nullopt, std::vector<Device>{}, now);
    ATTEST_EQUAL(state.android_devices.size(), 2u);
    ATTEST_EQUAL(state.android_selected, 1u);
    ATTEST_TRUE(state.ios_devices.empty());
    ATTEST_EQUAL(state.ios_selected, 0u);
}

REGISTER_TEST(refresh_empty_poll_resets_selection)
{
    AppState state;
    auto now = std::chrono::steady_clock::now();
    state.apply_refresh(std::vector<Device>{make_device(Platform::ANDROID, "A", false),
                                            make_device(Platform::ANDROID, "B", false),
                                            make_device(Platform::ANDROID, "C", false)},
                        std::nullopt, now);
    state.select_last();
    ATTEST_EQUAL(state.android_selected, 2u);

    RefreshOutcome outcome = state.apply_refresh(std::vector<Device>{}, std::nullopt, now);
    ATTEST_TRUE(state.android_devices.empty());
    ATTEST_EQUAL(state.android_selected, 0u);
    ATTEST_EQUAL(state.android_scroll, 0u);
    ATTEST_TRUE(outcome.selection_changed);
    ATTEST_TRUE(state.selected_device() == nullptr);
}

REGISTER_TEST(older_poll_never_overwrites_newer)
{
    ManualClock clock;
    StateStore store(clock);

    std::optional<RefreshOutcome> newer = store.apply_refresh_if_newer(
        2, std::vector<Device>{make_device(Platform::ANDROID, "A", true)},
        std::vector<Device>{make_device(Platform::IOS, "U1", false)});
    ATTEST_TRUE(newer.has_value());

    // Started before the one above, finished after it
    std::optional<RefreshOutcome> older = store.apply_refresh_if_newer(
        1, std::vector<Device>{make_device(Platform::ANDROID, "A", false)},
        std::vector<Device>{});
    ATTEST_FALSE(older.has_value());
    ATTEST_TRUE(store.devices(Platform::ANDROID)[0].is_running);
    ATTEST_EQUAL(store.devices(Platform::IOS).size(), 1u);

    // A newer single-platform poll still lands
    std::optional<RefreshOutcome> ios_only = store.apply_refresh_if_newer(
        3, std::nullopt, std::vector<Device>{});
    ATTEST_TRUE(ios_only.has_value());
    ATTEST_TRUE(store.devices(Platform::IOS).empty());
    ATTEST_EQUAL(store.devices(Platform::ANDROID).size(), 1u);
}

REGISTER_TEST(pending_start_confirmed_once)
{
    AppState state;
    auto now = std::chrono::steady_clock::now();
    state.pending_device_start = "Pixel_6";
    state.operation_status = "Starting device 'Pixel_6'...";

    RefreshOutcome first = state.apply_refresh(
        std::vector<Device>{make_device(Platform::ANDROID, "Pixel_6", true)}, std::nullopt, now);
    ATTEST_TRUE(first.confirmed_start.has_value());
    ATTEST_FALSE(state.pending_device_start.has_value());
    ATTEST_FALSE(state.operation_status.has_value());
    ATTEST_EQUAL(state.notifications.size(), 1u);
    ATTEST_EQUAL(state.notifications.entries()[0].message, "Device 'Pixel_6' is now running!");
    ATTEST_TRUE(state.notifications.entries()[0].type == NotificationType::SUCCESS);

    state.apply_refresh(std::vector<Device>{make_device(Platform::ANDROID, "Pixel_6", true)},
                        std::nullopt, now);
    ATTEST_EQUAL(state.notifications.size(), 1u);
}

REGISTER_TEST(pending_start_untouched_while_booting)
{
    AppState state;
    auto now = std::chrono::steady_clock::now();
    state.pending_device_start = "Pixel_6";

    RefreshOutcome outcome = state.apply_refresh(
        std::vector<Device>{make_device(Platform::ANDROID, "Pixel_6", false)}, std::nullopt, now);
    ATTEST_FALSE(outcome.confirmed_start.has_value());
    ATTEST_TRUE(state.pending_device_start.has_value());
    ATTEST_TRUE(state.notifications.empty());
    ATTEST_EQUAL(state.auto_refresh_interval().count(), 1);
}

REGISTER_TEST(log_filter_cycles_and_matches_exactly)
{
    AppState state;
    state.append_log(LogEntry::now(LogLevel::ERROR, "e"));
    state.append_log(LogEntry::now(LogLevel::WARN, "w"));
    state.append_log(LogEntry::now(LogLevel::WARN, "w2"));
    state.append_log(LogEntry::now(LogLevel::INFO, "i"));

    ATTEST_EQUAL(state.logs.filtered_count(), 4u);
    state.cycle_log_filter();
    ATTEST_TRUE(*state.logs.filter == LogLevel::ERROR);
    ATTEST_EQUAL(state.logs.filtered_count(), 1u);
    state.cycle_log_filter();
    ATTEST_EQUAL(state.logs.filtered_count(), 2u);
    state.cycle_log_filter();
    state.cycle_log_filter();
    ATTEST_TRUE(*state.logs.filter == LogLevel::DEBUG);
    ATTEST_EQUAL(state.logs.filtered_count(), 0u);
    state.cycle_log_filter();
    ATTEST_FALSE(state.logs.filter.has_value());
}

REGISTER_TEST(log_buffer_capped)
{
    StateLimits limits;
    limits.max_log_entries = 10;
    AppState state(limits);
    for (int i = 0; i < 15; ++i) {
        state.append_log(LogEntry::now(LogLevel::INFO, std::to_string(i)));
    }
    ATTEST_EQUAL(state.logs.entries.size(), 10u);
    ATTEST_EQUAL(state.logs.entries.front().message, "5");
}

REGISTER_TEST(log_generation_rejects_old_stream)
{
    AppState state;
    uint64_t first = state.begin_log_stream(DeviceKey{Platform::ANDROID, "A"});
    uint64_t second = state.begin_log_stream(DeviceKey{Platform::IOS, "U1"});
    ATTEST_FALSE(first == second);

    ATTEST_FALSE(state.append_log_if_current(first, LogEntry::now(LogLevel::INFO, "old")));
    ATTEST_TRUE(state.append_log_if_current(second, LogEntry::now(LogLevel::INFO, "new")));

    state.end_log_stream();
    ATTEST_FALSE(state.append_log_if_current(second, LogEntry::now(LogLevel::INFO, "late")));
    ATTEST_EQUAL(state.logs.entries.size(), 1u);
}

REGISTER_TEST(snapshot_log_window_honours_scroll)
{
    AppState state;
    for (int i = 0; i < 10; ++i) {
        state.append_log(LogEntry::now(LogLevel::INFO, std::to_string(i)));
    }
    state.scroll_logs(2);

    AppSnapshot snap = state.snapshot(3);
    ATTEST_EQUAL(snap.visible_logs.size(), 3u);
    ATTEST_EQUAL(snap.visible_logs[0].message, "5");
    ATTEST_EQUAL(snap.visible_logs[2].message, "7");
    ATTEST_FALSE(snap.log_auto_scroll);
}

// =============================================================================
// Create Form Tests
// =============================================================================

REGISTER_TEST(create_form_placeholder_and_validation)
{
    CreateDeviceForm form(Platform::ANDROID);
    form.set_choices({{"pixel_4", "Pixel 4"}, {"pixel_tablet", "Pixel Tablet"}},
                     {{"33", "API 33 (Android 13)"}}, false);
    ATTEST_EQUAL(form.name(), "Pixel_4_API_33");

    // RAM field only takes digits
    form.next_field();
    form.next_field();
    form.next_field();
    ATTEST_TRUE(form.active_field() == FormField::RAM_SIZE);
    form.insert_char('a');
    ATTEST_EQUAL(form.ram_size(), "2048");

    form.next_field();
    form.next_field();
    ATTEST_TRUE(form.active_field() == FormField::NAME);
    form.insert_char('x');
    ATTEST_EQUAL(form.name(), "x");

    std::string error;
    std::optional<DeviceConfig> config = form.to_config(error);
    ATTEST_TRUE(config.has_value());
    ATTEST_EQUAL(config->device_type, "pixel_4");
    ATTEST_EQUAL(config->version, "33");

    form.backspace();
    ATTEST_FALSE(form.to_config(error).has_value());
    ATTEST_EQUAL(error, "Device name cannot be empty");
}

REGISTER_TEST(filter_device_types_by_category)
{
    std::vector<Choice> types = {
        {"pixel_4", "Pixel 4"},
        {"pixel_tablet", "Pixel Tablet"},
        {"wearos_large_round", "Wear OS Large Round"},
        {"tv_1080p", "Android TV (1080p)"}
    };

    ATTEST_EQUAL(filter_device_types(types, "all").size(), 4u);
    std::vector<Choice> phones = filter_device_types(types, "phone");
    ATTEST_EQUAL(phones.size(), 1u);
    ATTEST_EQUAL(phones[0].id, "pixel_4");
    ATTEST_EQUAL(filter_device_types(types, "tablet")[0].id, "pixel_tablet");
    ATTEST_EQUAL(filter_device_types(types, "wear").size(), 1u);
}

// =============================================================================
// Coordination Tests
// =============================================================================

REGISTER_TEST(selected_device_gets_single_log_stream)
{
    SteadyClock clock;
    auto android = std::make_shared<TaggedLogManager>(Platform::ANDROID, clock);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", true));
    android->set_log_interval(10ms);

    StateStore store(clock);
    DeviceCache cache(clock);
    TaskCoordinator coordinator(store, cache, DeviceBackends{android, nullptr}, fast_timings());

    std::vector<Device> devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(devices, error));
    store.apply_refresh(devices, std::nullopt);

    coordinator.on_selection_changed();
    coordinator.on_selection_changed();
    coordinator.start_log_stream(0ms);

    ATTEST_TRUE(wait_until([&store]() { return store.snapshot(100).total_logs >= 3; }));
    ATTEST_EQUAL(android->max_concurrent_log_streams(), 1);

    AppSnapshot snap = store.snapshot(100);
    ATTEST_TRUE(all_tagged(snap.visible_logs, "Pixel_A"));
    ATTEST_TRUE(snap.details.has_value());

    coordinator.shutdown();
    ATTEST_EQUAL(android->active_log_streams(), 0);
}

REGISTER_TEST(panel_switch_replaces_log_stream)
{
    SteadyClock clock;
    auto android = std::make_shared<TaggedLogManager>(Platform::ANDROID, clock);
    auto ios = std::make_shared<TaggedLogManager>(Platform::IOS, clock);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", true));
    ios->add_device(make_device(Platform::IOS, "UDID-B", true));
    android->set_log_interval(10ms);
    ios->set_log_interval(10ms);

    StateStore store(clock);
    DeviceCache cache(clock);
    TaskCoordinator coordinator(store, cache, DeviceBackends{android, ios}, fast_timings());

    std::vector<Device> android_devices;
    std::vector<Device> ios_devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(android_devices, error));
    ATTEST_TRUE(ios->list_devices(ios_devices, error));
    store.apply_refresh(android_devices, ios_devices);

    coordinator.on_selection_changed();
    ATTEST_TRUE(wait_until([&store]() { return store.snapshot(100).total_logs >= 2; }));

    store.switch_panel();
    coordinator.on_panel_switched();

    DeviceKey ios_key{Platform::IOS, "UDID-B"};
    ATTEST_TRUE(wait_until([&store, &ios_key]() {
        AppSnapshot snap = store.snapshot(100);
        return snap.log_device && *snap.log_device == ios_key && snap.total_logs >= 3;
    }));

    // The Android stream has been cancelled and nothing of it leaked over
    ATTEST_TRUE(wait_until([&android]() { return android->active_log_streams() == 0; }));
    AppSnapshot snap = store.snapshot(100);
    ATTEST_TRUE(all_tagged(snap.visible_logs, "UDID-B"));
    ATTEST_TRUE(snap.details.has_value());
    ATTEST_TRUE(snap.details->key == ios_key);

    coordinator.shutdown();
}

REGISTER_TEST(stopped_selection_ends_log_stream)
{
    SteadyClock clock;
    auto android = std::make_shared<TaggedLogManager>(Platform::ANDROID, clock);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", true));
    android->add_device(make_device(Platform::ANDROID, "Pixel_B", false));
    android->set_log_interval(10ms);

    StateStore store(clock);
    DeviceCache cache(clock);
    TaskCoordinator coordinator(store, cache, DeviceBackends{android, nullptr}, fast_timings());

    std::vector<Device> devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(devices, error));
    store.apply_refresh(devices, std::nullopt);

    coordinator.on_selection_changed();
    ATTEST_TRUE(wait_until([&store]() { return store.log_device().has_value(); }));

    store.move_selection(1);
    coordinator.on_selection_changed();
    ATTEST_FALSE(store.log_device().has_value());
    ATTEST_TRUE(wait_until([&android]() { return android->active_log_streams() == 0; }));

    coordinator.shutdown();
}

REGISTER_TEST(cache_load_fills_open_form)
{
    SteadyClock clock;
    auto android = std::make_shared<SimulatedDeviceManager>(Platform::ANDROID, clock);

    StateStore store(clock);
    DeviceCache cache(clock);
    TaskCoordinator coordinator(store, cache, DeviceBackends{android, nullptr}, fast_timings());

    ATTEST_TRUE(store.open_create_form());
    coordinator.load_cache(Platform::ANDROID, false);

    ATTEST_TRUE(wait_until([&cache]() { return cache.get(Platform::ANDROID).has_value(); }));
    ATTEST_TRUE(wait_until([&store]() {
        AppSnapshot snap = store.snapshot(0);
        return snap.form && snap.form->has_choices() && !snap.form->is_loading;
    }));

    // A second request is served from the cache
    coordinator.load_cache(Platform::ANDROID, false);
    coordinator.shutdown();
    ATTEST_EQUAL(android->call_count(Operation::DEVICE_TYPES), 1u);
}

REGISTER_TEST(failed_start_rolls_back_with_one_error)
{
    SteadyClock clock;
    auto android = std::make_shared<SimulatedDeviceManager>(Platform::ANDROID, clock, false);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", false));
    android->configure_failure(Operation::START, "emulator crashed");

    StateStore store(clock);
    DeviceCache cache(clock);
    DeviceBackends backends{android, nullptr};
    TaskCoordinator coordinator(store, cache, backends, fast_timings());
    DeviceActions actions(store, coordinator, backends);

    std::vector<Device> devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(devices, error));
    store.apply_refresh(devices, std::nullopt);

    actions.toggle_selected();
    ATTEST_TRUE(wait_until([&store]() { return store.notification_count() == 1; }));
    coordinator.shutdown();

    AppSnapshot snap = store.snapshot(0);
    ATTEST_EQUAL(snap.notifications.size(), 1u);
    ATTEST_TRUE(snap.notifications[0].type == NotificationType::ERROR);
    ATTEST_EQUAL(snap.notifications[0].message, "Failed to start device 'Pixel_A': emulator crashed");
    ATTEST_TRUE(snap.selected->status == DeviceStatus::STOPPED);
    ATTEST_FALSE(snap.pending_start.has_value());
    ATTEST_FALSE(snap.operation_status.has_value());
}

REGISTER_TEST(start_then_refresh_confirms_running)
{
    SteadyClock clock;
    auto android = std::make_shared<SimulatedDeviceManager>(Platform::ANDROID, clock, false);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", false));
    android->set_boot_time(0ms);

    StateStore store(clock);
    DeviceCache cache(clock);
    DeviceBackends backends{android, nullptr};
    TaskCoordinator coordinator(store, cache, backends, fast_timings());
    DeviceActions actions(store, coordinator, backends);

    std::vector<Device> devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(devices, error));
    store.apply_refresh(devices, std::nullopt);

    actions.toggle_selected();
    ATTEST_TRUE(store.selected_device()->status == DeviceStatus::STARTING);

    // The status check after the settle delay sees the booted device
    ATTEST_TRUE(wait_until([&store]() {
        std::optional<Device> d = store.selected_device();
        return d && d->is_running && !store.pending_start();
    }));
    coordinator.shutdown();

    AppSnapshot snap = store.snapshot(0);
    bool confirmed = false;
    for (const auto& n : snap.notifications) {
        if (n.message == "Device 'Pixel_A' is now running!") {
            confirmed = true;
        }
    }
    ATTEST_TRUE(confirmed);
    ATTEST_EQUAL(android->call_count(Operation::START), 1u);
}

REGISTER_TEST(delete_running_device_stops_first)
{
    SteadyClock clock;
    auto android = std::make_shared<SimulatedDeviceManager>(Platform::ANDROID, clock, false);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", true));

    StateStore store(clock);
    DeviceCache cache(clock);
    DeviceBackends backends{android, nullptr};
    TaskCoordinator coordinator(store, cache, backends, fast_timings());
    DeviceActions actions(store, coordinator, backends);

    std::vector<Device> devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(devices, error));
    store.apply_refresh(devices, std::nullopt);

    ATTEST_TRUE(store.open_confirm(Mode::CONFIRM_DELETE));
    actions.confirm_dialog(Mode::CONFIRM_DELETE);
    ATTEST_TRUE(store.devices(Platform::ANDROID).empty());

    ATTEST_TRUE(wait_until([&android]() { return android->call_count(Operation::DELETE) == 1; }));
    coordinator.shutdown();

    std::vector<std::string> ops = android->operations();
    ATTEST_EQUAL(ops.size(), 3u);
    ATTEST_EQUAL(ops[1], "stop:Pixel_A");
    ATTEST_EQUAL(ops[2], "delete:Pixel_A");
}

REGISTER_TEST(status_checks_run_for_each_platform)
{
    SteadyClock clock;
    auto android = std::make_shared<SimulatedDeviceManager>(Platform::ANDROID, clock, false);
    auto ios = std::make_shared<SimulatedDeviceManager>(Platform::IOS, clock, false);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", false));
    ios->add_device(make_device(Platform::IOS, "UDID-B", false));
    android->set_boot_time(0ms);
    ios->set_boot_time(0ms);

    TaskTimings timings = fast_timings();
    timings.settle_delay = 100ms;

    StateStore store(clock);
    DeviceCache cache(clock);
    DeviceBackends backends{android, ios};
    TaskCoordinator coordinator(store, cache, backends, timings);
    DeviceActions actions(store, coordinator, backends);

    std::vector<Device> android_devices;
    std::vector<Device> ios_devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(android_devices, error));
    ATTEST_TRUE(ios->list_devices(ios_devices, error));
    store.apply_refresh(android_devices, ios_devices);

    // Second start lands well inside the first one's settle delay
    actions.start_device(android_devices[0]);
    std::this_thread::sleep_for(20ms);
    actions.start_device(ios_devices[0]);

    DeviceKey android_key{Platform::ANDROID, "Pixel_A"};
    DeviceKey ios_key{Platform::IOS, "UDID-B"};
    ATTEST_TRUE(wait_until([&store, &android_key, &ios_key]() {
        std::optional<Device> a = store.find_device(android_key);
        std::optional<Device> b = store.find_device(ios_key);
        return a && a->is_running && b && b->is_running;
    }));
    coordinator.shutdown();

    ATTEST_EQUAL(android->call_count(Operation::LIST), 2u);
    ATTEST_EQUAL(ios->call_count(Operation::LIST), 2u);
    ATTEST_TRUE(store.find_device(android_key)->status == DeviceStatus::RUNNING);
}

REGISTER_TEST(detail_for_old_selection_is_discarded)
{
    SteadyClock clock;
    auto android = std::make_shared<SimulatedDeviceManager>(Platform::ANDROID, clock, false);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", false));
    android->add_device(make_device(Platform::ANDROID, "Pixel_B", false));
    android->configure_delay(Operation::DETAILS, 100ms);

    StateStore store(clock);
    DeviceCache cache(clock);
    TaskCoordinator coordinator(store, cache, DeviceBackends{android, nullptr}, fast_timings());

    std::vector<Device> devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(devices, error));
    store.apply_refresh(devices, std::nullopt);

    coordinator.schedule_detail_update(0ms);
    ATTEST_TRUE(wait_until([&android]() { return android->call_count(Operation::DETAILS) == 1; }));

    // Selection moves while the lookup for Pixel_A is still in flight
    store.move_selection(1);
    ATTEST_TRUE(wait_until([&coordinator]() { return coordinator.stale_writes() == 1; }));
    coordinator.shutdown();

    AppSnapshot snap = store.snapshot(0);
    ATTEST_TRUE(snap.details.has_value());
    ATTEST_EQUAL(snap.details->key.identity, "Pixel_B");
    ATTEST_FALSE(snap.details->ram_size.has_value());
}

REGISTER_TEST(superseded_log_stream_writes_are_refused)
{
    SteadyClock clock;
    auto android = std::make_shared<StubbornLogManager>(Platform::ANDROID, clock);
    auto ios = std::make_shared<TaggedLogManager>(Platform::IOS, clock);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", true));
    ios->add_device(make_device(Platform::IOS, "UDID-B", true));
    ios->set_log_interval(10ms);

    StateStore store(clock);
    DeviceCache cache(clock);
    TaskCoordinator coordinator(store, cache, DeviceBackends{android, ios}, fast_timings());

    std::vector<Device> android_devices;
    std::vector<Device> ios_devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(android_devices, error));
    ATTEST_TRUE(ios->list_devices(ios_devices, error));
    store.apply_refresh(android_devices, ios_devices);

    coordinator.on_selection_changed();
    ATTEST_TRUE(wait_until([&store]() { return store.snapshot(100).total_logs >= 2; }));
    ATTEST_EQUAL(coordinator.stale_writes(), 0u);

    store.switch_panel();
    coordinator.on_panel_switched();

    // The Android backend ignores cancellation; its next line is refused
    ATTEST_TRUE(wait_until([&coordinator]() { return coordinator.stale_writes() >= 1; }));
    ATTEST_TRUE(wait_until([&android]() { return android->finished.load(); }));

    DeviceKey ios_key{Platform::IOS, "UDID-B"};
    ATTEST_TRUE(wait_until([&store, &ios_key]() {
        AppSnapshot snap = store.snapshot(100);
        return snap.log_device && *snap.log_device == ios_key && snap.total_logs >= 2;
    }));
    AppSnapshot snap = store.snapshot(100);
    ATTEST_TRUE(all_tagged(snap.visible_logs, "UDID-B"));

    coordinator.shutdown();
}

REGISTER_TEST(failed_stop_rolls_back_with_one_error)
{
    SteadyClock clock;
    auto android = std::make_shared<SimulatedDeviceManager>(Platform::ANDROID, clock, false);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", true));
    android->configure_failure(Operation::STOP, "adb offline");

    StateStore store(clock);
    DeviceCache cache(clock);
    DeviceBackends backends{android, nullptr};
    TaskCoordinator coordinator(store, cache, backends, fast_timings());
    DeviceActions actions(store, coordinator, backends);

    std::vector<Device> devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(devices, error));
    store.apply_refresh(devices, std::nullopt);

    actions.toggle_selected();
    ATTEST_TRUE(store.selected_device()->status == DeviceStatus::STOPPING);
    ATTEST_TRUE(wait_until([&store]() { return store.notification_count() == 1; }));
    std::this_thread::sleep_for(20ms);
    coordinator.shutdown();

    AppSnapshot snap = store.snapshot(0);
    ATTEST_EQUAL(snap.notifications.size(), 1u);
    ATTEST_TRUE(snap.notifications[0].type == NotificationType::ERROR);
    ATTEST_EQUAL(snap.notifications[0].message, "Failed to stop device 'Pixel_A': adb offline");
    ATTEST_TRUE(snap.selected->status == DeviceStatus::RUNNING);
    ATTEST_TRUE(snap.selected->is_running);
    ATTEST_FALSE(snap.operation_status.has_value());
}

REGISTER_TEST(failed_delete_restores_original_position)
{
    SteadyClock clock;
    auto android = std::make_shared<SimulatedDeviceManager>(Platform::ANDROID, clock, false);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", false));
    android->add_device(make_device(Platform::ANDROID, "Pixel_B", false));
    android->add_device(make_device(Platform::ANDROID, "Pixel_C", false));
    android->configure_failure(Operation::DELETE, "avd locked");

    StateStore store(clock);
    DeviceCache cache(clock);
    DeviceBackends backends{android, nullptr};
    TaskCoordinator coordinator(store, cache, backends, fast_timings());
    DeviceActions actions(store, coordinator, backends);

    std::vector<Device> devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(devices, error));
    store.apply_refresh(devices, std::nullopt);
    store.move_selection(1);

    ATTEST_TRUE(store.open_confirm(Mode::CONFIRM_DELETE));
    actions.confirm_dialog(Mode::CONFIRM_DELETE);
    ATTEST_TRUE(wait_until([&store]() { return store.notification_count() == 1; }));
    std::this_thread::sleep_for(20ms);
    coordinator.shutdown();

    std::vector<Device> after = store.devices(Platform::ANDROID);
    ATTEST_EQUAL(after.size(), 3u);
    ATTEST_EQUAL(after[0].identity, "Pixel_A");
    ATTEST_EQUAL(after[1].identity, "Pixel_B");
    ATTEST_EQUAL(after[2].identity, "Pixel_C");

    AppSnapshot snap = store.snapshot(0);
    ATTEST_EQUAL(snap.notifications.size(), 1u);
    ATTEST_TRUE(snap.notifications[0].type == NotificationType::ERROR);
    ATTEST_EQUAL(snap.notifications[0].message, "Failed to delete device 'Pixel_B': avd locked");
}

REGISTER_TEST(failed_wipe_reports_one_error)
{
    SteadyClock clock;
    auto android = std::make_shared<SimulatedDeviceManager>(Platform::ANDROID, clock, false);
    android->add_device(make_device(Platform::ANDROID, "Pixel_A", true));

    StateStore store(clock);
    DeviceCache cache(clock);
    DeviceBackends backends{android, nullptr};
    TaskCoordinator coordinator(store, cache, backends, fast_timings());
    DeviceActions actions(store, coordinator, backends);

    std::vector<Device> devices;
    std::string error;
    ATTEST_TRUE(android->list_devices(devices, error));
    store.apply_refresh(devices, std::nullopt);

    ATTEST_TRUE(store.open_confirm(Mode::CONFIRM_WIPE));
    actions.confirm_dialog(Mode::CONFIRM_WIPE);
    ATTEST_TRUE(wait_until([&store]() { return store.notification_count() == 1; }));
    std::this_thread::sleep_for(20ms);
    coordinator.shutdown();

    AppSnapshot snap = store.snapshot(0);
    ATTEST_EQUAL(snap.notifications.size(), 1u);
    ATTEST_TRUE(snap.notifications[0].type == NotificationType::ERROR);
    ATTEST_EQUAL(snap.notifications[0].message,
                 "Failed to wipe device 'Pixel_A': Device 'Pixel_A' must be stopped before wiping");
    ATTEST_FALSE(snap.operation_status.has_value());
    ATTEST_TRUE(snap.selected->is_running);
    ATTEST_TRUE(store.mode() == Mode::NORMAL);
}
