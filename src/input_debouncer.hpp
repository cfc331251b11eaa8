/*
 * input_debouncer.hpp - Input batching for the render loop
 *
 * Key repeat can deliver navigation keys far faster than it makes sense to
 * move the selection (each move restarts detail and log tasks). The
 * debouncer accepts at most one navigation move per spacing interval and
 * folds everything in between into a pending delta, so no requested
 * movement is lost. Other keys always pass through; a pending delta is
 * flushed right before them so they act on the device the user moved to.
 *
 * drain() reads up to a per-frame cap of events within a time budget,
 * applying each resulting action before classifying the next key (an
 * action may change the mode, and with it what counts as navigation). It
 * reports whether more input is waiting, in which case the caller should
 * skip its frame wait.
 */

#pragma once

#include "clock.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

struct DebounceConfig {
    size_t max_events_per_frame = 5;
    std::chrono::milliseconds nav_spacing{30};
    std::chrono::milliseconds frame_budget{5};
    bool coalesce_navigation = true;
};

struct InputAction {
    enum class Kind { KEY, MOVE };

    Kind kind = Kind::KEY;
    int key = 0;    // KEY: the raw key code
    int delta = 0;  // MOVE: net selection displacement

    static InputAction make_key(int key) { return InputAction{Kind::KEY, key, 0}; }
    static InputAction make_move(int delta) { return InputAction{Kind::MOVE, 0, delta}; }
};

class InputSource {
public:
    static constexpr int NO_KEY = -1;

    virtual ~InputSource() = default;

    // Next queued key, or NO_KEY without blocking
    virtual int read_key() = 0;
    virtual bool has_pending() = 0;
};

// Maps a key to its navigation delta (-1 up, +1 down) or 0 for other keys
using NavigationClassifier = std::function<int(int key)>;
using ActionHandler = std::function<void(const InputAction&)>;

struct DrainResult {
    size_t processed = 0;
    size_t applied = 0;
    bool more_pending = false;
};

class InputDebouncer {
public:
    InputDebouncer(DebounceConfig config, const Clock& clock);

    // Feeds one classified event; appends the resulting actions to out
    void feed(int key, int nav_delta, std::vector<InputAction>& out);

    // Emits the pending delta if the spacing interval has elapsed
    std::optional<InputAction> flush();

    DrainResult drain(InputSource& source, const NavigationClassifier& classify, const ActionHandler& apply);

    int pending_delta() const { return pending_delta_; }
    int last_direction() const { return last_direction_; }
    size_t skipped_events() const { return skipped_; }
    const DebounceConfig& config() const { return config_; }

private:
    DebounceConfig config_;
    const Clock& clock_;

    std::optional<Clock::time_point> last_accepted_;
    int pending_delta_ = 0;
    int last_direction_ = 0;
    size_t skipped_ = 0;

    bool spacing_elapsed(Clock::time_point now) const;
    InputAction take_pending(Clock::time_point now);
};
