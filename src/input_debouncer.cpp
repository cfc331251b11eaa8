/*
 * input_debouncer.cpp - Input batching implementation
 */

#include "input_debouncer.hpp"

InputDebouncer::InputDebouncer(DebounceConfig config, const Clock& clock)
    : config_(config), clock_(clock) {
    if (config_.max_events_per_frame == 0) {
        config_.max_events_per_frame = 1;
    }
}

bool InputDebouncer::spacing_elapsed(Clock::time_point now) const {
    if (!last_accepted_) {
        return true;
    }
    return now - *last_accepted_ >= config_.nav_spacing;
}

InputAction InputDebouncer::take_pending(Clock::time_point now) {
    InputAction action = InputAction::make_move(pending_delta_);
    pending_delta_ = 0;
    last_accepted_ = now;
    return action;
}

void InputDebouncer::feed(int key, int nav_delta, std::vector<InputAction>& out) {
    Clock::time_point now = clock_.now();

    if (nav_delta == 0) {
        if (pending_delta_ != 0) {
            out.push_back(take_pending(now));
        }
        out.push_back(InputAction::make_key(key));
        return;
    }

    last_direction_ = nav_delta > 0 ? 1 : -1;

    if (spacing_elapsed(now)) {
        pending_delta_ += nav_delta;
        if (pending_delta_ != 0) {
            out.push_back(take_pending(now));
        } else {
            // Opposite moves cancelled out; nothing to apply
            last_accepted_ = now;
        }
        return;
    }

    skipped_++;
    if (config_.coalesce_navigation) {
        pending_delta_ += nav_delta;
    }
}

std::optional<InputAction> InputDebouncer::flush() {
    if (pending_delta_ == 0) {
        return std::nullopt;
    }

    Clock::time_point now = clock_.now();
    if (!spacing_elapsed(now)) {
        return std::nullopt;
    }
    return take_pending(now);
}

DrainResult InputDebouncer::drain(InputSource& source, const NavigationClassifier& classify,
                                  const ActionHandler& apply) {
    DrainResult result;
    Clock::time_point start = clock_.now();
    bool stopped_early = false;
    std::vector<InputAction> actions;

    while (true) {
        if (result.processed >= config_.max_events_per_frame ||
            clock_.now() - start >= config_.frame_budget) {
            stopped_early = true;
            break;
        }

        int key = source.read_key();
        if (key == InputSource::NO_KEY) {
            break;
        }

        result.processed++;
        actions.clear();
        feed(key, classify ? classify(key) : 0, actions);
        for (const auto& action : actions) {
            apply(action);
            result.applied++;
        }
    }

    if (std::optional<InputAction> pending = flush()) {
        apply(*pending);
        result.applied++;
    }

    result.more_pending = stopped_early && source.has_pending();
    return result;
}
