// Tickwise Simulation
// delayed_action.cpp - One-shot or repeating timed callback implementation

#include <cmath>
#include <stdexcept>
#include <string>
#include <tickwise/core/logger.hpp>
#include <tickwise/scheduling/scheduler.hpp>
#include <tickwise/sim/delayed_action.hpp>

namespace tickwise::sim {

DelayedAction::DelayedAction(scheduling::Scheduler& scheduler, double delay, Callback callback,
                             uint32_t repeat_count, double period)
    : scheduler_(scheduler), callback_(std::move(callback)), wait_time_(delay), period_(period),
      repeat_count_(repeat_count) {
    if (!std::isfinite(delay) || delay < 0.0) {
        throw std::invalid_argument("DelayedAction delay must be finite and non-negative, got " +
                                    std::to_string(delay));
    }
    if (repeat_count == 0) {
        throw std::invalid_argument("DelayedAction repeat count must be at least 1");
    }
    if (repeat_count > 1 && (!std::isfinite(period) || period <= 0.0)) {
        throw std::invalid_argument("DelayedAction period must be finite and positive when repeating, got " +
                                    std::to_string(period));
    }
}

DelayedAction::~DelayedAction() {
    // Never leave a dangling pointer behind in the scheduler
    scheduler_.remove(this);
}

void DelayedAction::update() {
    ++fire_count_;
    TICKWISE_LOG_TRACE(core::log_category::SIM, "Delayed action {} fired ({}/{})", static_cast<const void*>(this),
                       fire_count_, repeat_count_);

    if (callback_) {
        callback_();
    }

    if (is_finished()) {
        scheduler_.remove(this);
        return;
    }
    wait_time_ += period_;
}

bool DelayedAction::start() {
    if (is_finished()) {
        return false;
    }
    return scheduler_.add(this);
}

bool DelayedAction::cancel() {
    return scheduler_.remove(this);
}

}  // namespace tickwise::sim
