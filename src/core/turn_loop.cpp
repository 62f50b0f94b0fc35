// Tickwise Core
// turn_loop.cpp - Turn driver implementation

#include <string>
#include <tickwise/core/logger.hpp>
#include <tickwise/core/turn_loop.hpp>
#include <tickwise/scheduling/scheduler.hpp>

namespace tickwise::core {

struct TurnLoop::Impl {
    explicit Impl(scheduling::Scheduler& s) : scheduler(s) {}

    scheduling::Scheduler& scheduler;
    TurnLoopConfig config;

    TurnCallback pre_turn_callback;
    TurnCallback post_turn_callback;

    uint64_t turn_count = 0;
    bool exit_requested = false;

    [[nodiscard]] bool limit_reached() const {
        if (config.max_turns > 0 && turn_count >= config.max_turns) {
            return true;
        }
        // Without a turn limit a paused scheduler would never let the loop end
        if (config.max_turns == 0 && scheduler.is_paused()) {
            return true;
        }
        return config.stop_when_empty && scheduler.empty();
    }
};

TurnLoop::TurnLoop(scheduling::Scheduler& scheduler) : impl_(std::make_unique<Impl>(scheduler)) {}

TurnLoop::~TurnLoop() = default;

void TurnLoop::configure(const TurnLoopConfig& config) {
    impl_->config = config;

    TICKWISE_LOG_INFO(log_category::ENGINE, "Turn loop configured: max_turns={}, stop_when_empty={}",
                      config.max_turns > 0 ? std::to_string(config.max_turns) : "unlimited",
                      config.stop_when_empty);
}

const TurnLoopConfig& TurnLoop::get_config() const {
    return impl_->config;
}

void TurnLoop::set_pre_turn(TurnCallback callback) {
    impl_->pre_turn_callback = std::move(callback);
}

void TurnLoop::set_post_turn(TurnCallback callback) {
    impl_->post_turn_callback = std::move(callback);
}

bool TurnLoop::run_turn() {
    if (should_exit()) {
        return false;
    }

    const uint64_t turn = ++impl_->turn_count;

    if (impl_->pre_turn_callback) {
        impl_->pre_turn_callback(turn);
    }

    impl_->scheduler.run();

    if (impl_->post_turn_callback) {
        impl_->post_turn_callback(turn);
    }
    return true;
}

uint64_t TurnLoop::run() {
    if (impl_->config.max_turns == 0 && impl_->scheduler.is_paused()) {
        TICKWISE_LOG_WARN(log_category::ENGINE, "Refusing to run an unlimited turn loop on a paused scheduler");
        return 0;
    }

    const uint64_t start = impl_->turn_count;
    while (run_turn()) {
    }

    if (impl_->config.max_turns == 0 && impl_->scheduler.is_paused()) {
        TICKWISE_LOG_WARN(log_category::ENGINE, "Scheduler paused during an unlimited turn loop, stopping");
    }

    const uint64_t executed = impl_->turn_count - start;
    TICKWISE_LOG_INFO(log_category::ENGINE, "Turn loop stopped after {} turns (virtual time {})", executed,
                      impl_->scheduler.get_virtual_time());
    return executed;
}

void TurnLoop::request_exit() {
    impl_->exit_requested = true;
}

bool TurnLoop::should_exit() const {
    return impl_->exit_requested || impl_->limit_reached();
}

uint64_t TurnLoop::get_turn_count() const {
    return impl_->turn_count;
}

void TurnLoop::set_paused(bool paused) {
    if (paused) {
        impl_->scheduler.pause();
    } else {
        impl_->scheduler.resume();
    }
}

bool TurnLoop::is_paused() const {
    return impl_->scheduler.is_paused();
}

}  // namespace tickwise::core
