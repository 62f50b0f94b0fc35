// Tickwise Simulation
// delayed_action.hpp - One-shot or repeating timed callback

#pragma once

#include <cstdint>
#include <functional>
#include <tickwise/scheduling/timed_entity.hpp>

namespace tickwise::scheduling {
class Scheduler;
}

namespace tickwise::sim {

// Fires a callback after a delay, optionally repeating with a fixed period,
// and unschedules itself after the last firing. The scheduler is passed in
// explicitly and must outlive the action.
class DelayedAction : public scheduling::TimedEntity {
public:
    using Callback = std::function<void()>;

    // Throws std::invalid_argument for a negative or non-finite delay, a zero
    // repeat count, or a non-positive period when repeat_count > 1
    DelayedAction(scheduling::Scheduler& scheduler, double delay, Callback callback, uint32_t repeat_count = 1,
                  double period = 0.0);
    ~DelayedAction() override;

    DelayedAction(const DelayedAction&) = delete;
    DelayedAction& operator=(const DelayedAction&) = delete;

    [[nodiscard]] double get_wait_time() const override { return wait_time_; }
    void set_wait_time(double wait_time) override { wait_time_ = wait_time; }

    void update() override;

    // Add to / remove from the scheduler
    bool start();
    bool cancel();

    [[nodiscard]] uint32_t get_fire_count() const { return fire_count_; }
    [[nodiscard]] uint32_t get_repeat_count() const { return repeat_count_; }
    [[nodiscard]] bool is_finished() const { return fire_count_ >= repeat_count_; }

private:
    scheduling::Scheduler& scheduler_;
    Callback callback_;
    double wait_time_;
    double period_;
    uint32_t repeat_count_;
    uint32_t fire_count_ = 0;
};

}  // namespace tickwise::sim
