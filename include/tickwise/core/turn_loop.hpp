// Tickwise Core
// turn_loop.hpp - Turn driver that steps a scheduler

#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace tickwise::scheduling {
class Scheduler;
}

namespace tickwise::core {

// Called around every scheduler step with the 1-based turn number
using TurnCallback = std::function<void(uint64_t turn)>;

struct TurnLoopConfig {
    uint64_t max_turns = 0;        // 0 = unlimited
    bool stop_when_empty = true;   // Exit once nothing is scheduled
};

// Drives a scheduler one run() per turn. The scheduler is borrowed and must
// outlive the loop.
class TurnLoop {
public:
    explicit TurnLoop(scheduling::Scheduler& scheduler);
    ~TurnLoop();

    // Non-copyable, non-movable
    TurnLoop(const TurnLoop&) = delete;
    TurnLoop& operator=(const TurnLoop&) = delete;
    TurnLoop(TurnLoop&&) = delete;
    TurnLoop& operator=(TurnLoop&&) = delete;

    void configure(const TurnLoopConfig& config);
    [[nodiscard]] const TurnLoopConfig& get_config() const;

    void set_pre_turn(TurnCallback callback);
    void set_post_turn(TurnCallback callback);

    // One turn: pre-turn callback, scheduler.run(), post-turn callback.
    // Returns false (and does nothing) once the loop should exit.
    bool run_turn();

    // Run turns until an exit condition is met, returns turns executed
    uint64_t run();

    void request_exit();

    // Exit requested, turn limit reached, scheduler empty (when configured),
    // or scheduler paused with no turn limit
    [[nodiscard]] bool should_exit() const;

    [[nodiscard]] uint64_t get_turn_count() const;

    // Delegates to the scheduler
    void set_paused(bool paused);
    [[nodiscard]] bool is_paused() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tickwise::core
