// Tickwise Scheduling
// scheduler.hpp - Cooperative turn scheduler over timed entities

#pragma once

#include <cstdint>
#include <span>
#include <tickwise/scheduling/binary_heap.hpp>
#include <tickwise/scheduling/timed_entity.hpp>
#include <unordered_set>
#include <vector>

namespace tickwise::core {
class Config;
}

namespace tickwise::scheduling {

// ============================================================================
// Scheduler Configuration
// ============================================================================

struct SchedulerConfig {
    bool start_paused = false;
    bool log_activations = false;  // Trace-level line per update() call

    // Read the "scheduler" section, falling back to the defaults above
    [[nodiscard]] static SchedulerConfig from_config(const core::Config& config);
};

// ============================================================================
// Scheduler Statistics
// ============================================================================

struct SchedulerStats {
    uint64_t runs = 0;                  // run() calls that did something
    uint64_t activations = 0;           // update() calls
    uint64_t deadlock_corrections = 0;  // Wait times forced to (old + 1)
    uint64_t rejected_entities = 0;     // Null, non-finite or duplicate adds
};

// ============================================================================
// Scheduler
// ============================================================================

// Decides which entity acts next and advances the virtual clock.
//
// Each run() subtracts the smallest pending wait time from every entity,
// then updates every entity that reached zero or below. The scheduler does
// not own its entities; callers keep them alive while they are scheduled.
//
// Not thread-safe. run() must not be called from inside update().
class Scheduler {
public:
    explicit Scheduler(const SchedulerConfig& config = {});
    ~Scheduler();

    // Non-copyable, non-movable (entities may hold a reference to us)
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    // ========================================================================
    // Membership
    // ========================================================================

    // Schedule an entity. Rejects null, non-finite wait times and entities
    // that are already scheduled. An entity that already acted in the current
    // run() is held back until the next one.
    bool add(TimedEntity* entity);

    // Returns the number of entities accepted
    size_t add_all(std::span<TimedEntity* const> entities);

    // Unschedule an entity. Safe from inside update(), including on the
    // entity currently being updated. False if it was not scheduled.
    bool remove(TimedEntity* entity);

    // Drop every entity and reset the clock and statistics
    void clear();

    [[nodiscard]] bool contains(TimedEntity* entity) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    // Entity that would act first, nullptr when empty
    [[nodiscard]] TimedEntity* peek_next() const;

    // ========================================================================
    // Pause State
    // ========================================================================

    void pause();
    void resume();
    [[nodiscard]] bool is_paused() const { return paused_; }

    // ========================================================================
    // Stepping
    // ========================================================================

    // Advance the clock to the next activation and update every entity due.
    // No-op while paused or empty. Exceptions from update() propagate after
    // the already-popped entities are put back.
    void run();

    [[nodiscard]] bool is_running() const { return running_; }

    // Sum of every elapsed amount consumed by run()
    [[nodiscard]] double get_virtual_time() const { return virtual_time_; }

    [[nodiscard]] const SchedulerStats& get_stats() const { return stats_; }

private:
    [[nodiscard]] bool is_pending(TimedEntity* entity) const;
    void activate(TimedEntity* entity);
    void reinsert_pending();

    BinaryHeap<TimedEntity*> entities_;
    std::vector<TimedEntity*> pending_;  // Popped during run(), awaiting reinsertion
    std::unordered_set<TimedEntity*> activated_;  // Updated in the current run()
    SchedulerConfig config_;
    SchedulerStats stats_;
    double virtual_time_ = 0.0;
    bool paused_ = false;
    bool running_ = false;
};

}  // namespace tickwise::scheduling
