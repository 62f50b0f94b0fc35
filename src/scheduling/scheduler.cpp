// Tickwise Scheduling
// scheduler.cpp - Cooperative turn scheduler implementation

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <tickwise/core/config.hpp>
#include <tickwise/core/logger.hpp>
#include <tickwise/scheduling/scheduler.hpp>

namespace tickwise::scheduling {

namespace {

double read_wait_time(TimedEntity* const& entity) {
    return entity->get_wait_time();
}

}  // namespace

SchedulerConfig SchedulerConfig::from_config(const core::Config& config) {
    SchedulerConfig result;
    result.start_paused =
        config.get_bool(core::config_section::SCHEDULER, core::config_key::START_PAUSED, result.start_paused);
    result.log_activations =
        config.get_bool(core::config_section::SCHEDULER, core::config_key::LOG_ACTIVATIONS, result.log_activations);
    return result;
}

Scheduler::Scheduler(const SchedulerConfig& config)
    : entities_(read_wait_time), config_(config), paused_(config.start_paused) {}

Scheduler::~Scheduler() = default;

// ============================================================================
// Membership
// ============================================================================

bool Scheduler::add(TimedEntity* entity) {
    if (entity == nullptr) {
        TICKWISE_LOG_WARN(core::log_category::SCHEDULER, "Rejected null entity");
        ++stats_.rejected_entities;
        return false;
    }

    const double wait_time = entity->get_wait_time();
    if (!std::isfinite(wait_time)) {
        TICKWISE_LOG_WARN(core::log_category::SCHEDULER, "Rejected entity {} with non-finite wait time {}",
                          static_cast<const void*>(entity), wait_time);
        ++stats_.rejected_entities;
        return false;
    }

    if (contains(entity)) {
        TICKWISE_LOG_WARN(core::log_category::SCHEDULER, "Entity {} is already scheduled",
                          static_cast<const void*>(entity));
        ++stats_.rejected_entities;
        return false;
    }

    // Re-added after acting in this pass: it waits for the next run()
    if (running_ && activated_.contains(entity)) {
        pending_.push_back(entity);
        return true;
    }

    return entities_.push(entity);
}

size_t Scheduler::add_all(std::span<TimedEntity* const> entities) {
    std::vector<TimedEntity*> accepted;
    accepted.reserve(entities.size());
    const uint64_t rejected_before = stats_.rejected_entities;
    size_t held_back = 0;

    for (TimedEntity* entity : entities) {
        if (entity == nullptr || !std::isfinite(entity->get_wait_time()) || contains(entity) ||
            std::find(accepted.begin(), accepted.end(), entity) != accepted.end()) {
            ++stats_.rejected_entities;
            continue;
        }
        if (running_ && activated_.contains(entity)) {
            pending_.push_back(entity);
            ++held_back;
            continue;
        }
        accepted.push_back(entity);
    }

    const size_t rejected = stats_.rejected_entities - rejected_before;
    if (rejected > 0) {
        TICKWISE_LOG_WARN(core::log_category::SCHEDULER, "add_all rejected {} of {} entities", rejected,
                          entities.size());
    }

    return held_back + entities_.push_all(accepted);
}

bool Scheduler::remove(TimedEntity* entity) {
    if (entities_.remove(entity)) {
        return true;
    }

    // Already popped by the current run(): drop it so it is not reinserted
    auto it = std::find(pending_.begin(), pending_.end(), entity);
    if (it != pending_.end()) {
        pending_.erase(it);
        return true;
    }
    return false;
}

void Scheduler::clear() {
    entities_.clear();
    pending_.clear();
    stats_ = {};
    virtual_time_ = 0.0;
}

bool Scheduler::contains(TimedEntity* entity) const {
    return entities_.contains(entity) || is_pending(entity);
}

size_t Scheduler::size() const {
    return entities_.size() + pending_.size();
}

bool Scheduler::empty() const {
    return size() == 0;
}

TimedEntity* Scheduler::peek_next() const {
    return entities_.peek().value_or(nullptr);
}

// ============================================================================
// Pause State
// ============================================================================

void Scheduler::pause() {
    paused_ = true;
    TICKWISE_LOG_DEBUG(core::log_category::SCHEDULER, "Scheduler paused");
}

void Scheduler::resume() {
    paused_ = false;
    TICKWISE_LOG_DEBUG(core::log_category::SCHEDULER, "Scheduler resumed");
}

// ============================================================================
// Stepping
// ============================================================================

void Scheduler::run() {
    if (running_) {
        TICKWISE_LOG_ERROR(core::log_category::SCHEDULER, "run() called from inside an update(), ignored");
        return;
    }
    if (paused_ || entities_.empty()) {
        return;
    }

    running_ = true;
    ++stats_.runs;

    // Advance the clock: every entity loses the smallest wait time at once
    const double elapsed = read_wait_time(*entities_.peek());
    if (elapsed > 0.0) {
        for (size_t i = 0, count = entities_.size(); i < count; ++i) {
            TimedEntity* entity = entities_.peek(i);
            entity->set_wait_time(entity->get_wait_time() - elapsed);
        }
        virtual_time_ += elapsed;
    }

    try {
        while (auto next = entities_.peek()) {
            TimedEntity* entity = *next;
            if (entity->get_wait_time() > 0.0) {
                break;
            }
            entities_.pop();
            activate(entity);
        }
    } catch (...) {
        reinsert_pending();
        activated_.clear();
        running_ = false;
        throw;
    }

    reinsert_pending();
    activated_.clear();
    running_ = false;
}

bool Scheduler::is_pending(TimedEntity* entity) const {
    return std::find(pending_.begin(), pending_.end(), entity) != pending_.end();
}

void Scheduler::activate(TimedEntity* entity) {
    pending_.push_back(entity);
    activated_.insert(entity);
    ++stats_.activations;

    const double old_wait_time = entity->get_wait_time();

    auto enforce_progress = [&]() {
        // update() may have removed the entity (or cleared the scheduler).
        // A remove() followed by add() leaves it pending again.
        if (!is_pending(entity)) {
            return;
        }
        const double new_wait_time = entity->get_wait_time();
        if (!std::isfinite(new_wait_time) || !(new_wait_time > old_wait_time)) {
            entity->set_wait_time(old_wait_time + 1.0);
            ++stats_.deadlock_corrections;
            TICKWISE_LOG_DEBUG(core::log_category::SCHEDULER,
                               "Entity {} did not advance its wait time ({} -> {}), forced to {}",
                               static_cast<const void*>(entity), old_wait_time, new_wait_time, old_wait_time + 1.0);
        }
    };

    if (config_.log_activations) {
        TICKWISE_LOG_TRACE(core::log_category::SCHEDULER, "Activating entity {} at t={}",
                           static_cast<const void*>(entity), virtual_time_);
    }

    try {
        entity->update();
    } catch (...) {
        enforce_progress();
        throw;
    }
    enforce_progress();
}

void Scheduler::reinsert_pending() {
    if (pending_.empty()) {
        return;
    }

    const size_t reinserted = entities_.push_all(pending_);
    if (reinserted != pending_.size()) {
        TICKWISE_LOG_ERROR(core::log_category::SCHEDULER, "Lost {} entities while reinserting after run()",
                           pending_.size() - reinserted);
    }
    pending_.clear();
}

}  // namespace tickwise::scheduling
