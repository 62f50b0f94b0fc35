// Tickwise Scheduling
// timed_entity.hpp - Interface for anything the scheduler activates

#pragma once

namespace tickwise::scheduling {

// Something that acts every once in a while.
//
// The wait time is the number of logical ticks left before the next
// update(). The scheduler decrements it as the virtual clock advances;
// update() must leave it strictly greater than it was on entry, otherwise
// the scheduler bumps it to (entry value + 1).
class TimedEntity {
public:
    virtual ~TimedEntity() = default;

    [[nodiscard]] virtual double get_wait_time() const = 0;
    virtual void set_wait_time(double wait_time) = 0;

    // Act, then schedule the next activation by raising the wait time
    virtual void update() = 0;

protected:
    TimedEntity() = default;
    TimedEntity(const TimedEntity&) = default;
    TimedEntity& operator=(const TimedEntity&) = default;
};

}  // namespace tickwise::scheduling
