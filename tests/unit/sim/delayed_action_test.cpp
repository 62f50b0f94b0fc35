// Tickwise Unit Tests
// delayed_action_test.cpp - Tests for timed callbacks

#include <gtest/gtest.h>

#include <stdexcept>
#include <tickwise/scheduling/scheduler.hpp>
#include <tickwise/sim/actor.hpp>
#include <tickwise/sim/delayed_action.hpp>

namespace tickwise::sim {
namespace {

class DelayedActionTest : public ::testing::Test {
protected:
    scheduling::Scheduler scheduler_;
};

TEST_F(DelayedActionTest, FiresOnceAfterDelayThenRetires) {
    int fired = 0;
    double fired_at = -1.0;
    DelayedAction action(scheduler_, 3.0, [&]() {
        ++fired;
        fired_at = scheduler_.get_virtual_time();
    });

    EXPECT_TRUE(action.start());
    scheduler_.run();

    EXPECT_EQ(fired, 1);
    EXPECT_DOUBLE_EQ(fired_at, 3.0);
    EXPECT_TRUE(action.is_finished());
    EXPECT_TRUE(scheduler_.empty());
    EXPECT_EQ(scheduler_.get_stats().deadlock_corrections, 0u);
}

TEST_F(DelayedActionTest, RepeatsWithPeriod) {
    int fired = 0;
    DelayedAction action(scheduler_, 1.0, [&]() { ++fired; }, 3, 2.0);
    action.start();

    for (int i = 0; i < 10; ++i) {
        scheduler_.run();
    }

    EXPECT_EQ(fired, 3);
    EXPECT_EQ(action.get_fire_count(), 3u);
    EXPECT_TRUE(scheduler_.empty());
    EXPECT_DOUBLE_EQ(scheduler_.get_virtual_time(), 5.0);
}

TEST_F(DelayedActionTest, CancelPreventsFiring) {
    int fired = 0;
    DelayedAction action(scheduler_, 2.0, [&]() { ++fired; });
    action.start();

    EXPECT_TRUE(action.cancel());
    EXPECT_FALSE(action.cancel());
    scheduler_.run();

    EXPECT_EQ(fired, 0);
}

TEST_F(DelayedActionTest, FinishedActionCannotRestart) {
    DelayedAction action(scheduler_, 0.0, nullptr);
    action.start();
    scheduler_.run();

    EXPECT_TRUE(action.is_finished());
    EXPECT_FALSE(action.start());
}

TEST_F(DelayedActionTest, DestructorUnschedules) {
    {
        DelayedAction action(scheduler_, 5.0, nullptr);
        action.start();
        EXPECT_EQ(scheduler_.size(), 1u);
    }
    EXPECT_TRUE(scheduler_.empty());
}

TEST_F(DelayedActionTest, CanSpawnAndRetireActors) {
    Actor veteran("veteran", 1.0);
    Actor recruit("recruit", 2.0);
    scheduler_.add(&veteran);

    DelayedAction swap(scheduler_, 2.0, [&]() {
        scheduler_.add(&recruit);
        scheduler_.remove(&veteran);
    });
    swap.start();

    while (scheduler_.get_virtual_time() < 4.0) {
        scheduler_.run();
    }

    EXPECT_FALSE(scheduler_.contains(&veteran));
    EXPECT_TRUE(scheduler_.contains(&recruit));
    EXPECT_GT(recruit.get_turn_count(), 0u);
    EXPECT_LE(veteran.get_turn_count(), 3u);

    scheduler_.clear();
}

TEST_F(DelayedActionTest, RejectsInvalidArguments) {
    EXPECT_THROW(DelayedAction(scheduler_, -1.0, nullptr), std::invalid_argument);
    EXPECT_THROW(DelayedAction(scheduler_, 1.0, nullptr, 0), std::invalid_argument);
    EXPECT_THROW(DelayedAction(scheduler_, 1.0, nullptr, 2, 0.0), std::invalid_argument);
}

}  // namespace
}  // namespace tickwise::sim
