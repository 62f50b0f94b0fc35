// Tickwise Unit Tests
// turn_loop_test.cpp - Tests for the turn driver

#include <gtest/gtest.h>

#include <tickwise/core/turn_loop.hpp>
#include <tickwise/scheduling/scheduler.hpp>
#include <tickwise/sim/actor.hpp>
#include <vector>

namespace tickwise::core {
namespace {

class TurnLoopTest : public ::testing::Test {
protected:
    void TearDown() override { scheduler_.clear(); }

    sim::Actor actor_{"hero", 1.0};
    scheduling::Scheduler scheduler_;
};

TEST_F(TurnLoopTest, RunTurnStepsSchedulerOnce) {
    scheduler_.add(&actor_);
    TurnLoop loop(scheduler_);
    loop.configure(TurnLoopConfig{});

    EXPECT_TRUE(loop.run_turn());
    EXPECT_EQ(loop.get_turn_count(), 1u);
    EXPECT_EQ(actor_.get_turn_count(), 1u);
    EXPECT_EQ(scheduler_.get_stats().runs, 1u);
}

TEST_F(TurnLoopTest, StopsAtMaxTurns) {
    scheduler_.add(&actor_);
    TurnLoop loop(scheduler_);
    TurnLoopConfig config;
    config.max_turns = 5;
    loop.configure(config);

    EXPECT_EQ(loop.run(), 5u);
    EXPECT_EQ(actor_.get_turn_count(), 5u);
    EXPECT_TRUE(loop.should_exit());
    EXPECT_FALSE(loop.run_turn());
}

TEST_F(TurnLoopTest, StopsWhenSchedulerEmpties) {
    TurnLoop loop(scheduler_);
    loop.configure(TurnLoopConfig{});

    EXPECT_EQ(loop.run(), 0u);

    actor_.set_turn_callback([this](sim::Actor& self) {
        if (self.get_turn_count() == 3) {
            scheduler_.remove(&self);
        }
    });
    scheduler_.add(&actor_);

    EXPECT_EQ(loop.run(), 3u);
    EXPECT_TRUE(scheduler_.empty());
}

TEST_F(TurnLoopTest, RequestExitFromCallback) {
    scheduler_.add(&actor_);
    TurnLoop loop(scheduler_);
    loop.configure(TurnLoopConfig{});

    std::vector<uint64_t> pre_turns;
    std::vector<uint64_t> post_turns;
    loop.set_pre_turn([&](uint64_t turn) { pre_turns.push_back(turn); });
    loop.set_post_turn([&](uint64_t turn) {
        post_turns.push_back(turn);
        if (turn == 2) {
            loop.request_exit();
        }
    });

    EXPECT_EQ(loop.run(), 2u);
    EXPECT_EQ(pre_turns, (std::vector<uint64_t>{1, 2}));
    EXPECT_EQ(post_turns, (std::vector<uint64_t>{1, 2}));
}

TEST_F(TurnLoopTest, PauseDelegatesToScheduler) {
    scheduler_.add(&actor_);
    TurnLoop loop(scheduler_);
    TurnLoopConfig config;
    config.max_turns = 3;
    loop.configure(config);

    loop.set_paused(true);
    EXPECT_TRUE(scheduler_.is_paused());
    EXPECT_TRUE(loop.is_paused());

    EXPECT_EQ(loop.run(), 3u);
    EXPECT_EQ(actor_.get_turn_count(), 0u);

    loop.set_paused(false);
    EXPECT_FALSE(scheduler_.is_paused());
}

TEST_F(TurnLoopTest, RefusesUnlimitedRunWhilePaused) {
    scheduler_.add(&actor_);
    scheduler_.pause();
    TurnLoop loop(scheduler_);
    loop.configure(TurnLoopConfig{});

    EXPECT_EQ(loop.run(), 0u);
}

TEST_F(TurnLoopTest, PausingFromCallbackEndsUnlimitedRun) {
    scheduler_.add(&actor_);
    TurnLoop loop(scheduler_);
    loop.configure(TurnLoopConfig{});

    loop.set_post_turn([&](uint64_t turn) {
        if (turn == 2) {
            loop.set_paused(true);
        }
    });

    EXPECT_EQ(loop.run(), 2u);
    EXPECT_EQ(actor_.get_turn_count(), 2u);
    EXPECT_TRUE(loop.should_exit());

    loop.set_paused(false);
    EXPECT_FALSE(loop.should_exit());
}

}  // namespace
}  // namespace tickwise::core
