// Tickwise Simulation
// actor.hpp - Speed-driven entity that takes regular turns

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <tickwise/scheduling/timed_entity.hpp>

namespace tickwise::sim {

// An actor acts once every (action_cost / speed) ticks, so an actor twice as
// fast gets twice as many turns over the same stretch of virtual time.
class Actor : public scheduling::TimedEntity {
public:
    using TurnCallback = std::function<void(Actor& actor)>;

    // Throws std::invalid_argument unless speed and action_cost are finite and positive
    Actor(std::string name, double speed, double action_cost = 1.0, double initial_wait_time = 0.0);

    [[nodiscard]] double get_wait_time() const override { return wait_time_; }
    void set_wait_time(double wait_time) override { wait_time_ = wait_time; }

    // Takes one turn: runs the callback, then waits get_turn_length() ticks
    void update() override;

    [[nodiscard]] const std::string& get_name() const { return name_; }

    [[nodiscard]] double get_speed() const { return speed_; }
    void set_speed(double speed);

    [[nodiscard]] double get_action_cost() const { return action_cost_; }
    void set_action_cost(double action_cost);

    [[nodiscard]] double get_turn_length() const { return action_cost_ / speed_; }
    [[nodiscard]] uint64_t get_turn_count() const { return turn_count_; }

    void set_turn_callback(TurnCallback callback) { turn_callback_ = std::move(callback); }

private:
    std::string name_;
    double speed_;
    double action_cost_;
    double wait_time_;
    uint64_t turn_count_ = 0;
    TurnCallback turn_callback_;
};

}  // namespace tickwise::sim
