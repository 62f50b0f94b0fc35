// Tickwise Simulation
// actor.cpp - Speed-driven entity implementation

#include <cmath>
#include <stdexcept>
#include <tickwise/core/logger.hpp>
#include <tickwise/sim/actor.hpp>

namespace tickwise::sim {

namespace {

double require_positive(double value, const char* what) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw std::invalid_argument(std::string("Actor ") + what + " must be finite and positive, got " +
                                    std::to_string(value));
    }
    return value;
}

}  // namespace

Actor::Actor(std::string name, double speed, double action_cost, double initial_wait_time)
    : name_(std::move(name)),
      speed_(require_positive(speed, "speed")),
      action_cost_(require_positive(action_cost, "action cost")),
      wait_time_(initial_wait_time) {}

void Actor::update() {
    ++turn_count_;
    TICKWISE_LOG_TRACE(core::log_category::SIM, "{} takes turn {}", name_, turn_count_);

    if (turn_callback_) {
        turn_callback_(*this);
    }
    wait_time_ += get_turn_length();
}

void Actor::set_speed(double speed) {
    speed_ = require_positive(speed, "speed");
}

void Actor::set_action_cost(double action_cost) {
    action_cost_ = require_positive(action_cost, "action cost");
}

}  // namespace tickwise::sim
