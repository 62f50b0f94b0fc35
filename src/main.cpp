// Tickwise - Cooperative turn scheduler
// main.cpp - Headless demo driver

#include <tickwise/core/config.hpp>
#include <tickwise/core/logger.hpp>
#include <tickwise/core/turn_loop.hpp>
#include <tickwise/platform/file_io.hpp>
#include <tickwise/scheduling/scheduler.hpp>
#include <tickwise/sim/actor.hpp>
#include <tickwise/sim/delayed_action.hpp>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr const char* VERSION = "0.1.0";

using namespace tickwise;

struct SimulationSettings {
    uint64_t max_turns = 100;
    int actor_count = 4;
    double base_speed = 1.0;
    double speed_step = 0.5;
    double action_cost = 1.0;
    double delayed_action_delay = 10.0;
};

SimulationSettings read_settings(const core::Config& config) {
    using core::config_key::ACTION_COST;
    using core::config_key::ACTOR_COUNT;
    using core::config_key::BASE_SPEED;
    using core::config_key::DELAYED_ACTION_DELAY;
    using core::config_key::MAX_TURNS;
    using core::config_key::SPEED_STEP;
    constexpr const char* SECTION = core::config_section::SIMULATION;

    SimulationSettings settings;
    settings.max_turns = static_cast<uint64_t>(std::max(0, config.get_int(SECTION, MAX_TURNS, 100)));
    settings.actor_count = std::max(0, config.get_int(SECTION, ACTOR_COUNT, settings.actor_count));
    settings.base_speed = config.get_double(SECTION, BASE_SPEED, settings.base_speed);
    settings.speed_step = config.get_double(SECTION, SPEED_STEP, settings.speed_step);
    settings.action_cost = config.get_double(SECTION, ACTION_COST, settings.action_cost);
    settings.delayed_action_delay = config.get_double(SECTION, DELAYED_ACTION_DELAY, settings.delayed_action_delay);
    return settings;
}

int run_simulation(const core::Config& config) {
    const SimulationSettings settings = read_settings(config);

    scheduling::Scheduler scheduler(scheduling::SchedulerConfig::from_config(config));

    std::vector<std::unique_ptr<sim::Actor>> actors;
    for (int i = 0; i < settings.actor_count; ++i) {
        const double speed = settings.base_speed + settings.speed_step * i;
        auto actor = std::make_unique<sim::Actor>("actor_" + std::to_string(i), speed, settings.action_cost);
        actor->set_turn_callback([](sim::Actor& self) {
            TICKWISE_LOG_DEBUG(core::log_category::SIM, "{} acts (turn {}, speed {})", self.get_name(),
                               self.get_turn_count(), self.get_speed());
        });
        actors.push_back(std::move(actor));
    }

    std::vector<scheduling::TimedEntity*> entities;
    entities.reserve(actors.size());
    for (auto& actor : actors) {
        entities.push_back(actor.get());
    }
    scheduler.add_all(entities);

    // Halfway event: a fast newcomer joins and the slowest actor leaves
    auto newcomer = std::make_unique<sim::Actor>("newcomer", settings.base_speed * 4.0, settings.action_cost);
    sim::DelayedAction arrival(scheduler, settings.delayed_action_delay, [&]() {
        TICKWISE_LOG_INFO(core::log_category::SIM, "Newcomer arrives at t={}", scheduler.get_virtual_time());
        scheduler.add(newcomer.get());
        if (!actors.empty() && scheduler.remove(actors.front().get())) {
            TICKWISE_LOG_INFO(core::log_category::SIM, "{} leaves the simulation", actors.front()->get_name());
        }
    });
    arrival.start();

    core::TurnLoop loop(scheduler);
    core::TurnLoopConfig loop_config;
    loop_config.max_turns = settings.max_turns;
    loop.configure(loop_config);
    loop.run();

    TICKWISE_LOG_INFO(core::log_category::ENGINE, "Virtual time: {}", scheduler.get_virtual_time());
    for (const auto& actor : actors) {
        TICKWISE_LOG_INFO(core::log_category::ENGINE, "  {} (speed {}): {} turns", actor->get_name(),
                          actor->get_speed(), actor->get_turn_count());
    }
    TICKWISE_LOG_INFO(core::log_category::ENGINE, "  {} (speed {}): {} turns", newcomer->get_name(),
                      newcomer->get_speed(), newcomer->get_turn_count());

    const auto& stats = scheduler.get_stats();
    TICKWISE_LOG_INFO(core::log_category::ENGINE, "Runs: {}, activations: {}, deadlock corrections: {}", stats.runs,
                      stats.activations, stats.deadlock_corrections);

    // Entities must leave the scheduler before they are destroyed
    scheduler.clear();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace tickwise;

    std::filesystem::path config_path = argc > 1 ? std::filesystem::path(argv[1])
                                                 : platform::FileSystem::get_user_config_directory() / "config.json";

    core::Config config;
    bool config_loaded = argc > 1 ? config.load(config_path) : config.load_or_create_default(config_path);

    core::LoggerConfig logger_config;
    auto level = core::parse_log_level(
        config.get_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL, "info"));
    logger_config.console_level = level.value_or(core::LogLevel::Info);
    core::Logger::initialize(logger_config);

    TICKWISE_LOG_INFO(core::log_category::ENGINE, "Tickwise {}", VERSION);
    if (!config_loaded) {
        TICKWISE_LOG_ERROR(core::log_category::ENGINE, "Could not load {}", config_path.string());
        core::Logger::shutdown();
        return 1;
    }
    if (!level) {
        TICKWISE_LOG_WARN(core::log_category::CONFIG, "Unknown log level, using info");
    }

    int result = 1;
    try {
        result = run_simulation(config);
    } catch (const std::exception& e) {
        TICKWISE_LOG_CRITICAL(core::log_category::ENGINE, "Simulation failed: {}", e.what());
    }

    core::Logger::shutdown();
    return result;
}
