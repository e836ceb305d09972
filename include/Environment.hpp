#pragma once

#include "Display.hpp"
#include "NetworkConfig.hpp"
#include "Simulation.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>

namespace trafficsim
{
    struct EnvironmentState
    {
        bool west_east_green = false;    // phase of group 0 of the first signal
        std::size_t west_east_vehicles = 0;
        std::size_t south_north_vehicles = 0;
        bool junction_occupied = false;
    };

    struct StepResult
    {
        EnvironmentState state;
        double reward = 0.0;
        bool done = false;
        bool truncated = false; // display closed, distinct from episode completion
    };

    struct EnvironmentConfig
    {
        SimulationConfig simulation{};
        double collision_penalty = 100.0;
    };

    class Environment
    {
    public:
        explicit Environment(NetworkConfig network = makeTwoWayIntersectionConfig(),
                             EnvironmentConfig config = {});

        // Start a new episode on a fresh simulation; display may be null
        EnvironmentState reset(IDisplay *display = nullptr);
        StepResult step(bool action);

        EnvironmentState getState() const;
        double getReward() const;
        double currentAverageWaitTime() const;

        Simulation &sim() { return *simulation; }
        const Simulation &sim() const { return *simulation; }
        std::size_t episode() const { return episode_count; }

    private:
        void rebuild(IDisplay *display);
        std::size_t countVehicles(std::size_t group) const;

        NetworkConfig network;
        EnvironmentConfig config;
        std::unique_ptr<Simulation> simulation;
        std::size_t episode_count = 0;
    };

} // namespace trafficsim
