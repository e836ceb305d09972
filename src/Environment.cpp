#include "Environment.hpp"

#include <utility>

namespace trafficsim
{

    Environment::Environment(NetworkConfig network, EnvironmentConfig config)
        : network(std::move(network)), config(std::move(config))
    {
        rebuild(nullptr);
    }

    EnvironmentState Environment::reset(IDisplay *display)
    {
        episode_count++;
        rebuild(display);
        return getState();
    }

    void Environment::rebuild(IDisplay *display)
    {
        SimulationConfig sim_config = config.simulation;
        sim_config.seed = config.simulation.seed + static_cast<uint32_t>(episode_count);
        if (network.max_gen.has_value())
        {
            sim_config.max_gen = network.max_gen;
        }

        simulation = std::make_unique<Simulation>(sim_config);
        buildNetwork(*simulation, network);
        if (display)
        {
            simulation->attachDisplay(display);
        }
    }

    StepResult Environment::step(bool action)
    {
        simulation->run(action);

        StepResult result;
        result.state = getState();
        result.reward = getReward();
        result.done = simulation->completed();
        result.truncated = simulation->displayClosed();
        return result;
    }

    std::size_t Environment::countVehicles(std::size_t group) const
    {
        const auto &signals = simulation->trafficSignals();
        if (signals.empty() || group >= signals.front().roadGroups().size())
        {
            return 0;
        }

        std::size_t count = 0;
        for (RoadIndex index : signals.front().roadGroups()[group])
        {
            count += simulation->road(index).size();
        }
        return count;
    }

    EnvironmentState Environment::getState() const
    {
        EnvironmentState state;
        const auto &signals = simulation->trafficSignals();
        if (!signals.empty())
        {
            state.west_east_green = signals.front().isGreen(0);
        }
        state.west_east_vehicles = countVehicles(0);
        state.south_north_vehicles = countVehicles(1);

        for (RoadIndex index : network.junction_roads)
        {
            if (!simulation->road(index).empty())
            {
                state.junction_occupied = true;
                break;
            }
        }
        return state;
    }

    double Environment::getReward() const
    {
        if (simulation->collisionDetected())
        {
            return -config.collision_penalty;
        }

        double total_wait = 0.0;
        std::size_t vehicles = 0;
        for (RoadIndex index : simulation->nonEmptyRoads())
        {
            for (const auto &vehicle : simulation->road(index).vehicles())
            {
                total_wait += vehicle.currentWaitingTime(simulation->t());
                vehicles++;
            }
        }

        if (vehicles == 0)
            return 0.0;
        return -total_wait / static_cast<double>(vehicles);
    }

    double Environment::currentAverageWaitTime() const
    {
        return simulation->getAverageWaitTime();
    }

} // namespace trafficsim
