#pragma once

#include "Display.hpp"
#include "Environment.hpp"
#include "Simulation.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace trafficsim
{
    // Decides, once per environment step, whether to toggle the signal
    class ISignalPolicy
    {
    public:
        virtual ~ISignalPolicy() = default;
        virtual bool decide(const Simulation &sim, const EnvironmentState &state) = 0;
        virtual std::string name() const = 0;
        // Called at the start of every episode
        virtual void reset() {}
    };

    static constexpr double MIN_SWITCH_INTERVAL = 15.0; // seconds between toggles

    inline bool switchIntervalElapsed(const Simulation &sim, double last_switch_time, double interval)
    {
        if (sim.trafficSignals().empty())
        {
            return false;
        }
        return sim.t() - last_switch_time >= interval;
    }

    class FixedCyclePolicy : public ISignalPolicy
    {
    public:
        explicit FixedCyclePolicy(double interval = MIN_SWITCH_INTERVAL)
            : interval(interval)
        {
        }

        bool decide(const Simulation &sim, const EnvironmentState &) override
        {
            if (!switchIntervalElapsed(sim, last_switch_time, interval))
            {
                return false;
            }
            last_switch_time = sim.t();
            return true;
        }

        std::string name() const override { return "fc"; }
        void reset() override { last_switch_time = 0.0; }

        double lastSwitchTime() const { return last_switch_time; }

    private:
        double interval;
        double last_switch_time = 0.0; // decision time, not the later signal update time
    };

    class LongestQueuePolicy : public ISignalPolicy
    {
    public:
        explicit LongestQueuePolicy(double interval = MIN_SWITCH_INTERVAL)
            : interval(interval)
        {
        }

        bool decide(const Simulation &sim, const EnvironmentState &state) override
        {
            if (!switchIntervalElapsed(sim, last_switch_time, interval))
            {
                return false;
            }

            // Give green to the axis with the longer queue
            const bool toggle = (state.west_east_green && state.west_east_vehicles < state.south_north_vehicles) ||
                                (!state.west_east_green && state.west_east_vehicles > state.south_north_vehicles);
            if (toggle)
            {
                last_switch_time = sim.t();
            }
            return toggle;
        }

        std::string name() const override { return "lqf"; }
        void reset() override { last_switch_time = 0.0; }

        double lastSwitchTime() const { return last_switch_time; }

    private:
        double interval;
        double last_switch_time = 0.0;
    };

    struct EpisodeResult
    {
        std::size_t episode = 0;
        bool collided = false;
        double wait_time = 0.0; // average wait of completed journeys
        double score = 0.0;     // sum of step rewards
    };

    struct BaselineReport
    {
        std::vector<EpisodeResult> episodes;
        std::size_t collisions = 0;
        double average_wait_time = 0.0;          // per completed (collision-free) episode
        double collisions_per_episode = 0.0;
        bool truncated = false;
    };

    using EpisodeCallback = std::function<void(const EpisodeResult &)>;

    // Run the policy for n_episodes; stops early when the display reports closed
    BaselineReport runBaseline(Environment &environment,
                               ISignalPolicy &policy,
                               std::size_t n_episodes,
                               IDisplay *display = nullptr,
                               const EpisodeCallback &on_episode = nullptr);

} // namespace trafficsim
