#pragma once

#include "Vehicle.hpp"

#include <cstddef>
#include <vector>

namespace trafficsim
{
    // One phase lists a green flag per road group
    using SignalPhase = std::vector<bool>;
    using SignalCycle = std::vector<SignalPhase>;

    class TrafficSignal
    {
    public:
        TrafficSignal(std::vector<std::vector<RoadIndex>> road_groups,
                      SignalCycle cycle,
                      double slow_distance,
                      double slow_factor,
                      double stop_distance);

        // Advance to the next phase of the cycle, recording t as the update time
        void update(double t);

        const SignalPhase &currentCycle() const;
        std::size_t currentCycleIndex() const { return cycle_index; }
        bool isGreen(std::size_t group) const;

        double prevUpdateTime() const { return prev_update_time; }
        const std::vector<double> &updateHistory() const { return update_history; }

        const std::vector<std::vector<RoadIndex>> &roadGroups() const { return road_groups; }
        const SignalCycle &cycle() const { return signal_cycle; }

        double slowDistance() const { return slow_distance; }
        double slowFactor() const { return slow_factor; }
        double stopDistance() const { return stop_distance; }

    private:
        std::vector<std::vector<RoadIndex>> road_groups;
        SignalCycle signal_cycle;
        double slow_distance;
        double slow_factor;
        double stop_distance;
        std::size_t cycle_index;
        double prev_update_time;
        std::vector<double> update_history;
    };

} // namespace trafficsim
