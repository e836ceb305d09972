#include "TrafficSignal.hpp"

#include <utility>

namespace trafficsim
{

    TrafficSignal::TrafficSignal(std::vector<std::vector<RoadIndex>> road_groups,
                                 SignalCycle cycle,
                                 double slow_distance,
                                 double slow_factor,
                                 double stop_distance)
        : road_groups(std::move(road_groups)), signal_cycle(std::move(cycle)),
          slow_distance(slow_distance), slow_factor(slow_factor), stop_distance(stop_distance),
          cycle_index(0), prev_update_time(0.0)
    {
    }

    void TrafficSignal::update(double t)
    {
        if (!signal_cycle.empty())
        {
            cycle_index = (cycle_index + 1) % signal_cycle.size();
        }
        prev_update_time = t;
        update_history.push_back(t);
    }

    const SignalPhase &TrafficSignal::currentCycle() const
    {
        static const SignalPhase empty_phase;
        if (signal_cycle.empty())
        {
            return empty_phase;
        }
        return signal_cycle[cycle_index];
    }

    bool TrafficSignal::isGreen(std::size_t group) const
    {
        const SignalPhase &phase = currentCycle();
        // A group missing from the phase is treated as green (no control)
        return group >= phase.size() || phase[group];
    }

} // namespace trafficsim
