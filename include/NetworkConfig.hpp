#pragma once

#include "CollisionDetector.hpp"
#include "Simulation.hpp"
#include "TrafficSignal.hpp"
#include "Vehicle.hpp"
#include "VehicleGenerator.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace trafficsim
{
    struct RoadConfig
    {
        Point start;
        Point end;
    };

    struct GeneratorConfig
    {
        double vehicle_rate = 20.0; // vehicles per minute
        std::vector<WeightedPath> paths;
    };

    struct SignalConfig
    {
        std::vector<std::vector<RoadIndex>> road_groups;
        SignalCycle cycle;
        double slow_distance = 50.0;
        double slow_factor = 0.4;
        double stop_distance = 15.0;
    };

    struct NetworkConfig
    {
        std::vector<RoadConfig> roads;
        std::vector<GeneratorConfig> generators;
        std::vector<SignalConfig> signals;
        IntersectionMap intersections;
        std::vector<RoadIndex> junction_roads; // roads inside the junction box
        std::optional<uint32_t> max_gen;
    };

    // Two-way four-approach intersection with one signal alternating the west-east
    // and south-north axes through an all-red clearance phase.
    NetworkConfig makeTwoWayIntersectionConfig();

    // Register roads, intersections, signals and generators in that order
    void buildNetwork(Simulation &sim, const NetworkConfig &config);

} // namespace trafficsim
