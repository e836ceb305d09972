#pragma once

#include "Road.hpp"
#include "Vehicle.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <unordered_map>
#include <vector>

namespace trafficsim
{
    struct WeightedPath
    {
        unsigned weight = 1;
        std::vector<RoadIndex> roads;
    };

    class VehicleGenerator
    {
    public:
        // vehicle_rate is in vehicles per minute; inbound_roads maps the first road of each path
        VehicleGenerator(double vehicle_rate,
                         std::vector<WeightedPath> paths,
                         std::unordered_map<RoadIndex, Road *> inbound_roads,
                         uint32_t seed = 0);

        // Try to add the upcoming vehicle; returns the receiving road on success
        std::optional<RoadIndex> update(double t, uint32_t n_vehicles_generated);

        double vehicleRate() const { return vehicle_rate; }
        double lastAddedTime() const { return last_added_time; }
        const std::vector<WeightedPath> &paths() const { return weighted_paths; }
        const Vehicle &upcomingVehicle() const { return upcoming_vehicle; }

    private:
        Vehicle generateVehicle();

        double vehicle_rate;
        std::vector<WeightedPath> weighted_paths;
        std::unordered_map<RoadIndex, Road *> inbound_roads;
        std::mt19937 rng;
        std::discrete_distribution<std::size_t> path_choice;
        double last_added_time;
        Vehicle upcoming_vehicle;
    };

} // namespace trafficsim
