#include "VehicleGenerator.hpp"

#include <utility>

namespace trafficsim
{
    namespace
    {
        std::vector<double> pathWeights(const std::vector<WeightedPath> &paths)
        {
            std::vector<double> weights;
            weights.reserve(paths.size());
            for (const auto &path : paths)
            {
                weights.push_back(static_cast<double>(path.weight));
            }
            return weights;
        }
    }

    VehicleGenerator::VehicleGenerator(double vehicle_rate,
                                       std::vector<WeightedPath> paths,
                                       std::unordered_map<RoadIndex, Road *> inbound_roads,
                                       uint32_t seed)
        : vehicle_rate(vehicle_rate),
          weighted_paths(std::move(paths)),
          inbound_roads(std::move(inbound_roads)),
          rng(seed),
          last_added_time(0.0),
          upcoming_vehicle(0, {})
    {
        std::vector<double> weights = pathWeights(weighted_paths);
        path_choice = std::discrete_distribution<std::size_t>(weights.begin(), weights.end());
        upcoming_vehicle = generateVehicle();
    }

    Vehicle VehicleGenerator::generateVehicle()
    {
        if (weighted_paths.empty())
        {
            return Vehicle(0, {});
        }
        const std::size_t choice = path_choice(rng);
        return Vehicle(0, weighted_paths[choice].roads);
    }

    std::optional<RoadIndex> VehicleGenerator::update(double t, uint32_t n_vehicles_generated)
    {
        if (vehicle_rate <= 0.0 || upcoming_vehicle.path.empty())
        {
            return std::nullopt;
        }

        if (t - last_added_time < 60.0 / vehicle_rate)
        {
            return std::nullopt;
        }

        Road &road = *inbound_roads.at(upcoming_vehicle.path.front());
        if (!road.hasRoomForEntry(upcoming_vehicle))
        {
            return std::nullopt;
        }

        upcoming_vehicle.id = n_vehicles_generated;
        upcoming_vehicle.spawn_time = t;
        road.pushBack(std::move(upcoming_vehicle));
        last_added_time = t;
        upcoming_vehicle = generateVehicle();
        return road.index();
    }

} // namespace trafficsim
