#include "Simulation.hpp"

#include <nlohmann/json.hpp>

#include <numeric>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace trafficsim
{

    Simulation::Simulation(SimulationConfig config)
        : config(std::move(config))
    {
    }

    RoadIndex Simulation::addRoad(Point start, Point end)
    {
        const RoadIndex index = road_list.size();
        road_list.emplace_back(start, end, index);
        return index;
    }

    void Simulation::addRoads(const std::vector<std::pair<Point, Point>> &roads)
    {
        for (const auto &road : roads)
        {
            addRoad(road.first, road.second);
        }
    }

    void Simulation::addGenerator(double vehicle_rate, std::vector<WeightedPath> paths)
    {
        std::unordered_map<RoadIndex, Road *> inbound_roads;
        for (const auto &path : paths)
        {
            const RoadIndex first = path.roads.at(0);
            for (RoadIndex index : path.roads)
            {
                checkRoadIndex(index);
            }
            inbound_roads[first] = &road_list[first];
        }

        const uint32_t seed = config.seed + static_cast<uint32_t>(generator_list.size());
        generator_list.emplace_back(vehicle_rate, std::move(paths), std::move(inbound_roads), seed);
    }

    void Simulation::addTrafficSignal(std::vector<std::vector<RoadIndex>> road_groups,
                                      SignalCycle cycle,
                                      double slow_distance,
                                      double slow_factor,
                                      double stop_distance)
    {
        for (const auto &group : road_groups)
        {
            for (RoadIndex index : group)
            {
                checkRoadIndex(index);
            }
        }

        signal_list.emplace_back(std::move(road_groups), std::move(cycle), slow_distance, slow_factor, stop_distance);
        const TrafficSignal &signal = signal_list.back();
        for (std::size_t group = 0; group < signal.roadGroups().size(); ++group)
        {
            for (RoadIndex index : signal.roadGroups()[group])
            {
                road_list[index].setTrafficSignal(&signal, group);
            }
        }
    }

    void Simulation::addIntersections(const IntersectionMap &intersections)
    {
        for (const auto &entry : intersections)
        {
            checkRoadIndex(entry.first);
            for (RoadIndex other : entry.second)
            {
                checkRoadIndex(other);
            }
        }
        mergeSymmetric(intersection_topology, intersections);
    }

    bool Simulation::insertVehicle(std::vector<RoadIndex> path, double x)
    {
        for (RoadIndex index : path)
        {
            checkRoadIndex(index);
        }
        if (generationLimitReached())
        {
            return false;
        }
        Road &road = road_list.at(path.at(0));

        Vehicle vehicle(n_vehicles_generated, std::move(path), current_time);
        vehicle.x = x;
        road.pushBack(std::move(vehicle));

        n_vehicles_generated++;
        n_vehicles_on_map++;
        non_empty_roads.insert(road.index());
        return true;
    }

    void Simulation::attachDisplay(IDisplay *new_display)
    {
        display = new_display;
        if (display)
        {
            display->update(*this);
        }
    }

    bool Simulation::displayClosed() const
    {
        return display != nullptr && display->closed();
    }

    void Simulation::checkRoadIndex(RoadIndex index) const
    {
        if (index >= road_list.size())
        {
            throw std::out_of_range("unknown road index " + std::to_string(index));
        }
    }

    bool Simulation::generationLimitReached() const
    {
        return config.max_gen.has_value() && n_vehicles_generated >= *config.max_gen;
    }

    bool Simulation::completed() const
    {
        const bool reached_limit = generationLimitReached() && n_vehicles_on_map == 0;
        return collision_detected || reached_limit;
    }

    IntersectionMap Simulation::intersections() const
    {
        return reduceIntersections(intersection_topology, non_empty_roads);
    }

    double Simulation::getAverageWaitTime() const
    {
        if (waiting_times.empty())
            return 0.0;

        double total = std::accumulate(waiting_times.begin(), waiting_times.end(), 0.0);
        return total / static_cast<double>(waiting_times.size());
    }

    void Simulation::loop(std::size_t n)
    {
        for (std::size_t i = 0; i < n; ++i)
        {
            update();
            if (completed() || displayClosed())
            {
                return;
            }
        }
    }

    void Simulation::run(bool action)
    {
        run(action, config.default_run_ticks);
    }

    void Simulation::run(bool action, std::size_t n)
    {
        if (action)
        {
            updateSignals();
            loop(config.transition_ticks);
            if (completed() || displayClosed())
            {
                return;
            }
            updateSignals();
        }
        loop(n);
    }

    void Simulation::updateSignals()
    {
        for (auto &signal : signal_list)
        {
            signal.update(current_time);
        }
    }

    void Simulation::update()
    {
        advanceRoads();
        generateVehicles();
        transferLeadVehicles();
        detectCollisions();

        current_time += config.dt;

        if (display)
        {
            display->update(*this);
        }
    }

    void Simulation::advanceRoads()
    {
        for (RoadIndex index : non_empty_roads)
        {
            road_list[index].update(config.dt, current_time);
        }
    }

    void Simulation::generateVehicles()
    {
        for (auto &generator : generator_list)
        {
            if (generationLimitReached())
            {
                break;
            }

            std::optional<RoadIndex> road_index = generator.update(current_time, n_vehicles_generated);
            if (road_index)
            {
                n_vehicles_generated++;
                n_vehicles_on_map++;
                non_empty_roads.insert(*road_index);
            }
        }
    }

    void Simulation::transferLeadVehicles()
    {
        std::set<RoadIndex> new_non_empty_roads;
        std::set<RoadIndex> empty_roads;

        for (RoadIndex index : non_empty_roads)
        {
            Road &road = road_list[index];
            if (road.empty())
            {
                empty_roads.insert(index);
                continue;
            }

            Vehicle &lead = road.vehicles().front();
            if (lead.x < road.length())
            {
                continue;
            }

            if (lead.hasNextRoad())
            {
                Vehicle moved = road.popFront();
                moved.current_road_index++;
                moved.x = 0.0;
                const RoadIndex next_index = moved.currentRoad();
                road_list.at(next_index).pushBack(std::move(moved));
                new_non_empty_roads.insert(next_index);
            }
            else
            {
                Vehicle removed = road.popFront();
                n_vehicles_on_map--;
                waiting_times.push_back(removed.getTotalWaitingTime(current_time));
            }

            if (road.empty())
            {
                empty_roads.insert(index);
            }
        }

        for (RoadIndex index : empty_roads)
        {
            non_empty_roads.erase(index);
        }
        non_empty_roads.insert(new_non_empty_roads.begin(), new_non_empty_roads.end());
    }

    void Simulation::detectCollisions()
    {
        std::vector<CollisionRecord> found = trafficsim::detectCollisions(road_list, intersections(),
                                                                          config.collision_radius, config.scan_mode);
        if (!found.empty())
        {
            collision_detected = true;
            last_collisions = std::move(found);
        }
    }

    SimulationMetrics Simulation::getMetrics() const
    {
        SimulationMetrics metrics;
        metrics.sim_time = current_time;
        metrics.vehicles_generated = n_vehicles_generated;
        metrics.vehicles_on_map = n_vehicles_on_map;
        metrics.vehicles_completed = waiting_times.size();
        metrics.average_wait_time = getAverageWaitTime();
        metrics.active_roads = non_empty_roads.size();
        metrics.collision_detected = collision_detected;
        metrics.completed = completed();
        return metrics;
    }

    std::string Simulation::getSnapshotJson() const
    {
        using nlohmann::json;

        SimulationMetrics metrics = getMetrics();
        json root;
        root["sim_time"] = metrics.sim_time;
        root["metrics"] = {
            {"vehicles_generated", metrics.vehicles_generated},
            {"vehicles_on_map", metrics.vehicles_on_map},
            {"vehicles_completed", metrics.vehicles_completed},
            {"average_wait_time", metrics.average_wait_time},
            {"active_roads", metrics.active_roads},
            {"collision_detected", metrics.collision_detected},
            {"completed", metrics.completed}};

        root["signals"] = json::array();
        for (const auto &signal : signal_list)
        {
            json signal_json;
            signal_json["cycle_index"] = signal.currentCycleIndex();
            signal_json["phase"] = signal.currentCycle();
            signal_json["prev_update_time"] = signal.prevUpdateTime();
            root["signals"].push_back(signal_json);
        }

        root["roads"] = json::array();
        for (RoadIndex index : non_empty_roads)
        {
            const Road &road = road_list[index];
            json road_json;
            road_json["index"] = road.index();
            road_json["vehicles"] = json::array();
            for (const auto &vehicle : road.vehicles())
            {
                road_json["vehicles"].push_back({{"id", vehicle.id},
                                                 {"x", vehicle.x},
                                                 {"v", vehicle.v},
                                                 {"position", {vehicle.position.x, vehicle.position.y}},
                                                 {"stopped", vehicle.stopped}});
            }
            root["roads"].push_back(road_json);
        }

        if (!last_collisions.empty())
        {
            root["collisions"] = json::array();
            for (const auto &record : last_collisions)
            {
                root["collisions"].push_back({{"road_a", record.road_a},
                                              {"road_b", record.road_b},
                                              {"vehicle_a", record.vehicle_a},
                                              {"vehicle_b", record.vehicle_b},
                                              {"distance", record.distance}});
            }
        }

        return root.dump();
    }

} // namespace trafficsim
