#pragma once

#include "CollisionDetector.hpp"
#include "Display.hpp"
#include "Road.hpp"
#include "TrafficSignal.hpp"
#include "VehicleGenerator.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace trafficsim
{
    struct SimulationConfig
    {
        double dt = 1.0 / 60.0;
        std::optional<uint32_t> max_gen;  // vehicle generation limit
        std::size_t transition_ticks = 200; // ticks between the two signal updates of an action
        std::size_t default_run_ticks = 200;
        double collision_radius = COLLISION_RADIUS;
        CollisionScanMode scan_mode = CollisionScanMode::FirstOnly;
        uint32_t seed = 0;
    };

    struct SimulationMetrics
    {
        double sim_time = 0.0;
        uint32_t vehicles_generated = 0;
        uint32_t vehicles_on_map = 0;
        std::size_t vehicles_completed = 0;
        double average_wait_time = 0.0;
        std::size_t active_roads = 0;
        bool collision_detected = false;
        bool completed = false;
    };

    class Simulation
    {
    public:
        explicit Simulation(SimulationConfig config = {});

        Simulation(const Simulation &) = delete;
        Simulation &operator=(const Simulation &) = delete;

        // Network construction. Road indices passed here must already exist;
        // an unknown index throws std::out_of_range.
        RoadIndex addRoad(Point start, Point end);
        void addRoads(const std::vector<std::pair<Point, Point>> &roads);
        void addGenerator(double vehicle_rate, std::vector<WeightedPath> paths);
        void addTrafficSignal(std::vector<std::vector<RoadIndex>> road_groups,
                              SignalCycle cycle,
                              double slow_distance,
                              double slow_factor,
                              double stop_distance);
        void addIntersections(const IntersectionMap &intersections);

        // Place a vehicle directly on the first road of path, counted as generated.
        // Returns false without inserting once the generation limit is reached.
        bool insertVehicle(std::vector<RoadIndex> path, double x = 0.0);

        void attachDisplay(IDisplay *display);
        bool displayClosed() const;

        void update();
        void run(bool action);
        void run(bool action, std::size_t n);

        // Terminal state: a collision, or the generation limit reached with an empty map
        bool completed() const;
        bool collisionDetected() const { return collision_detected; }
        const std::vector<CollisionRecord> &collisions() const { return last_collisions; }

        double getAverageWaitTime() const;
        const std::vector<double> &waitingTimes() const { return waiting_times; }

        const std::set<RoadIndex> &nonEmptyRoads() const { return non_empty_roads; }
        IntersectionMap intersections() const;
        const IntersectionMap &staticIntersections() const { return intersection_topology; }

        double t() const { return current_time; }
        double dt() const { return config.dt; }
        uint32_t vehiclesGenerated() const { return n_vehicles_generated; }
        uint32_t vehiclesOnMap() const { return n_vehicles_on_map; }
        std::optional<uint32_t> generationLimit() const { return config.max_gen; }
        const SimulationConfig &getConfig() const { return config; }

        const std::deque<Road> &roads() const { return road_list; }
        const Road &road(RoadIndex index) const { return road_list.at(index); }
        const std::deque<VehicleGenerator> &generators() const { return generator_list; }
        const std::deque<TrafficSignal> &trafficSignals() const { return signal_list; }

        SimulationMetrics getMetrics() const;
        std::string getSnapshotJson() const;

    private:
        void checkRoadIndex(RoadIndex index) const;
        void loop(std::size_t n);
        void updateSignals();
        bool generationLimitReached() const;
        void advanceRoads();
        void generateVehicles();
        void transferLeadVehicles();
        void detectCollisions();

        SimulationConfig config;
        double current_time = 0.0;

        std::deque<Road> road_list;
        std::deque<VehicleGenerator> generator_list;
        std::deque<TrafficSignal> signal_list;

        std::set<RoadIndex> non_empty_roads;
        IntersectionMap intersection_topology;

        bool collision_detected = false;
        std::vector<CollisionRecord> last_collisions;
        uint32_t n_vehicles_generated = 0;
        uint32_t n_vehicles_on_map = 0;
        std::vector<double> waiting_times; // vehicles that completed the journey

        IDisplay *display = nullptr;
    };

} // namespace trafficsim
