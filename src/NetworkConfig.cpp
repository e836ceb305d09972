#include "NetworkConfig.hpp"

namespace trafficsim
{
    namespace
    {
        constexpr double APPROACH_LENGTH = 100.0;
        constexpr double JUNCTION_HALF_SIZE = 12.0;
        constexpr double LANE_OFFSET = 2.0; // opposing lanes sit 2 * LANE_OFFSET apart
    }

    NetworkConfig makeTwoWayIntersectionConfig()
    {
        const double b = JUNCTION_HALF_SIZE;
        const double l = APPROACH_LENGTH;
        const double o = LANE_OFFSET;

        NetworkConfig config;

        // Inbound roads: 0 west->east, 1 east->west, 2 south->north, 3 north->south
        config.roads.push_back({{-b - l, o}, {-b, o}});
        config.roads.push_back({{b + l, -o}, {b, -o}});
        config.roads.push_back({{o, -b - l}, {o, -b}});
        config.roads.push_back({{-o, b + l}, {-o, b}});

        // Junction crossings: 4 WE, 5 EW, 6 SN, 7 NS
        config.roads.push_back({{-b, o}, {b, o}});
        config.roads.push_back({{b, -o}, {-b, -o}});
        config.roads.push_back({{o, -b}, {o, b}});
        config.roads.push_back({{-o, b}, {-o, -b}});

        // Outbound roads: 8 WE, 9 EW, 10 SN, 11 NS
        config.roads.push_back({{b, o}, {b + l, o}});
        config.roads.push_back({{-b, -o}, {-b - l, -o}});
        config.roads.push_back({{o, b}, {o, b + l}});
        config.roads.push_back({{-o, -b}, {-o, -b - l}});

        config.junction_roads = {4, 5, 6, 7};
        config.intersections = {{4, {6, 7}}, {5, {6, 7}}, {6, {4, 5}}, {7, {4, 5}}};

        SignalConfig signal;
        signal.road_groups = {{0, 1}, {2, 3}};
        signal.cycle = {{false, true}, {false, false}, {true, false}, {false, false}};
        signal.slow_distance = 50.0;
        signal.slow_factor = 0.4;
        signal.stop_distance = 15.0;
        config.signals.push_back(signal);

        GeneratorConfig generator;
        generator.vehicle_rate = 20.0;
        generator.paths = {{3, {0, 4, 8}}, {3, {1, 5, 9}}, {1, {2, 6, 10}}, {1, {3, 7, 11}}};
        config.generators.push_back(generator);

        config.max_gen = 30;
        return config;
    }

    void buildNetwork(Simulation &sim, const NetworkConfig &config)
    {
        for (const auto &road : config.roads)
        {
            sim.addRoad(road.start, road.end);
        }

        sim.addIntersections(config.intersections);

        for (const auto &signal : config.signals)
        {
            sim.addTrafficSignal(signal.road_groups, signal.cycle,
                                 signal.slow_distance, signal.slow_factor, signal.stop_distance);
        }

        for (const auto &generator : config.generators)
        {
            sim.addGenerator(generator.vehicle_rate, generator.paths);
        }
    }

} // namespace trafficsim
