#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include <deque>
#include <set>
#include <stdexcept>
#include "CollisionDetector.hpp"
#include "NetworkConfig.hpp"
#include "Road.hpp"
#include "Simulation.hpp"
#include "TrafficSignal.hpp"
#include "Vehicle.hpp"
#include "VehicleGenerator.hpp"

using namespace trafficsim;

namespace
{
    // Road 0 runs west->east along y = 50, road 1 south->north along x = 50
    void buildCrossing(Simulation &sim)
    {
        sim.addRoad({0.0, 50.0}, {100.0, 50.0});
        sim.addRoad({50.0, 0.0}, {50.0, 100.0});
        sim.addIntersections({{0, {1}}});
    }

    std::set<RoadIndex> scanNonEmptyRoads(const Simulation &sim)
    {
        std::set<RoadIndex> result;
        for (const auto &road : sim.roads())
        {
            if (!road.empty())
                result.insert(road.index());
        }
        return result;
    }

    class CountingDisplay : public IDisplay
    {
    public:
        explicit CountingDisplay(std::size_t close_after) : close_after(close_after) {}

        void update(const Simulation &) override { updates++; }
        bool closed() const override { return updates >= close_after; }

        std::size_t updates = 0;

    private:
        std::size_t close_after;
    };
}

TEST_CASE("Vehicle on a free road cruises at max speed", "[vehicle]")
{
    Vehicle v(1, {0});
    const double dt = 1.0 / 60.0;
    v.update(nullptr, dt);
    REQUIRE(v.x == Approx(16.6 * dt));
    REQUIRE(v.v == Approx(16.6));
    REQUIRE(v.a == Approx(0.0).margin(1e-9));
}

TEST_CASE("Stopped vehicle decelerates", "[vehicle]")
{
    Vehicle v(1, {0});
    v.stop();
    v.update(nullptr, 0.1);
    REQUIRE(v.a < 0.0);
    v.update(nullptr, 0.1);
    REQUIRE(v.v < 16.6);

    v.unstop();
    REQUIRE_FALSE(v.stopped);
}

TEST_CASE("Follower brakes behind a close leader", "[vehicle]")
{
    Vehicle lead(1, {0});
    lead.x = 10.0;
    lead.v = 0.0;
    Vehicle follower(2, {0});
    follower.x = 0.0;

    follower.update(&lead, 0.1);
    REQUIRE(follower.a < 0.0);
}

TEST_CASE("Vehicle slow and unslow adjust max speed", "[vehicle]")
{
    Vehicle v(1, {0});
    v.slow(5.0);
    REQUIRE(v.v_max == Approx(5.0));
    v.unslow();
    REQUIRE(v.v_max == Approx(v.nominalMaxSpeed()));
}

TEST_CASE("Vehicle wait bookkeeping", "[vehicle]")
{
    Vehicle v(1, {0, 1}, 1.0);
    REQUIRE(v.getTotalWaitingTime(5.0) == Approx(4.0));

    v.startWait(1.0);
    REQUIRE(v.isWaiting());
    REQUIRE(v.currentWaitingTime(3.0) == Approx(2.0));
    v.endWait(3.0);
    REQUIRE_FALSE(v.isWaiting());
    REQUIRE(v.currentWaitingTime(10.0) == Approx(2.0));
    REQUIRE(v.waiting_time == Approx(2.0));
    REQUIRE(v.wait_start < 0.0);

    REQUIRE(v.hasNextRoad());
    REQUIRE(v.currentRoad() == 0);
    REQUIRE(v.nextRoad() == 1);
}

TEST_CASE("Road geometry", "[road]")
{
    Road road({0.0, 0.0}, {3.0, 4.0}, 7);
    REQUIRE(road.length() == Approx(5.0));
    REQUIRE(road.index() == 7);

    Point p = road.pointAt(2.5);
    REQUIRE(p.x == Approx(1.5));
    REQUIRE(p.y == Approx(2.0));

    road.pushBack(Vehicle(1, {7}));
    REQUIRE(road.size() == 1);
    REQUIRE(road.vehicles().front().position.x == Approx(0.0));
    REQUIRE_FALSE(road.hasRoomForEntry(Vehicle(2, {7})));
}

TEST_CASE("Road without signal keeps vehicles moving", "[road]")
{
    Road road({0.0, 0.0}, {100.0, 0.0}, 0);
    REQUIRE(road.trafficSignalState());

    road.pushBack(Vehicle(1, {0}));
    road.update(0.5, 0.0);
    const Vehicle &v = road.vehicles().front();
    REQUIRE(v.x == Approx(8.3));
    REQUIRE(v.position.x == Approx(8.3));
    REQUIRE_FALSE(v.isWaiting());
}

TEST_CASE("Red signal slows and stops the lead vehicle", "[road][signal]")
{
    TrafficSignal signal({{0}}, {{false}, {true}}, 50.0, 0.4, 15.0);
    Road road({0.0, 0.0}, {100.0, 0.0}, 0);
    road.setTrafficSignal(&signal, 0);
    REQUIRE(road.hasTrafficSignal());
    REQUIRE_FALSE(road.trafficSignalState());

    Vehicle v(1, {0});
    v.x = 86.0;
    road.pushBack(v);
    road.update(1.0 / 60.0, 0.0);

    const Vehicle &lead = road.vehicles().front();
    REQUIRE(lead.stopped);
    REQUIRE(lead.v_max == Approx(0.4 * 16.6));

    signal.update(1.0);
    REQUIRE(road.trafficSignalState());
    road.update(1.0 / 60.0, 1.0);
    REQUIRE_FALSE(road.vehicles().front().stopped);
    REQUIRE(road.vehicles().front().v_max == Approx(16.6));
}

TEST_CASE("Vehicle held at a red light accumulates standstill time", "[road][signal]")
{
    TrafficSignal signal({{0}}, {{false}}, 50.0, 0.4, 15.0);
    Road road({0.0, 0.0}, {100.0, 0.0}, 0);
    road.setTrafficSignal(&signal, 0);

    Vehicle v(1, {0});
    v.x = 60.0;
    road.pushBack(v);

    const double dt = 1.0 / 60.0;
    double t = 0.0;
    for (int i = 0; i < 1200; ++i)
    {
        road.update(dt, t);
        t += dt;
    }

    const Vehicle &lead = road.vehicles().front();
    REQUIRE(lead.x < road.length());
    REQUIRE(lead.isWaiting());
    REQUIRE(lead.currentWaitingTime(t) > 0.0);
}

TEST_CASE("TrafficSignal cycles phases and records update times", "[signal]")
{
    TrafficSignal signal({{0, 1}, {2, 3}}, {{false, true}, {false, false}, {true, false}, {false, false}}, 50.0, 0.4, 15.0);
    REQUIRE(signal.currentCycleIndex() == 0);
    REQUIRE_FALSE(signal.isGreen(0));
    REQUIRE(signal.isGreen(1));

    signal.update(1.0);
    REQUIRE(signal.currentCycleIndex() == 1);
    REQUIRE_FALSE(signal.isGreen(0));
    REQUIRE_FALSE(signal.isGreen(1));

    signal.update(2.5);
    REQUIRE(signal.isGreen(0));
    REQUIRE(signal.prevUpdateTime() == Approx(2.5));
    REQUIRE(signal.updateHistory() == std::vector<double>{1.0, 2.5});

    signal.update(3.0);
    signal.update(4.0);
    REQUIRE(signal.currentCycleIndex() == 0);
}

TEST_CASE("VehicleGenerator respects rate and entry spacing", "[generator]")
{
    std::deque<Road> roads;
    roads.emplace_back(Point{0.0, 0.0}, Point{100.0, 0.0}, 0);

    VehicleGenerator gen(60.0, {{1, {0}}}, {{0, &roads[0]}}, 42);

    REQUIRE_FALSE(gen.update(0.5, 0).has_value());

    auto added = gen.update(1.0, 0);
    REQUIRE(added.has_value());
    REQUIRE(*added == 0);
    REQUIRE(roads[0].size() == 1);
    REQUIRE(roads[0].vehicles().front().id == 0);
    REQUIRE(roads[0].vehicles().front().spawn_time == Approx(1.0));
    REQUIRE(gen.lastAddedTime() == Approx(1.0));

    // Interval not yet elapsed
    REQUIRE_FALSE(gen.update(1.5, 1).has_value());
    // Interval elapsed but the previous vehicle still blocks the entry
    REQUIRE_FALSE(gen.update(2.0, 1).has_value());

    roads[0].vehicles().front().x = 20.0;
    REQUIRE(gen.update(2.0, 1).has_value());
    REQUIRE(roads[0].vehicles().back().id == 1);
}

TEST_CASE("VehicleGenerator path choice is reproducible for a seed", "[generator]")
{
    std::deque<Road> roads;
    roads.emplace_back(Point{0.0, 0.0}, Point{100.0, 0.0}, 0);
    roads.emplace_back(Point{0.0, 10.0}, Point{100.0, 10.0}, 1);
    std::vector<WeightedPath> paths = {{1, {0}}, {1, {1}}};

    VehicleGenerator a(60.0, paths, {{0, &roads[0]}, {1, &roads[1]}}, 7);
    VehicleGenerator b(60.0, paths, {{0, &roads[0]}, {1, &roads[1]}}, 7);
    REQUIRE(a.upcomingVehicle().path == b.upcomingVehicle().path);
}

TEST_CASE("Intersections reduce to active roads", "[collision]")
{
    IntersectionMap topology;
    mergeSymmetric(topology, {{0, {1, 2}}});
    REQUIRE(topology.at(1) == std::set<RoadIndex>{0});
    REQUIRE(topology.at(2) == std::set<RoadIndex>{0});

    IntersectionMap reduced = reduceIntersections(topology, {0, 1});
    REQUIRE(reduced.size() == 2);
    REQUIRE(reduced.at(0) == std::set<RoadIndex>{1});
    REQUIRE(reduced.at(1) == std::set<RoadIndex>{0});

    REQUIRE(reduceIntersections(topology, {0}).empty());
    REQUIRE(reduceIntersections(topology, {}).empty());
}

TEST_CASE("Collision scan modes", "[collision]")
{
    std::deque<Road> roads;
    roads.emplace_back(Point{0.0, 50.0}, Point{100.0, 50.0}, 0);
    roads.emplace_back(Point{50.0, 0.0}, Point{50.0, 100.0}, 1);

    Vehicle a(1, {0});
    a.x = 49.0;
    roads[0].pushBack(a);
    Vehicle b(2, {0});
    b.x = 30.0;
    roads[0].pushBack(b);
    Vehicle c(3, {1});
    c.x = 49.5;
    roads[1].pushBack(c);

    IntersectionMap topology;
    mergeSymmetric(topology, {{0, {1}}});
    IntersectionMap active = reduceIntersections(topology, {0, 1});

    auto first = detectCollisions(roads, active, COLLISION_RADIUS, CollisionScanMode::FirstOnly);
    REQUIRE(first.size() == 1);
    REQUIRE(first.front().distance < COLLISION_RADIUS);

    auto all = detectCollisions(roads, active, COLLISION_RADIUS, CollisionScanMode::All);
    REQUIRE(all.size() == 1);
    REQUIRE(all.front().road_a == 0);
    REQUIRE(all.front().road_b == 1);
    REQUIRE(all.front().vehicle_a == 1);
    REQUIRE(all.front().vehicle_b == 3);

    REQUIRE(detectCollisions(roads, active, 0.5).empty());
}

TEST_CASE("Non-intersecting roads never collide", "[engine][collision]")
{
    Simulation sim;
    sim.addRoad({0.0, 0.0}, {100.0, 0.0});
    sim.addRoad({0.0, 50.0}, {100.0, 50.0});
    sim.insertVehicle({0});
    sim.insertVehicle({1});

    for (int i = 0; i < 50; ++i)
        sim.update();

    REQUIRE_FALSE(sim.collisionDetected());
    REQUIRE_FALSE(sim.completed());
    REQUIRE(sim.vehiclesOnMap() == 2);
}

TEST_CASE("Vehicles within radius on intersecting roads end the episode", "[engine][collision]")
{
    Simulation sim;
    buildCrossing(sim);
    sim.insertVehicle({0}, 49.0);
    sim.insertVehicle({1}, 49.5);
    REQUIRE_FALSE(sim.collisionDetected());
    REQUIRE(sim.intersections().size() == 2);

    sim.update();
    REQUIRE(sim.collisionDetected());
    REQUIRE(sim.completed());
    REQUIRE(sim.collisions().size() == 1);
    REQUIRE(sim.t() == Approx(sim.dt()));

    for (int i = 0; i < 200; ++i)
    {
        sim.update();
        REQUIRE(sim.collisionDetected());
        REQUIRE(sim.completed());
    }
}

TEST_CASE("Exhaustive scan mode still terminates the episode", "[engine][collision]")
{
    SimulationConfig config;
    config.scan_mode = CollisionScanMode::All;
    Simulation sim(config);
    buildCrossing(sim);
    sim.insertVehicle({0}, 49.0);
    sim.insertVehicle({1}, 49.5);

    sim.update();
    REQUIRE(sim.collisionDetected());
    REQUIRE(sim.collisions().size() == 1);
}

TEST_CASE("Vehicle with a single-road path leaves with one wait sample", "[engine][handoff]")
{
    Simulation sim;
    sim.addRoad({0.0, 0.0}, {10.0, 0.0});
    sim.insertVehicle({0}, 9.9);
    REQUIRE(sim.vehiclesOnMap() == 1);

    sim.update();
    REQUIRE(sim.vehiclesOnMap() == 0);
    REQUIRE(sim.waitingTimes().size() == 1);
    REQUIRE(sim.nonEmptyRoads().empty());
    REQUIRE(sim.road(0).empty());
}

TEST_CASE("Vehicle is handed off to the next road of its path", "[engine][handoff]")
{
    Simulation sim;
    sim.addRoad({0.0, 0.0}, {10.0, 0.0});
    sim.addRoad({10.0, 0.0}, {30.0, 0.0});
    sim.insertVehicle({0, 1}, 9.9);

    sim.update();
    REQUIRE(sim.road(0).empty());
    REQUIRE(sim.road(1).size() == 1);
    const Vehicle &moved = sim.road(1).vehicles().front();
    REQUIRE(moved.x == Approx(0.0));
    REQUIRE(moved.current_road_index == 1);
    REQUIRE(moved.position.x == Approx(10.0));
    REQUIRE(sim.waitingTimes().empty());
    REQUIRE(sim.vehiclesOnMap() == 1);
    REQUIRE(sim.nonEmptyRoads() == std::set<RoadIndex>{1});
}

TEST_CASE("Road emptied and refilled in one tick stays active", "[engine][handoff][active]")
{
    Simulation sim;
    sim.addRoad({0.0, 0.0}, {10.0, 0.0});
    sim.addRoad({-10.0, 0.0}, {0.0, 0.0});
    sim.addRoad({0.0, 40.0}, {100.0, 40.0});
    // Road 0 loses its only vehicle while road 1 hands a vehicle to road 0
    sim.insertVehicle({0}, 9.9);
    sim.insertVehicle({1, 0}, 9.9);
    sim.insertVehicle({2});

    sim.update();
    REQUIRE(sim.road(0).size() == 1);
    REQUIRE(sim.road(1).empty());
    REQUIRE(sim.road(0).vehicles().front().x == Approx(0.0));
    REQUIRE(sim.waitingTimes().size() == 1);
    REQUIRE(sim.nonEmptyRoads() == std::set<RoadIndex>{0, 2});
    REQUIRE(sim.nonEmptyRoads() == scanNonEmptyRoads(sim));
}

TEST_CASE("Scripted insertion respects the generation limit", "[engine][generator]")
{
    SimulationConfig config;
    config.max_gen = 1;
    Simulation sim(config);
    sim.addRoad({0.0, 0.0}, {100.0, 0.0});

    REQUIRE(sim.insertVehicle({0}));
    REQUIRE_FALSE(sim.insertVehicle({0}));
    REQUIRE(sim.vehiclesGenerated() == 1);
    REQUIRE(sim.vehiclesOnMap() == 1);
    REQUIRE(sim.road(0).size() == 1);
    REQUIRE_THROWS_AS(sim.insertVehicle({3}), std::out_of_range);
}

TEST_CASE("Only the lead vehicle crosses per tick", "[engine][handoff]")
{
    Simulation sim;
    sim.addRoad({0.0, 0.0}, {10.0, 0.0});
    sim.addRoad({10.0, 0.0}, {30.0, 0.0});
    sim.insertVehicle({0, 1}, 9.9);
    sim.insertVehicle({0, 1}, 9.95);

    sim.update();
    REQUIRE(sim.road(0).size() == 1);
    REQUIRE(sim.road(1).size() == 1);
    REQUIRE(sim.nonEmptyRoads() == std::set<RoadIndex>{0, 1});
}

TEST_CASE("Average wait time of an empty log is zero", "[engine]")
{
    Simulation sim;
    REQUIRE(sim.getAverageWaitTime() == 0.0);
    REQUIRE(sim.getMetrics().average_wait_time == 0.0);
}

TEST_CASE("Active road set matches occupied roads every tick", "[engine][active]")
{
    NetworkConfig network = makeTwoWayIntersectionConfig();
    SimulationConfig config;
    config.max_gen = network.max_gen;
    config.seed = 3;
    Simulation sim(config);
    buildNetwork(sim, network);

    for (int i = 0; i < 3000 && !sim.completed(); ++i)
    {
        if (i % 600 == 0)
        {
            sim.run(true, 0);
        }
        sim.update();
        REQUIRE(sim.nonEmptyRoads() == scanNonEmptyRoads(sim));
    }
    REQUIRE(sim.vehiclesGenerated() > 0);
}

TEST_CASE("Generation never exceeds the limit", "[engine][generator]")
{
    SimulationConfig config;
    config.max_gen = 3;
    Simulation sim(config);
    sim.addRoad({0.0, 0.0}, {1000.0, 0.0});
    sim.addGenerator(600.0, {{1, {0}}});

    for (int i = 0; i < 1000; ++i)
    {
        sim.update();
        REQUIRE(sim.vehiclesGenerated() <= 3);
    }
    REQUIRE(sim.vehiclesGenerated() == 3);
    REQUIRE_FALSE(sim.completed());
}

TEST_CASE("Single generated vehicle completes the run with its journey time", "[engine][episode]")
{
    SimulationConfig config;
    config.max_gen = 1;
    Simulation sim(config);
    sim.addRoad({0.0, 0.0}, {20.0, 0.0});
    sim.addGenerator(600.0, {{1, {0}}});

    int guard = 0;
    while (sim.vehiclesGenerated() == 0 && guard++ < 100)
        sim.update();
    REQUIRE(sim.vehiclesGenerated() == 1);
    const double spawn_time = sim.road(0).vehicles().front().spawn_time;

    sim.run(false, 1000);
    REQUIRE(sim.completed());
    REQUIRE_FALSE(sim.collisionDetected());
    REQUIRE(sim.waitingTimes().size() == 1);

    const double exit_time = sim.t() - sim.dt();
    const double total_wait_time = sim.waitingTimes().front();
    REQUIRE(total_wait_time / 1 == Approx(exit_time - spawn_time));
    REQUIRE(sim.getAverageWaitTime() == Approx(exit_time - spawn_time));
}

TEST_CASE("Two actioned runs toggle the green direction twice", "[engine][signal]")
{
    Simulation sim;
    sim.addRoads({{{-100.0, 2.0}, {0.0, 2.0}}, {{2.0, -100.0}, {2.0, 0.0}}});
    sim.addTrafficSignal({{0}, {1}}, {{false, true}, {false, false}, {true, false}, {false, false}}, 50.0, 0.4, 15.0);
    const TrafficSignal &signal = sim.trafficSignals().front();
    const double dt = sim.dt();

    REQUIRE_FALSE(signal.isGreen(0));

    sim.run(true, 200);
    REQUIRE(signal.isGreen(0));
    REQUIRE_FALSE(signal.isGreen(1));

    sim.run(true, 50);
    REQUIRE_FALSE(signal.isGreen(0));
    REQUIRE(signal.isGreen(1));

    const auto &history = signal.updateHistory();
    REQUIRE(history.size() == 4);
    REQUIRE(history[0] == Approx(0.0).margin(1e-9));
    REQUIRE(history[1] == Approx(200 * dt));
    REQUIRE(history[2] == Approx(400 * dt));
    REQUIRE(history[3] == Approx(600 * dt));
    REQUIRE(sim.t() == Approx(650 * dt));
}

TEST_CASE("Transition tick budget is configurable", "[engine][signal]")
{
    SimulationConfig config;
    config.transition_ticks = 30;
    Simulation sim(config);
    sim.addRoad({0.0, 0.0}, {100.0, 0.0});
    sim.addTrafficSignal({{0}}, {{true}, {false}}, 50.0, 0.4, 15.0);

    sim.run(true, 10);
    const auto &history = sim.trafficSignals().front().updateHistory();
    REQUIRE(history.size() == 2);
    REQUIRE(history[1] == Approx(30 * sim.dt()));
    REQUIRE(sim.t() == Approx(40 * sim.dt()));
}

TEST_CASE("Actioned run stops after the first signal update when the episode ends", "[engine][signal]")
{
    Simulation sim;
    buildCrossing(sim);
    sim.addTrafficSignal({{0}, {1}}, {{true, true}, {true, true}}, 50.0, 0.4, 15.0);
    sim.insertVehicle({0}, 49.0);
    sim.insertVehicle({1}, 49.5);

    sim.run(true);
    REQUIRE(sim.completed());
    REQUIRE(sim.trafficSignals().front().updateHistory().size() == 1);
    REQUIRE(sim.t() == Approx(sim.dt()));
}

TEST_CASE("Closed display stops a run at the tick boundary", "[engine][display]")
{
    Simulation sim;
    sim.addRoad({0.0, 0.0}, {1000.0, 0.0});
    sim.insertVehicle({0});

    CountingDisplay display(5);
    sim.attachDisplay(&display);
    REQUIRE(display.updates == 1);
    REQUIRE_FALSE(sim.displayClosed());

    sim.run(false, 100);
    REQUIRE(sim.displayClosed());
    REQUIRE(display.updates == 5);
    REQUIRE(sim.t() == Approx(4 * sim.dt()));
}

TEST_CASE("Registration with unknown road indices fails fast", "[engine][config]")
{
    Simulation sim;
    sim.addRoad({0.0, 0.0}, {10.0, 0.0});

    REQUIRE_THROWS_AS(sim.addGenerator(10.0, {{1, {0, 5}}}), std::out_of_range);
    REQUIRE_THROWS_AS(sim.addGenerator(10.0, {{1, {}}}), std::out_of_range);
    REQUIRE_THROWS_AS(sim.addTrafficSignal({{3}}, {{true}}, 50.0, 0.4, 15.0), std::out_of_range);
    REQUIRE_THROWS_AS(sim.addIntersections({{0, {9}}}), std::out_of_range);
    REQUIRE_THROWS_AS(sim.insertVehicle({4}), std::out_of_range);
    REQUIRE(sim.generators().empty());
    REQUIRE(sim.trafficSignals().empty());
}

TEST_CASE("Snapshot JSON reports metrics and vehicles", "[engine][ui]")
{
    Simulation sim;
    sim.addRoad({0.0, 0.0}, {100.0, 0.0});
    sim.insertVehicle({0}, 5.0);
    sim.update();

    auto snapshot = nlohmann::json::parse(sim.getSnapshotJson());
    REQUIRE(snapshot["metrics"]["vehicles_on_map"] == 1);
    REQUIRE(snapshot["metrics"]["collision_detected"] == false);
    REQUIRE(snapshot["roads"].size() == 1);
    REQUIRE(snapshot["roads"][0]["vehicles"][0]["x"].get<double>() > 5.0);

    SimulationMetrics metrics = sim.getMetrics();
    REQUIRE(metrics.vehicles_generated == 1);
    REQUIRE(metrics.active_roads == 1);
    REQUIRE_FALSE(metrics.completed);
}
