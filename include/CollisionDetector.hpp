#pragma once

#include "Road.hpp"
#include "Vehicle.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <set>
#include <vector>

namespace trafficsim
{
    // {road index: intersecting road indices}
    using IntersectionMap = std::map<RoadIndex, std::set<RoadIndex>>;

    enum class CollisionScanMode
    {
        FirstOnly,
        All
    };

    struct CollisionRecord
    {
        RoadIndex road_a = 0;
        RoadIndex road_b = 0;
        uint32_t vehicle_a = 0;
        uint32_t vehicle_b = 0;
        double distance = 0.0;
    };

    static constexpr double COLLISION_RADIUS = 2.0;

    // Restrict the static topology to active roads, dropping roads left without active partners
    IntersectionMap reduceIntersections(const IntersectionMap &topology, const std::set<RoadIndex> &active_roads);

    // Add every pair in both directions so the relation stays symmetric
    void mergeSymmetric(IntersectionMap &target, const IntersectionMap &pairs);

    // Pairwise distance scan over the given (already active-filtered) intersections.
    // FirstOnly returns at the first pair closer than radius; All reports each road pair once.
    std::vector<CollisionRecord> detectCollisions(const std::deque<Road> &roads,
                                                  const IntersectionMap &intersections,
                                                  double radius = COLLISION_RADIUS,
                                                  CollisionScanMode mode = CollisionScanMode::FirstOnly);

} // namespace trafficsim
