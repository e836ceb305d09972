#include "CollisionDetector.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace trafficsim
{

    IntersectionMap reduceIntersections(const IntersectionMap &topology, const std::set<RoadIndex> &active_roads)
    {
        IntersectionMap output;
        for (RoadIndex road : active_roads)
        {
            auto it = topology.find(road);
            if (it == topology.end())
            {
                continue;
            }

            std::set<RoadIndex> intersecting;
            std::set_intersection(it->second.begin(), it->second.end(),
                                  active_roads.begin(), active_roads.end(),
                                  std::inserter(intersecting, intersecting.end()));
            if (!intersecting.empty())
            {
                output[road] = std::move(intersecting);
            }
        }
        return output;
    }

    void mergeSymmetric(IntersectionMap &target, const IntersectionMap &pairs)
    {
        for (const auto &entry : pairs)
        {
            for (RoadIndex other : entry.second)
            {
                if (other == entry.first)
                {
                    continue;
                }
                target[entry.first].insert(other);
                target[other].insert(entry.first);
            }
        }
    }

    std::vector<CollisionRecord> detectCollisions(const std::deque<Road> &roads,
                                                  const IntersectionMap &intersections,
                                                  double radius,
                                                  CollisionScanMode mode)
    {
        std::vector<CollisionRecord> found;

        for (const auto &entry : intersections)
        {
            const Road &main_road = roads.at(entry.first);
            for (RoadIndex other_index : entry.second)
            {
                // The relation is symmetric; in exhaustive mode visit each road pair once
                if (mode == CollisionScanMode::All && other_index < entry.first)
                {
                    continue;
                }

                const Road &other_road = roads.at(other_index);
                for (const auto &vehicle : main_road.vehicles())
                {
                    for (const auto &other : other_road.vehicles())
                    {
                        double d = distance(vehicle.position, other.position);
                        if (d < radius)
                        {
                            found.push_back({main_road.index(), other_road.index(), vehicle.id, other.id, d});
                            if (mode == CollisionScanMode::FirstOnly)
                            {
                                return found;
                            }
                        }
                    }
                }
            }
        }

        return found;
    }

} // namespace trafficsim
