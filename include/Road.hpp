#pragma once

#include "TrafficSignal.hpp"
#include "Vehicle.hpp"

#include <cstddef>
#include <deque>

namespace trafficsim
{

    class Road
    {
    public:
        Road(Point start, Point end, RoadIndex index);

        // Advance every vehicle by dt; t is used for standstill bookkeeping
        void update(double dt, double t);

        // Attach the controlling signal and the road's group within it
        void setTrafficSignal(const TrafficSignal *signal, std::size_t group);
        bool hasTrafficSignal() const { return traffic_signal != nullptr; }
        bool trafficSignalState() const;

        // Tail append; refreshes the vehicle's world position
        void pushBack(Vehicle vehicle);
        // Head removal
        Vehicle popFront();

        // True when a vehicle entering at x = 0 keeps the minimum gap to the tail vehicle
        bool hasRoomForEntry(const Vehicle &vehicle) const;

        Point pointAt(double x) const;

        std::deque<Vehicle> &vehicles() { return queue; }
        const std::deque<Vehicle> &vehicles() const { return queue; }
        bool empty() const { return queue.empty(); }
        std::size_t size() const { return queue.size(); }

        Point start() const { return start_point; }
        Point end() const { return end_point; }
        double length() const { return road_length; }
        RoadIndex index() const { return road_index; }

    private:
        void applySignal();

        Point start_point;
        Point end_point;
        RoadIndex road_index;
        double road_length;
        double angle_cos;
        double angle_sin;
        std::deque<Vehicle> queue;

        const TrafficSignal *traffic_signal = nullptr;
        std::size_t signal_group = 0;
    };

} // namespace trafficsim
