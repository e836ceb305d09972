#include "Road.hpp"

#include <utility>

namespace trafficsim
{
    namespace
    {
        constexpr double STANDSTILL_SPEED = 0.1; // m/s, below this a vehicle counts as waiting
    }

    Road::Road(Point start, Point end, RoadIndex index)
        : start_point(start), end_point(end), road_index(index),
          road_length(distance(start, end)), angle_cos(1.0), angle_sin(0.0)
    {
        if (road_length > 0.0)
        {
            angle_cos = (end.x - start.x) / road_length;
            angle_sin = (end.y - start.y) / road_length;
        }
    }

    void Road::setTrafficSignal(const TrafficSignal *signal, std::size_t group)
    {
        traffic_signal = signal;
        signal_group = group;
    }

    bool Road::trafficSignalState() const
    {
        if (!traffic_signal)
        {
            return true;
        }
        return traffic_signal->isGreen(signal_group);
    }

    Point Road::pointAt(double x) const
    {
        return {start_point.x + angle_cos * x, start_point.y + angle_sin * x};
    }

    void Road::pushBack(Vehicle vehicle)
    {
        vehicle.position = pointAt(vehicle.x);
        queue.push_back(std::move(vehicle));
    }

    Vehicle Road::popFront()
    {
        Vehicle front = std::move(queue.front());
        queue.pop_front();
        return front;
    }

    bool Road::hasRoomForEntry(const Vehicle &vehicle) const
    {
        if (queue.empty())
        {
            return true;
        }
        return queue.back().x > vehicle.s0 + vehicle.length;
    }

    void Road::update(double dt, double t)
    {
        if (queue.empty())
        {
            return;
        }

        queue.front().update(nullptr, dt);
        for (std::size_t i = 1; i < queue.size(); ++i)
        {
            queue[i].update(&queue[i - 1], dt);
        }

        applySignal();

        for (auto &vehicle : queue)
        {
            vehicle.position = pointAt(vehicle.x);
            if (vehicle.v < STANDSTILL_SPEED)
                vehicle.startWait(t);
            else
                vehicle.endWait(t);
        }
    }

    void Road::applySignal()
    {
        Vehicle &lead = queue.front();

        if (trafficSignalState())
        {
            lead.unstop();
            for (auto &vehicle : queue)
            {
                vehicle.unslow();
            }
            return;
        }

        const double slow_distance = traffic_signal->slowDistance();
        const double stop_distance = traffic_signal->stopDistance();

        if (lead.x >= road_length - slow_distance)
        {
            lead.slow(traffic_signal->slowFactor() * lead.nominalMaxSpeed());
        }
        if (lead.x >= road_length - stop_distance &&
            lead.x <= road_length - stop_distance / 2.0)
        {
            lead.stop();
        }
    }

} // namespace trafficsim
