#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace trafficsim
{
    using RoadIndex = std::size_t;

    struct Point
    {
        double x = 0.0;
        double y = 0.0;
    };

    inline double distance(const Point &a, const Point &b)
    {
        return std::hypot(a.x - b.x, a.y - b.y);
    }

    struct Vehicle
    {
        uint32_t id;
        std::vector<RoadIndex> path;
        std::size_t current_road_index; // position in path
        double spawn_time;

        double x;      // meters from the start of the current road
        double v;      // m/s
        double a;      // m/s^2
        Point position; // world coordinates, refreshed by the owning road
        bool stopped;

        // Intelligent Driver Model parameters
        double length = 4.0;
        double s0 = 4.0;
        double T = 1.0;
        double v_max = 16.6;
        double a_max = 1.44;
        double b_max = 4.61;

        Vehicle(uint32_t vid, std::vector<RoadIndex> route, double spawned_at = 0.0)
            : id(vid), path(std::move(route)), current_road_index(0), spawn_time(spawned_at),
              x(0.0), v(16.6), a(0.0), stopped(false),
              nominal_v_max(16.6), sqrt_ab(2.0 * std::sqrt(1.44 * 4.61)),
              waiting_time(0.0), wait_start(-1.0) {}

        bool hasNextRoad() const { return current_road_index + 1 < path.size(); }

        RoadIndex currentRoad() const { return path[current_road_index]; }

        RoadIndex nextRoad() const { return path[current_road_index + 1]; }

        // Elapsed time since the vehicle entered the network
        double getTotalWaitingTime(double current_time) const
        {
            return current_time - spawn_time;
        }

        // Accumulated standstill time at signals, including an open wait
        double currentWaitingTime(double current_time) const
        {
            if (wait_start < 0.0)
                return waiting_time;
            return waiting_time + (current_time - wait_start);
        }

        bool isWaiting() const { return wait_start >= 0.0; }

        void startWait(double t)
        {
            if (wait_start < 0.0)
                wait_start = t;
        }

        void endWait(double t)
        {
            if (wait_start >= 0.0)
            {
                waiting_time += t - wait_start;
                wait_start = -1.0;
            }
        }

        void update(const Vehicle *lead, double dt)
        {
            if (v + a * dt < 0.0)
            {
                x -= 0.5 * v * v / a;
                v = 0.0;
            }
            else
            {
                v += a * dt;
                x += v * dt + a * dt * dt / 2.0;
            }

            double alpha = 0.0;
            if (lead)
            {
                // Guard against a zero gap when a leader was just handed in at x = 0
                double delta_x = std::max(lead->x - x - lead->length, 1e-3);
                double delta_v = v - lead->v;
                alpha = (s0 + std::max(0.0, T * v + delta_v * v / sqrt_ab)) / delta_x;
            }

            a = a_max * (1.0 - std::pow(v / v_max, 4) - alpha * alpha);

            if (stopped)
                a = -b_max * v / v_max;
        }

        void stop() { stopped = true; }

        void unstop() { stopped = false; }

        void slow(double speed) { v_max = speed; }

        void unslow() { v_max = nominal_v_max; }

        double nominalMaxSpeed() const { return nominal_v_max; }

        // Bookkeeping
        double nominal_v_max;
        double sqrt_ab;
        double waiting_time;
        double wait_start; // negative while not waiting
    };

} // namespace trafficsim
