#include "NetworkValidator.hpp"

#include <unordered_set>

namespace trafficsim
{

    NetworkValidator::NetworkValidator(const NetworkConfig &config)
    {
        validateRoads(config);
        validatePaths(config);
        validateSignals(config);
        validateIntersections(config);
    }

    bool NetworkValidator::isConfigValid() const
    {
        return validation_errors.empty();
    }

    bool NetworkValidator::roadExists(const NetworkConfig &config, RoadIndex index) const
    {
        return index < config.roads.size();
    }

    void NetworkValidator::validateRoads(const NetworkConfig &config)
    {
        if (config.roads.empty())
        {
            validation_errors.push_back("network has no roads");
        }

        for (std::size_t i = 0; i < config.roads.size(); ++i)
        {
            if (distance(config.roads[i].start, config.roads[i].end) <= 0.0)
            {
                validation_errors.push_back("road " + std::to_string(i) + " has zero length");
            }
        }

        for (RoadIndex index : config.junction_roads)
        {
            if (!roadExists(config, index))
            {
                validation_errors.push_back("junction road " + std::to_string(index) + " does not exist");
            }
        }

        if (config.max_gen.has_value() && *config.max_gen == 0)
        {
            validation_errors.push_back("max_gen must be positive when set");
        }
    }

    void NetworkValidator::validatePaths(const NetworkConfig &config)
    {
        for (std::size_t g = 0; g < config.generators.size(); ++g)
        {
            const GeneratorConfig &generator = config.generators[g];
            const std::string prefix = "generator " + std::to_string(g);

            if (generator.vehicle_rate <= 0.0)
            {
                validation_errors.push_back(prefix + " vehicle_rate must be positive");
            }
            if (generator.paths.empty())
            {
                validation_errors.push_back(prefix + " has no paths");
            }

            for (const auto &path : generator.paths)
            {
                if (path.weight == 0)
                {
                    validation_errors.push_back(prefix + " path weight must be positive");
                }
                if (path.roads.empty())
                {
                    validation_errors.push_back(prefix + " has an empty path");
                    continue;
                }

                bool indices_ok = true;
                for (RoadIndex index : path.roads)
                {
                    if (!roadExists(config, index))
                    {
                        validation_errors.push_back(prefix + " path references unknown road " + std::to_string(index));
                        indices_ok = false;
                    }
                }
                if (!indices_ok)
                {
                    continue;
                }

                for (std::size_t i = 0; i + 1 < path.roads.size(); ++i)
                {
                    const RoadConfig &from = config.roads[path.roads[i]];
                    const RoadConfig &to = config.roads[path.roads[i + 1]];
                    if (distance(from.end, to.start) > CONNECTION_TOLERANCE)
                    {
                        validation_errors.push_back(prefix + " path is disconnected between roads " +
                                                    std::to_string(path.roads[i]) + " and " +
                                                    std::to_string(path.roads[i + 1]));
                    }
                }
            }
        }
    }

    void NetworkValidator::validateSignals(const NetworkConfig &config)
    {
        std::unordered_set<RoadIndex> controlled;
        for (std::size_t s = 0; s < config.signals.size(); ++s)
        {
            const SignalConfig &signal = config.signals[s];
            const std::string prefix = "signal " + std::to_string(s);

            if (signal.road_groups.empty())
            {
                validation_errors.push_back(prefix + " has no road groups");
            }
            if (signal.cycle.empty())
            {
                validation_errors.push_back(prefix + " has an empty cycle");
            }

            for (const auto &phase : signal.cycle)
            {
                if (phase.size() != signal.road_groups.size())
                {
                    validation_errors.push_back(prefix + " cycle phase size does not match road group count");
                    break;
                }
            }

            for (const auto &group : signal.road_groups)
            {
                for (RoadIndex index : group)
                {
                    if (!roadExists(config, index))
                    {
                        validation_errors.push_back(prefix + " references unknown road " + std::to_string(index));
                    }
                    else if (!controlled.insert(index).second)
                    {
                        validation_errors.push_back("road " + std::to_string(index) + " is controlled more than once");
                    }
                }
            }

            if (signal.slow_factor <= 0.0 || signal.slow_factor > 1.0)
            {
                validation_errors.push_back(prefix + " slow_factor must be in (0, 1]");
            }
            if (signal.stop_distance < 0.0 || signal.slow_distance < 0.0)
            {
                validation_errors.push_back(prefix + " distances must not be negative");
            }
        }
    }

    void NetworkValidator::validateIntersections(const NetworkConfig &config)
    {
        for (const auto &entry : config.intersections)
        {
            if (!roadExists(config, entry.first))
            {
                validation_errors.push_back("intersection references unknown road " + std::to_string(entry.first));
            }
            for (RoadIndex other : entry.second)
            {
                if (!roadExists(config, other))
                {
                    validation_errors.push_back("intersection references unknown road " + std::to_string(other));
                }
                else if (other == entry.first)
                {
                    validation_errors.push_back("road " + std::to_string(other) + " cannot intersect itself");
                }
            }
        }
    }

} // namespace trafficsim
