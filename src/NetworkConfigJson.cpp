#include "NetworkConfigJson.hpp"

#include <nlohmann/json.hpp>

namespace trafficsim
{
    namespace
    {
        using nlohmann::json;

        json pointToJson(const Point &point)
        {
            return json::array({point.x, point.y});
        }

        bool pointFromJson(const json &value, Point &point)
        {
            if (!value.is_array() || value.size() != 2 || !value[0].is_number() || !value[1].is_number())
            {
                return false;
            }
            point.x = value[0].get<double>();
            point.y = value[1].get<double>();
            return true;
        }

        bool roadListFromJson(const json &value, std::vector<RoadIndex> &roads)
        {
            if (!value.is_array())
            {
                return false;
            }
            for (const auto &entry : value)
            {
                if (!entry.is_number_unsigned())
                {
                    return false;
                }
                roads.push_back(entry.get<RoadIndex>());
            }
            return true;
        }

        bool readOptionalNumber(const json &object, const char *key, double &value)
        {
            if (!object.contains(key))
            {
                return true;
            }
            if (!object[key].is_number())
            {
                return false;
            }
            value = object[key].get<double>();
            return true;
        }

        void parseRoads(const json &root, ConfigParseResult &result)
        {
            if (!root.contains("roads") || !root["roads"].is_array())
            {
                result.errors.push_back("roads must be an array");
                return;
            }

            for (const auto &road_json : root["roads"])
            {
                RoadConfig road;
                if (!road_json.is_object() ||
                    !road_json.contains("start") || !pointFromJson(road_json["start"], road.start) ||
                    !road_json.contains("end") || !pointFromJson(road_json["end"], road.end))
                {
                    result.errors.push_back("road " + std::to_string(result.config.roads.size()) +
                                            " needs start and end as [x, y]");
                    continue;
                }
                result.config.roads.push_back(road);
            }
        }

        void parseGenerators(const json &root, ConfigParseResult &result)
        {
            if (!root.contains("generators"))
            {
                return;
            }
            if (!root["generators"].is_array())
            {
                result.errors.push_back("generators must be an array");
                return;
            }

            for (const auto &generator_json : root["generators"])
            {
                if (!generator_json.is_object())
                {
                    result.errors.push_back("generator entries must be objects");
                    continue;
                }

                GeneratorConfig generator;
                if (!generator_json.contains("vehicle_rate") || !generator_json["vehicle_rate"].is_number())
                {
                    result.errors.push_back("generator.vehicle_rate must be a number");
                    continue;
                }
                generator.vehicle_rate = generator_json["vehicle_rate"].get<double>();

                if (!generator_json.contains("paths") || !generator_json["paths"].is_array())
                {
                    result.errors.push_back("generator.paths must be an array");
                    continue;
                }

                for (const auto &path_json : generator_json["paths"])
                {
                    WeightedPath path;
                    if (!path_json.is_object())
                    {
                        result.errors.push_back("path entries must be objects");
                        continue;
                    }
                    if (path_json.contains("weight"))
                    {
                        if (!path_json["weight"].is_number_unsigned())
                        {
                            result.errors.push_back("path.weight must be a non-negative integer");
                            continue;
                        }
                        path.weight = path_json["weight"].get<unsigned>();
                    }
                    if (!path_json.contains("roads") || !roadListFromJson(path_json["roads"], path.roads))
                    {
                        result.errors.push_back("path.roads must be an array of road indices");
                        continue;
                    }
                    generator.paths.push_back(path);
                }

                result.config.generators.push_back(generator);
            }
        }

        void parseSignals(const json &root, ConfigParseResult &result)
        {
            if (!root.contains("signals"))
            {
                return;
            }
            if (!root["signals"].is_array())
            {
                result.errors.push_back("signals must be an array");
                return;
            }

            for (const auto &signal_json : root["signals"])
            {
                if (!signal_json.is_object())
                {
                    result.errors.push_back("signal entries must be objects");
                    continue;
                }

                SignalConfig signal;
                if (!signal_json.contains("road_groups") || !signal_json["road_groups"].is_array())
                {
                    result.errors.push_back("signal.road_groups must be an array");
                    continue;
                }
                bool groups_ok = true;
                for (const auto &group_json : signal_json["road_groups"])
                {
                    std::vector<RoadIndex> group;
                    if (!roadListFromJson(group_json, group))
                    {
                        groups_ok = false;
                        break;
                    }
                    signal.road_groups.push_back(group);
                }
                if (!groups_ok)
                {
                    result.errors.push_back("signal road groups must be arrays of road indices");
                    continue;
                }

                if (!signal_json.contains("cycle") || !signal_json["cycle"].is_array())
                {
                    result.errors.push_back("signal.cycle must be an array");
                    continue;
                }
                bool cycle_ok = true;
                for (const auto &phase_json : signal_json["cycle"])
                {
                    if (!phase_json.is_array())
                    {
                        cycle_ok = false;
                        break;
                    }
                    SignalPhase phase;
                    for (const auto &flag : phase_json)
                    {
                        if (!flag.is_boolean())
                        {
                            cycle_ok = false;
                            break;
                        }
                        phase.push_back(flag.get<bool>());
                    }
                    signal.cycle.push_back(phase);
                }
                if (!cycle_ok)
                {
                    result.errors.push_back("signal cycle phases must be arrays of booleans");
                    continue;
                }

                if (!readOptionalNumber(signal_json, "slow_distance", signal.slow_distance) ||
                    !readOptionalNumber(signal_json, "slow_factor", signal.slow_factor) ||
                    !readOptionalNumber(signal_json, "stop_distance", signal.stop_distance))
                {
                    result.errors.push_back("signal distances and slow_factor must be numbers");
                    continue;
                }
                result.config.signals.push_back(signal);
            }
        }

        void parseIntersections(const json &root, ConfigParseResult &result)
        {
            if (!root.contains("intersections"))
            {
                return;
            }
            if (!root["intersections"].is_array())
            {
                result.errors.push_back("intersections must be an array");
                return;
            }

            for (const auto &entry_json : root["intersections"])
            {
                if (!entry_json.is_object() || !entry_json.contains("road") || !entry_json["road"].is_number_unsigned())
                {
                    result.errors.push_back("intersection.road must be a road index");
                    continue;
                }

                std::vector<RoadIndex> intersecting;
                if (!entry_json.contains("intersecting") || !roadListFromJson(entry_json["intersecting"], intersecting))
                {
                    result.errors.push_back("intersection.intersecting must be an array of road indices");
                    continue;
                }

                const RoadIndex road = entry_json["road"].get<RoadIndex>();
                result.config.intersections[road].insert(intersecting.begin(), intersecting.end());
            }
        }
    }

    std::string networkConfigToJson(const NetworkConfig &config)
    {
        json root;

        root["roads"] = json::array();
        for (const auto &road : config.roads)
        {
            root["roads"].push_back({{"start", pointToJson(road.start)}, {"end", pointToJson(road.end)}});
        }

        root["generators"] = json::array();
        for (const auto &generator : config.generators)
        {
            json generator_json;
            generator_json["vehicle_rate"] = generator.vehicle_rate;
            generator_json["paths"] = json::array();
            for (const auto &path : generator.paths)
            {
                generator_json["paths"].push_back({{"weight", path.weight}, {"roads", path.roads}});
            }
            root["generators"].push_back(generator_json);
        }

        root["signals"] = json::array();
        for (const auto &signal : config.signals)
        {
            json signal_json;
            signal_json["road_groups"] = signal.road_groups;
            signal_json["cycle"] = signal.cycle;
            signal_json["slow_distance"] = signal.slow_distance;
            signal_json["slow_factor"] = signal.slow_factor;
            signal_json["stop_distance"] = signal.stop_distance;
            root["signals"].push_back(signal_json);
        }

        root["intersections"] = json::array();
        for (const auto &entry : config.intersections)
        {
            root["intersections"].push_back({{"road", entry.first}, {"intersecting", entry.second}});
        }

        root["junction_roads"] = config.junction_roads;
        if (config.max_gen.has_value())
        {
            root["max_gen"] = *config.max_gen;
        }
        else
        {
            root["max_gen"] = nullptr;
        }

        return root.dump();
    }

    ConfigParseResult networkConfigFromJson(const std::string &json_text)
    {
        ConfigParseResult result;

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            result.errors.push_back("root must be an object");
            return result;
        }

        parseRoads(root, result);
        parseGenerators(root, result);
        parseSignals(root, result);
        parseIntersections(root, result);

        if (root.contains("junction_roads") &&
            !roadListFromJson(root["junction_roads"], result.config.junction_roads))
        {
            result.errors.push_back("junction_roads must be an array of road indices");
        }

        if (root.contains("max_gen") && !root["max_gen"].is_null())
        {
            if (root["max_gen"].is_number_unsigned())
            {
                result.config.max_gen = root["max_gen"].get<uint32_t>();
            }
            else
            {
                result.errors.push_back("max_gen must be a non-negative integer or null");
            }
        }

        result.ok = result.errors.empty();
        return result;
    }

    std::string validationErrorsToJson(const std::vector<std::string> &errors)
    {
        json root;
        root["ok"] = false;
        root["errors"] = errors;
        return root.dump();
    }

} // namespace trafficsim
