#pragma once

#include "NetworkConfig.hpp"

#include <string>
#include <vector>

namespace trafficsim
{

    class NetworkValidator
    {
    public:
        explicit NetworkValidator(const NetworkConfig &config);

        bool isConfigValid() const;
        const std::vector<std::string> &errors() const { return validation_errors; }

        // Maximum gap between the end of one path road and the start of the next
        static constexpr double CONNECTION_TOLERANCE = 0.5;

    private:
        void validateRoads(const NetworkConfig &config);
        void validatePaths(const NetworkConfig &config);
        void validateSignals(const NetworkConfig &config);
        void validateIntersections(const NetworkConfig &config);
        bool roadExists(const NetworkConfig &config, RoadIndex index) const;

        std::vector<std::string> validation_errors;
    };

} // namespace trafficsim
