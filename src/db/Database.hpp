#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trafficsim::db
{
    struct StoredEpisodeResult
    {
        std::string policy;
        std::size_t episode = 0;
        double wait_time = 0.0;
        bool collided = false;
    };

    class Database
    {
    public:
        explicit Database(std::string file_path);

        bool initialize(std::string *error = nullptr) const;
        bool saveActiveNetworkConfigJson(const std::string &config_json, std::string *error = nullptr) const;
        std::optional<std::string> loadActiveNetworkConfigJson(std::string *error = nullptr) const;

        bool saveEpisodeResult(const StoredEpisodeResult &result, std::string *error = nullptr) const;
        std::vector<StoredEpisodeResult> loadEpisodeResults(const std::string &policy, std::string *error = nullptr) const;

    private:
        std::string file_path;
    };

} // namespace trafficsim::db
