#include <iostream>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <memory>
#include <string>
#include "Environment.hpp"
#include "NetworkConfigJson.hpp"
#include "NetworkValidator.hpp"
#include "SignalPolicies.hpp"
#include "SnapshotStreamDisplay.hpp"
#include "db/Database.hpp"

namespace
{
    std::atomic<bool> g_keep_running{true};

    void handleSignal(int)
    {
        g_keep_running = false;
    }

    struct Options
    {
        std::string policy = "fc";
        std::size_t episodes = 10;
        std::string db_path = "trafficsim.db";
        std::string trace_path;
        uint32_t seed = 0;
    };

    void printUsage()
    {
        std::cerr << "Usage: trafficsim [fc|lqf] [episodes] [--db PATH] [--trace PATH] [--seed N]" << std::endl;
    }

    bool parseOptions(int argc, char **argv, Options &options)
    {
        int positional = 0;
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            try
            {
                if (arg == "--db" && i + 1 < argc)
                    options.db_path = argv[++i];
                else if (arg == "--trace" && i + 1 < argc)
                    options.trace_path = argv[++i];
                else if (arg == "--seed" && i + 1 < argc)
                    options.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
                else if (positional == 0 && (arg == "fc" || arg == "lqf"))
                {
                    options.policy = arg;
                    positional++;
                }
                else if (positional <= 1 && !arg.empty() && arg[0] != '-')
                {
                    options.episodes = static_cast<std::size_t>(std::stoul(arg));
                    positional = 2;
                }
                else
                    return false;
            }
            catch (const std::exception &)
            {
                return false;
            }
        }
        return options.episodes > 0;
    }

    trafficsim::NetworkConfig loadNetworkConfig(const trafficsim::db::Database &database)
    {
        std::string db_error;
        trafficsim::NetworkConfig config = trafficsim::makeTwoWayIntersectionConfig();

        if (auto stored = database.loadActiveNetworkConfigJson(&db_error); stored.has_value())
        {
            trafficsim::ConfigParseResult parsed = trafficsim::networkConfigFromJson(*stored);
            trafficsim::NetworkValidator validator(parsed.config);
            if (parsed.ok && validator.isConfigValid())
            {
                return parsed.config;
            }

            const auto &errors = parsed.ok ? validator.errors() : parsed.errors;
            std::cerr << "Warning: stored network config is invalid, using defaults: "
                      << trafficsim::validationErrorsToJson(errors) << std::endl;
        }
        else if (!db_error.empty())
        {
            std::cerr << "Warning: failed to load network config from database: " << db_error << std::endl;
        }
        else if (!database.saveActiveNetworkConfigJson(trafficsim::networkConfigToJson(config), &db_error))
        {
            std::cerr << "Warning: failed to store default network config: " << db_error << std::endl;
        }

        return config;
    }
}

int main(int argc, char **argv)
{
    Options options;
    if (!parseOptions(argc, argv, options))
    {
        printUsage();
        return 2;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    trafficsim::db::Database database(options.db_path);
    std::string db_error;
    const bool db_ready = database.initialize(&db_error);
    if (!db_ready)
    {
        std::cerr << "Warning: failed to initialize database: " << db_error << std::endl;
    }

    trafficsim::NetworkConfig network = db_ready ? loadNetworkConfig(database)
                                                 : trafficsim::makeTwoWayIntersectionConfig();

    trafficsim::EnvironmentConfig env_config;
    env_config.simulation.seed = options.seed;
    trafficsim::Environment environment(network, env_config);

    std::unique_ptr<trafficsim::ISignalPolicy> policy;
    if (options.policy == "lqf")
        policy = std::make_unique<trafficsim::LongestQueuePolicy>();
    else
        policy = std::make_unique<trafficsim::FixedCyclePolicy>();

    std::ofstream trace;
    if (!options.trace_path.empty())
    {
        trace.open(options.trace_path, std::ios::trunc);
        if (!trace.good())
        {
            std::cerr << "Warning: failed to open trace file " << options.trace_path << std::endl;
        }
    }
    trafficsim::SnapshotStreamDisplay display(trace.is_open() ? &trace : nullptr, 60,
                                              []()
                                              { return !g_keep_running; });

    std::cout << std::endl
              << " -- Running " << policy->name() << " for " << options.episodes << " episodes -- " << std::endl;
    std::cout << std::fixed << std::setprecision(2);

    trafficsim::BaselineReport report = trafficsim::runBaseline(
        environment, *policy, options.episodes, &display,
        [&](const trafficsim::EpisodeResult &result)
        {
            if (result.collided)
                std::cout << "Episode " << result.episode << " - Collisions: 1" << std::endl;
            else
                std::cout << "Episode " << result.episode << " - Wait time: " << result.wait_time << std::endl;

            if (db_ready)
            {
                std::string error;
                trafficsim::db::StoredEpisodeResult stored{policy->name(), result.episode, result.wait_time, result.collided};
                if (!database.saveEpisodeResult(stored, &error))
                {
                    std::cerr << "Warning: failed to store episode result: " << error << std::endl;
                }
            }
        });

    if (report.truncated)
    {
        std::cout << "Run interrupted." << std::endl;
        return 0;
    }

    const std::size_t n_completed = report.episodes.size() - report.collisions;
    std::cout << std::endl
              << " -- Results after " << report.episodes.size() << " episodes: -- " << std::endl;
    if (n_completed > 0)
        std::cout << "Average wait time per completed episode: " << report.average_wait_time << std::endl;
    else
        std::cout << "Average wait time per completed episode: n/a" << std::endl;
    std::cout << "Average collisions per episode: " << report.collisions_per_episode << std::endl;
    return 0;
}
