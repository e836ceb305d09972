#include "SignalPolicies.hpp"

namespace trafficsim
{
    namespace
    {
        // Bound for networks without a generation limit, which never complete on their own
        constexpr std::size_t MAX_STEPS_PER_EPISODE = 5000;
    }

    BaselineReport runBaseline(Environment &environment,
                               ISignalPolicy &policy,
                               std::size_t n_episodes,
                               IDisplay *display,
                               const EpisodeCallback &on_episode)
    {
        BaselineReport report;
        double total_wait_time = 0.0;

        for (std::size_t episode = 1; episode <= n_episodes; ++episode)
        {
            EnvironmentState state = environment.reset(display);
            policy.reset();
            EpisodeResult result;
            result.episode = episode;

            bool done = false;
            std::size_t steps = 0;
            while (!done && steps < MAX_STEPS_PER_EPISODE)
            {
                steps++;
                bool action = policy.decide(environment.sim(), state);
                StepResult step = environment.step(action);
                if (step.truncated)
                {
                    report.truncated = true;
                    break;
                }
                state = step.state;
                result.score += step.reward;
                result.collided = result.collided || environment.sim().collisionDetected();
                done = step.done;
            }

            if (report.truncated)
            {
                break;
            }

            if (result.collided)
            {
                report.collisions++;
            }
            else
            {
                result.wait_time = environment.currentAverageWaitTime();
                total_wait_time += result.wait_time;
            }

            report.episodes.push_back(result);
            if (on_episode)
            {
                on_episode(result);
            }
        }

        const std::size_t n_run = report.episodes.size();
        const std::size_t n_completed = n_run - report.collisions;
        if (n_completed > 0)
        {
            report.average_wait_time = total_wait_time / static_cast<double>(n_completed);
        }
        if (n_run > 0)
        {
            report.collisions_per_episode = static_cast<double>(report.collisions) / static_cast<double>(n_run);
        }
        return report;
    }

} // namespace trafficsim
