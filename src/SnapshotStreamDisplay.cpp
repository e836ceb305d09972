#include "SnapshotStreamDisplay.hpp"
#include "Simulation.hpp"

#include <utility>

namespace trafficsim
{

    SnapshotStreamDisplay::SnapshotStreamDisplay(std::ostream *out, std::size_t every_n, CloseRequest close_requested)
        : out(out), every_n(every_n == 0 ? 1 : every_n), close_requested(std::move(close_requested))
    {
    }

    void SnapshotStreamDisplay::update(const Simulation &sim)
    {
        if (updates++ % every_n != 0 || !out)
        {
            return;
        }

        *out << sim.getSnapshotJson() << '\n';
        frames_written++;
    }

    bool SnapshotStreamDisplay::closed() const
    {
        return close_requested && close_requested();
    }

} // namespace trafficsim
