#pragma once

#include "Display.hpp"

#include <cstddef>
#include <functional>
#include <ostream>

namespace trafficsim
{
    // Writes one JSON snapshot line every `every_n` updates; reports closed once
    // close_requested returns true. A null stream only tracks the close request.
    class SnapshotStreamDisplay : public IDisplay
    {
    public:
        using CloseRequest = std::function<bool()>;

        SnapshotStreamDisplay(std::ostream *out, std::size_t every_n, CloseRequest close_requested = nullptr);

        void update(const Simulation &sim) override;
        bool closed() const override;

        std::size_t framesWritten() const { return frames_written; }

    private:
        std::ostream *out;
        std::size_t every_n;
        CloseRequest close_requested;
        std::size_t updates = 0;
        std::size_t frames_written = 0;
    };

} // namespace trafficsim
