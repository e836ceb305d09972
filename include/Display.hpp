#pragma once

namespace trafficsim
{
    class Simulation;

    class IDisplay
    {
    public:
        virtual ~IDisplay() = default;
        virtual void update(const Simulation &sim) = 0;
        virtual bool closed() const = 0;
    };

} // namespace trafficsim
