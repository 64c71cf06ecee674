#pragma once

#include <functional>
#include <memory>

namespace gridwalk::ports {

// Drives the simulation: calls on_tick once per period until it returns false
// or a terminate signal arrives.
class ITickSource {
public:
    using TickHandler = std::function<bool()>;

    virtual ~ITickSource() = default;

    virtual void run(TickHandler on_tick) = 0;
    virtual void stop() = 0;
    virtual bool terminated_by_signal() const = 0;
};

using TickSourcePtr = std::unique_ptr<ITickSource>;

} // namespace gridwalk::ports
