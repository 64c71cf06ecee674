#pragma once

#include "gridwalk/core/grid.hpp"
#include "gridwalk/core/metrics.hpp"
#include <vector>
#include <memory>
#include <concepts>

namespace gridwalk::ports {

// Read-only view handed to a renderer between ticks.
struct RenderState {
    const gridwalk::core::Grid* grid = nullptr;
    std::vector<gridwalk::core::AgentState> agents;
    gridwalk::core::MetricsSnapshot metrics;
    gridwalk::core::Tick current_tick = 0;
    bool simulation_complete = false;
};

class IRenderer {
public:
    virtual ~IRenderer() = default;

    virtual void render(const RenderState& state) = 0;
};

template<typename T>
concept RendererImpl = std::derived_from<T, IRenderer>;

using RendererPtr = std::unique_ptr<IRenderer>;

} // namespace gridwalk::ports
