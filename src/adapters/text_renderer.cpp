#include "gridwalk/adapters/text_renderer.hpp"

namespace gridwalk::adapters {

std::vector<std::string> TextRenderer::compose_frame(const gridwalk::ports::RenderState& state) {
    if (state.grid == nullptr) {
        return {};
    }

    auto lines = state.grid->to_lines();
    for (const auto& agent : state.agents) {
        if (state.grid->in_bounds(agent.pos)) {
            lines[static_cast<size_t>(agent.pos.y)][static_cast<size_t>(agent.pos.x)] = AGENT_GLYPH;
        }
    }
    return lines;
}

void TextRenderer::render(const gridwalk::ports::RenderState& state) {
    if (clear_screen_) {
        out_ << "\x1b[2J\x1b[H";
    }

    for (const auto& line : compose_frame(state)) {
        out_ << line << '\n';
    }

    out_ << "tick " << state.current_tick
         << "  moves " << state.metrics.total_moves
         << "  arrivals " << state.metrics.arrivals;
    if (state.simulation_complete) {
        out_ << "  (complete)";
    }
    out_ << '\n';
    out_.flush();
}

} // namespace gridwalk::adapters
