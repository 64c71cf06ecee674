#pragma once

#include "gridwalk/ports/renderer.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace gridwalk::adapters {

// Draws the grid with its map glyphs and a '*' on every agent cell.
class TextRenderer : public gridwalk::ports::IRenderer {
public:
    explicit TextRenderer(std::ostream& out, bool clear_screen = false)
        : out_(out), clear_screen_(clear_screen) {}
    ~TextRenderer() override = default;

    void render(const gridwalk::ports::RenderState& state) override;

    static std::vector<std::string> compose_frame(const gridwalk::ports::RenderState& state);

    static constexpr char AGENT_GLYPH = '*';

private:
    std::ostream& out_;
    bool clear_screen_;
};

} // namespace gridwalk::adapters
