#include "gridwalk/core/grid.hpp"
#include <algorithm>

namespace gridwalk::core {

char terrain_glyph(Terrain terrain) noexcept {
    switch (terrain) {
        case Terrain::Empty: return ' ';
        case Terrain::Wall: return '#';
        case Terrain::SpawnPoint: return '^';
        case Terrain::Destination: return '$';
    }
    return '?';
}

std::optional<Terrain> terrain_from_glyph(char glyph) noexcept {
    switch (glyph) {
        case ' ': return Terrain::Empty;
        case '#': return Terrain::Wall;
        case '^': return Terrain::SpawnPoint;
        case '$': return Terrain::Destination;
        default: return std::nullopt;
    }
}

Grid::Grid(int width, int height, std::vector<Terrain> cells)
    : width_(width)
    , height_(height)
    , cells_(std::move(cells)) {
}

Grid Grid::parse(std::string_view description) {
    std::vector<std::string_view> lines;

    size_t start = 0;
    while (start <= description.size()) {
        size_t end = description.find('\n', start);
        if (end == std::string_view::npos) {
            end = description.size();
        }

        auto line = description.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (!line.empty()) {
            lines.push_back(line);
        }

        start = end + 1;
    }

    if (lines.empty()) {
        throw MapError(ErrorKind::EmptyMap);
    }

    const auto longest = std::max_element(lines.begin(), lines.end(),
        [](std::string_view a, std::string_view b) { return a.size() < b.size(); });

    const int width = static_cast<int>(longest->size());
    const int height = static_cast<int>(lines.size());

    std::vector<Terrain> cells(static_cast<size_t>(width) * static_cast<size_t>(height),
                               Terrain::Empty);

    for (int y = 0; y < height; ++y) {
        const auto line = lines[static_cast<size_t>(y)];
        for (int x = 0; x < static_cast<int>(line.size()); ++x) {
            const char glyph = line[static_cast<size_t>(x)];
            auto terrain = terrain_from_glyph(glyph);
            if (!terrain) {
                throw MapError(glyph, Cell{x, y});
            }
            cells[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)] = *terrain;
        }
    }

    return Grid(width, height, std::move(cells));
}

Terrain Grid::terrain_at(const Cell& cell) const {
    if (!in_bounds(cell)) {
        throw OutOfBounds(cell, width_, height_);
    }
    return cells_[index_of(cell)];
}

std::vector<Cell> Grid::cells_with(Terrain terrain) const {
    std::vector<Cell> found;
    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            if (cells_[index_of({x, y})] == terrain) {
                found.push_back({x, y});
            }
        }
    }
    return found;
}

std::vector<std::string> Grid::to_lines() const {
    std::vector<std::string> lines;
    lines.reserve(static_cast<size_t>(height_));

    for (int y = 0; y < height_; ++y) {
        std::string row;
        row.reserve(static_cast<size_t>(width_));
        for (int x = 0; x < width_; ++x) {
            row.push_back(terrain_glyph(cells_[index_of({x, y})]));
        }
        lines.push_back(std::move(row));
    }

    return lines;
}

} // namespace gridwalk::core
