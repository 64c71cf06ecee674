#pragma once

#include "gridwalk/core/types.hpp"
#include "gridwalk/core/errors.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace gridwalk::core {

enum class Terrain : std::uint8_t {
    Empty,
    Wall,
    SpawnPoint,
    Destination
};

// Map glyphs: ' ' Empty, '#' Wall, '^' SpawnPoint, '$' Destination.
char terrain_glyph(Terrain terrain) noexcept;
std::optional<Terrain> terrain_from_glyph(char glyph) noexcept;

// Immutable rectangular terrain map, stored row-major and addressed by (x, y).
class Grid {
public:
    // Lines are separated by '\n'; empty lines are skipped and short lines are
    // padded with Empty up to the longest line.
    // Throws MapError (InvalidMapCharacter or EmptyMap).
    static Grid parse(std::string_view description);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }

    bool in_bounds(const Cell& cell) const noexcept {
        return cell.x >= 0 && cell.x < width_ &&
               cell.y >= 0 && cell.y < height_;
    }

    // Throws OutOfBounds.
    Terrain terrain_at(const Cell& cell) const;

    bool is_traversable(const Cell& cell) const noexcept {
        return in_bounds(cell) && cells_[index_of(cell)] != Terrain::Wall;
    }

    std::vector<Cell> cells_with(Terrain terrain) const;
    std::vector<Cell> spawn_points() const { return cells_with(Terrain::SpawnPoint); }
    std::vector<Cell> destinations() const { return cells_with(Terrain::Destination); }

    std::vector<std::string> to_lines() const;

private:
    Grid(int width, int height, std::vector<Terrain> cells);

    std::size_t index_of(const Cell& cell) const noexcept {
        return static_cast<std::size_t>(cell.y) * static_cast<std::size_t>(width_) +
               static_cast<std::size_t>(cell.x);
    }

    int width_;
    int height_;
    std::vector<Terrain> cells_;
};

} // namespace gridwalk::core
