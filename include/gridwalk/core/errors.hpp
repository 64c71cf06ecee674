#pragma once

#include "gridwalk/core/types.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <optional>

namespace gridwalk::core {

enum class ErrorKind {
    InvalidMapCharacter,
    EmptyMap,
    OutOfBounds,
    NoReachableDestination,
    OffRoute
};

std::string_view to_string(ErrorKind kind) noexcept;

// Thrown while building a Grid from text. Fatal for simulation startup.
class MapError : public std::runtime_error {
public:
    explicit MapError(ErrorKind kind);
    MapError(char glyph, Cell cell);

    ErrorKind kind() const noexcept { return kind_; }
    std::optional<char> glyph() const noexcept { return glyph_; }
    std::optional<Cell> cell() const noexcept { return cell_; }

private:
    ErrorKind kind_;
    std::optional<char> glyph_;
    std::optional<Cell> cell_;
};

// Thrown by Grid::terrain_at for a cell outside the grid. Indicates a caller defect.
class OutOfBounds : public std::out_of_range {
public:
    OutOfBounds(Cell cell, int width, int height);

    ErrorKind kind() const noexcept { return ErrorKind::OutOfBounds; }
    Cell cell() const noexcept { return cell_; }

private:
    Cell cell_;
};

} // namespace gridwalk::core
