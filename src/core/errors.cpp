#include "gridwalk/core/errors.hpp"
#include <spdlog/fmt/fmt.h>

namespace gridwalk::core {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidMapCharacter: return "InvalidMapCharacter";
        case ErrorKind::EmptyMap: return "EmptyMap";
        case ErrorKind::OutOfBounds: return "OutOfBounds";
        case ErrorKind::NoReachableDestination: return "NoReachableDestination";
        case ErrorKind::OffRoute: return "OffRoute";
    }
    return "Unknown";
}

MapError::MapError(ErrorKind kind)
    : std::runtime_error(std::string(to_string(kind)))
    , kind_(kind) {
}

MapError::MapError(char glyph, Cell cell)
    : std::runtime_error(fmt::format("InvalidMapCharacter: '{}' at ({},{})", glyph, cell.x, cell.y))
    , kind_(ErrorKind::InvalidMapCharacter)
    , glyph_(glyph)
    , cell_(cell) {
}

OutOfBounds::OutOfBounds(Cell cell, int width, int height)
    : std::out_of_range(fmt::format("OutOfBounds: ({},{}) outside {}x{} grid",
                                    cell.x, cell.y, width, height))
    , cell_(cell) {
}

} // namespace gridwalk::core
