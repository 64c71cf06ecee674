#include "gridwalk/adapters/map_loader_file.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace gridwalk::adapters {

std::optional<gridwalk::core::Grid> MapLoaderFile::load(const std::filesystem::path& path) {
    namespace fs = std::filesystem;

    if (!fs::exists(path)) {
        spdlog::error("Map file does not exist: {}", path.string());
        return std::nullopt;
    }

    auto text = read_map_file(path);
    if (!text) {
        return std::nullopt;
    }

    try {
        auto grid = gridwalk::core::Grid::parse(*text);
        spdlog::info("Loaded map {}x{} from {}", grid.width(), grid.height(), path.string());
        return grid;
    } catch (const gridwalk::core::MapError& e) {
        spdlog::error("Invalid map {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

// Spaces are map cells, so lines are kept verbatim apart from "//" comments.
std::optional<std::string> MapLoaderFile::read_map_file(const std::filesystem::path& path) const {
    std::ifstream file(path);

    if (!file) {
        spdlog::error("Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string text;
    std::string line;
    while (std::getline(file, line)) {
        if (line.rfind("//", 0) == 0) {
            continue;
        }
        text += line;
        text += '\n';
    }

    return text;
}

} // namespace gridwalk::adapters
