#pragma once

#include "gridwalk/core/grid.hpp"
#include <filesystem>
#include <optional>
#include <memory>

namespace gridwalk::ports {

class IMapLoader {
public:
    virtual ~IMapLoader() = default;

    virtual std::optional<gridwalk::core::Grid> load(const std::filesystem::path& path) = 0;
};

using MapLoaderPtr = std::unique_ptr<IMapLoader>;

} // namespace gridwalk::ports
