#pragma once

#include "gridwalk/ports/imap_loader.hpp"
#include <string>

namespace gridwalk::adapters {

class MapLoaderFile : public gridwalk::ports::IMapLoader {
public:
    MapLoaderFile() = default;
    ~MapLoaderFile() override = default;

    std::optional<core::Grid> load(const std::filesystem::path& path) override;

private:
    std::optional<std::string> read_map_file(const std::filesystem::path& path) const;
};

} // namespace gridwalk::adapters
