#include "tbss_pipeline/core/filesystem.hpp"
#include "tbss_pipeline/core/utils.hpp"

namespace tbss_pipeline::core {

bool LocalFileSystem::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool LocalFileSystem::is_directory(const fs::path& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::vector<fs::path> LocalFileSystem::glob(const fs::path& dir,
                                            const std::string& pattern) const {
    return core::glob(dir, pattern);
}

} // namespace tbss_pipeline::core
