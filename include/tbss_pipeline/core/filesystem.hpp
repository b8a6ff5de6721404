#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tbss_pipeline::core {

namespace fs = std::filesystem;

/**
 * Read-only view of the filesystem used for stage gating and subject
 * resolution. Implementations must be safe to call from worker threads.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool exists(const fs::path& path) const = 0;
    virtual bool is_directory(const fs::path& path) const = 0;

    // Sorted entries of `dir` whose filename matches `pattern`
    virtual std::vector<fs::path> glob(const fs::path& dir,
                                       const std::string& pattern) const = 0;
};

class LocalFileSystem : public FileSystem {
public:
    bool exists(const fs::path& path) const override;
    bool is_directory(const fs::path& path) const override;
    std::vector<fs::path> glob(const fs::path& dir,
                               const std::string& pattern) const override;
};

} // namespace tbss_pipeline::core
