#pragma once

#include "tbss_pipeline/config/configuration.hpp"
#include "tbss_pipeline/core/events.hpp"
#include "tbss_pipeline/scheduler/job_submitter.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tbss_pipeline::batch {

namespace fs = std::filesystem;

// One <designs_root>/<group>/<design>/ directory
struct DesignEntry {
    std::string group;
    std::string design;
    fs::path dir;
};

// Sorted by group, then design. Only directories are listed.
std::vector<DesignEntry> enumerate_designs(const fs::path& designs_root);

struct SubjectListResult {
    fs::path path;
    bool written = false;       // false: an existing list was kept
    size_t listed = 0;
    std::vector<std::string> omitted;
};

/**
 * Builds <list_path> from the design's inclusion list when it does not exist
 * yet. Each subject id is substituted into `path_pattern` below `data_root`;
 * ids without an existing image are reported in `omitted`. The file is
 * written atomically and never rewritten. Nothing is written when no subject
 * resolves.
 */
SubjectListResult ensure_subject_list(const fs::path& include_file,
                                      const fs::path& data_root,
                                      const std::string& path_pattern,
                                      const fs::path& list_path);

struct BatchInputs {
    fs::path designs_root;
    fs::path data_root;
    fs::path out_root;
    fs::path config_file; // forwarded to every run when set
};

struct SubmittedDesign {
    DesignEntry entry;
    fs::path output_dir;
    scheduler::JobHandle handle;
};

class DesignEnumerator {
public:
    DesignEnumerator(const config::Config& cfg, scheduler::JobSubmitter& submitter,
                     core::EventEmitter& emitter);

    // Prepares and submits one background run per design, back to back.
    std::vector<SubmittedDesign> submit_all(const BatchInputs& inputs);

    // Joins every submitted design in order. Returns the number that failed.
    size_t join_all(std::vector<SubmittedDesign>& submitted);

    std::vector<std::string> build_run_command(const BatchInputs& inputs,
                                               const DesignEntry& entry,
                                               const fs::path& output_dir) const;

private:
    const config::Config& cfg_;
    scheduler::JobSubmitter& submitter_;
    core::EventEmitter& emitter_;
    fs::path template_image_;
};

} // namespace tbss_pipeline::batch
