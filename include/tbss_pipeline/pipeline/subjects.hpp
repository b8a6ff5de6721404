#pragma once

#include "tbss_pipeline/core/filesystem.hpp"
#include "tbss_pipeline/core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tbss_pipeline::pipeline {

namespace fs = std::filesystem;

// Basename of the primary image with its image extension and every "_FA"
// removed: /data/s01/s01_ses-001_FA.nii.gz -> s01_ses-001
std::string subject_stem(const fs::path &primary);

// Non-blank, trimmed entries of a subject list file (one FA path per line).
std::vector<std::string> read_subject_list(const fs::path &list_file);

struct SubjectResolution {
  std::vector<Subject> subjects;
  std::vector<std::string> omitted;    // entries whose primary image is missing
  std::vector<std::string> duplicates; // repeated entries, kept once
};

// Entries are made absolute against the current directory. Missing primaries
// are reported in `omitted` and repeats of the same image in `duplicates`.
// Throws ConfigError when two different images share a stem, since both would
// be copied to the same <stem> in the run directory.
SubjectResolution resolve_subjects(const core::FileSystem &files,
                                   const std::vector<std::string> &entries);

// First image in the subject's directory matching <stem>*<M>*.
std::optional<fs::path> find_secondary_artifact(const core::FileSystem &files,
                                                const Subject &subject,
                                                Measure measure);

} // namespace tbss_pipeline::pipeline
