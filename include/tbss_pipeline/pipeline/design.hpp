#pragma once

#include <cstddef>
#include <filesystem>

namespace tbss_pipeline::pipeline {

namespace fs = std::filesystem;

// Number of lines in an FSL design matrix, counted like bash `mapfile`.
size_t count_design_lines(const fs::path &design_matrix);

// Throws ConsistencyError unless lines - header_rows == subject_count.
void check_design_consistency(const fs::path &design_matrix,
                              size_t subject_count, int header_rows = 3);

} // namespace tbss_pipeline::pipeline
