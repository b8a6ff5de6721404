#include "tbss_pipeline/pipeline/design.hpp"
#include "tbss_pipeline/core/errors.hpp"
#include "tbss_pipeline/core/utils.hpp"

#include <string>

namespace tbss_pipeline::pipeline {

size_t count_design_lines(const fs::path &design_matrix) {
  return core::read_lines(design_matrix).size();
}

void check_design_consistency(const fs::path &design_matrix,
                              size_t subject_count, int header_rows) {
  const size_t lines = count_design_lines(design_matrix);
  const long long rows =
      static_cast<long long>(lines) - static_cast<long long>(header_rows);
  if (rows != static_cast<long long>(subject_count)) {
    throw ConsistencyError(
        "Design matrix does not contain the correct number of subjects: " +
        design_matrix.string() + " has " + std::to_string(rows) +
        " subject rows (" + std::to_string(lines) + " lines, " +
        std::to_string(header_rows) + " header), subject list has " +
        std::to_string(subject_count));
  }
}

} // namespace tbss_pipeline::pipeline
