#include "tbss_pipeline/pipeline/subjects.hpp"
#include "tbss_pipeline/core/errors.hpp"
#include "tbss_pipeline/core/utils.hpp"

#include <map>

namespace tbss_pipeline::pipeline {

std::string subject_stem(const fs::path &primary) {
  std::string base = core::remove_image_ext(primary.filename().string());
  return core::replace_all(base, "_FA", "");
}

std::vector<std::string> read_subject_list(const fs::path &list_file) {
  std::vector<std::string> entries;
  for (const auto &line : core::read_lines(list_file)) {
    std::string entry = core::trim(line);
    if (!entry.empty()) {
      entries.push_back(entry);
    }
  }
  return entries;
}

SubjectResolution resolve_subjects(const core::FileSystem &files,
                                   const std::vector<std::string> &entries) {
  SubjectResolution out;
  std::map<std::string, fs::path> by_stem;
  for (const auto &entry : entries) {
    fs::path primary = fs::absolute(entry).lexically_normal();
    if (!files.exists(primary)) {
      out.omitted.push_back(entry);
      continue;
    }
    const std::string stem = subject_stem(primary);
    auto seen = by_stem.find(stem);
    if (seen != by_stem.end()) {
      if (seen->second == primary) {
        out.duplicates.push_back(entry);
        continue;
      }
      throw ConfigError("Subjects " + seen->second.string() + " and " +
                        primary.string() + " share the stem '" + stem + "'");
    }
    by_stem.emplace(stem, primary);

    Subject s;
    s.id = stem;
    s.primary = primary;
    s.data_dir = primary.parent_path();
    out.subjects.push_back(std::move(s));
  }
  return out;
}

std::optional<fs::path> find_secondary_artifact(const core::FileSystem &files,
                                                const Subject &subject,
                                                Measure measure) {
  const std::string pattern =
      subject.id + "*" + measure_to_string(measure) + "*";
  for (const auto &candidate : files.glob(subject.data_dir, pattern)) {
    if (core::is_image_path(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace tbss_pipeline::pipeline
