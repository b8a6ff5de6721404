#pragma once

#include "tbss_pipeline/core/filesystem.hpp"

#include <filesystem>
#include <string>

namespace tbss_pipeline::pipeline {

namespace fs = std::filesystem;

enum class MarkerKind {
  Directory,
  File,
};

// Filesystem evidence that a stage completed. Fill completion is per map and
// lives in fill_status() instead.
struct StageMarker {
  MarkerKind kind = MarkerKind::File;
  fs::path path;

  static StageMarker directory(fs::path dir);
  static StageMarker file(fs::path file);

  std::string describe() const;
};

// True iff the marker exists right now. An empty directory counts as present
// for Directory markers, so a crash after mkdir reads as complete.
bool is_stage_complete(const core::FileSystem &files, const StageMarker &marker);

} // namespace tbss_pipeline::pipeline
