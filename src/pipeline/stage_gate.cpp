#include "tbss_pipeline/pipeline/stage_gate.hpp"

namespace tbss_pipeline::pipeline {

StageMarker StageMarker::directory(fs::path dir) {
  StageMarker m;
  m.kind = MarkerKind::Directory;
  m.path = std::move(dir);
  return m;
}

StageMarker StageMarker::file(fs::path file) {
  StageMarker m;
  m.kind = MarkerKind::File;
  m.path = std::move(file);
  return m;
}

std::string StageMarker::describe() const {
  switch (kind) {
  case MarkerKind::Directory:
    return path.string() + "/";
  case MarkerKind::File:
    return path.string();
  }
  return path.string();
}

bool is_stage_complete(const core::FileSystem &files, const StageMarker &marker) {
  switch (marker.kind) {
  case MarkerKind::Directory:
    return files.is_directory(marker.path);
  case MarkerKind::File:
    return files.exists(marker.path);
  }
  return false;
}

} // namespace tbss_pipeline::pipeline
