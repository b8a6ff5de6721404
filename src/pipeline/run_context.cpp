#include "tbss_pipeline/pipeline/run_context.hpp"
#include "tbss_pipeline/config/arguments.hpp"
#include "tbss_pipeline/core/errors.hpp"
#include "tbss_pipeline/core/utils.hpp"
#include "tbss_pipeline/pipeline/design.hpp"
#include "tbss_pipeline/pipeline/subjects.hpp"

namespace tbss_pipeline::pipeline {

std::string RunLayout::filled_stem(const fs::path &corrp_map) {
  return core::remove_image_ext(corrp_map.filename().string()) + "_filled";
}

std::vector<Measure> RunContext::measures() const {
  std::vector<Measure> out{Measure::FA};
  if (cfg.analysis.non_fa) {
    out.insert(out.end(), cfg.analysis.secondary_measures.begin(),
               cfg.analysis.secondary_measures.end());
  }
  return out;
}

RunContext make_run_context(const config::Config &base, const RunOptions &opts,
                            const core::FileSystem &files) {
  RunContext ctx;
  ctx.cfg = base;

  if (opts.tbss_dir.empty()) {
    throw ConfigError("'--tbss-dir' argument required.");
  }
  ctx.layout = RunLayout(fs::absolute(opts.tbss_dir).lexically_normal());

  ctx.subject_list = config::require_existing_file(opts.sub_list, "--sub-list");
  ctx.design_matrix = config::require_existing_file(opts.design, "--design");
  ctx.design_contrast = config::require_existing_file(opts.contrast, "--contrast");

  std::string template_path = opts.template_path;
  if (template_path.empty()) {
    template_path = base.analysis.template_path;
  }
  if (template_path.empty()) {
    template_path = config::default_template_path().string();
  }
  ctx.template_image = config::require_existing_file(template_path, "--template");
  ctx.cfg.analysis.template_path = ctx.template_image.string();

  if (opts.fa_threshold) {
    ctx.cfg.analysis.fa_threshold = config::parse_threshold(*opts.fa_threshold);
  }
  if (opts.permutations) {
    ctx.cfg.analysis.permutations = config::parse_permutation_count(*opts.permutations);
  }
  if (opts.check_design) {
    ctx.cfg.analysis.check_design = true;
  }
  if (opts.non_fa) {
    ctx.cfg.analysis.non_fa = true;
  }

  ctx.cfg.validate();

  const auto entries = read_subject_list(ctx.subject_list);
  SubjectResolution resolved = resolve_subjects(files, entries);
  if (resolved.subjects.empty()) {
    throw ConfigError("No subject in " + ctx.subject_list.string() +
                      " resolves to an existing image");
  }
  if (ctx.cfg.analysis.check_design) {
    check_design_consistency(ctx.design_matrix, resolved.subjects.size(),
                             ctx.cfg.analysis.design_header_rows);
  }

  ctx.subjects = std::move(resolved.subjects);
  ctx.omitted = std::move(resolved.omitted);
  ctx.duplicates = std::move(resolved.duplicates);
  return ctx;
}

} // namespace tbss_pipeline::pipeline
