#include "tbss_pipeline/config/configuration.hpp"
#include "tbss_pipeline/core/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace tbss_pipeline::config {

static void read_resources(const YAML::Node& n, Resources& out) {
    if (!n) return;
    if (n["cpus"]) out.cpus = n["cpus"].as<int>();
    if (n["memory_mb"]) out.memory_mb = n["memory_mb"].as<int>();
    if (n["walltime_min"]) out.walltime_min = n["walltime_min"].as<int>();
    if (n["single_host"]) out.single_host = n["single_host"].as<bool>();
    if (n["notify"]) out.notify = n["notify"].as<bool>();
}

static YAML::Node resources_to_yaml(const Resources& r) {
    YAML::Node node;
    node["cpus"] = r.cpus;
    node["memory_mb"] = r.memory_mb;
    node["walltime_min"] = r.walltime_min;
    node["single_host"] = r.single_host;
    node["notify"] = r.notify;
    return node;
}

static void validate_resources(const std::string& key, const Resources& r) {
    if (r.cpus < 1) {
        throw ValidationError(key + ".cpus must be >= 1");
    }
    if (r.memory_mb < 1) {
        throw ValidationError(key + ".memory_mb must be >= 1");
    }
    if (r.walltime_min < 1) {
        throw ValidationError(key + ".walltime_min must be >= 1");
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["analysis"]) {
            auto a = node["analysis"];
            if (a["fa_threshold"]) cfg.analysis.fa_threshold = a["fa_threshold"].as<double>();
            if (a["permutations"]) cfg.analysis.permutations = a["permutations"].as<int>();
            if (a["check_design"]) cfg.analysis.check_design = a["check_design"].as<bool>();
            if (a["non_fa"]) cfg.analysis.non_fa = a["non_fa"].as<bool>();
            if (a["design_header_rows"]) cfg.analysis.design_header_rows = a["design_header_rows"].as<int>();
            if (a["template"]) cfg.analysis.template_path = a["template"].as<std::string>();
            if (a["secondary_measures"] && a["secondary_measures"].IsSequence()) {
                cfg.analysis.secondary_measures.clear();
                for (const auto& m : a["secondary_measures"]) {
                    std::string name = m.as<std::string>();
                    auto measure = string_to_measure(name);
                    if (!measure) {
                        throw ConfigError("Unknown measure in analysis.secondary_measures: " + name);
                    }
                    cfg.analysis.secondary_measures.push_back(*measure);
                }
            }
        }

        if (node["fsl"]) {
            auto f = node["fsl"];
            if (f["bin_dir"]) cfg.fsl.bin_dir = f["bin_dir"].as<std::string>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_copies"]) cfg.runtime.parallel_copies = r["parallel_copies"].as<int>();
        }

        if (node["scheduler"]) {
            auto s = node["scheduler"];
            if (s["backend"]) cfg.scheduler.backend = s["backend"].as<std::string>();
            if (s["submit_command"]) cfg.scheduler.submit_command = s["submit_command"].as<std::string>();
            if (s["wait_command"]) cfg.scheduler.wait_command = s["wait_command"].as<std::string>();
            read_resources(s["randomise"], cfg.scheduler.randomise);
            read_resources(s["pipeline"], cfg.scheduler.pipeline);
        }

        if (node["batch"]) {
            auto b = node["batch"];
            if (b["include_list"]) cfg.batch.include_list = b["include_list"].as<std::string>();
            if (b["design_matrix"]) cfg.batch.design_matrix = b["design_matrix"].as<std::string>();
            if (b["design_contrast"]) cfg.batch.design_contrast = b["design_contrast"].as<std::string>();
            if (b["subject_list"]) cfg.batch.subject_list = b["subject_list"].as<std::string>();
            if (b["subject_path_pattern"]) cfg.batch.subject_path_pattern = b["subject_path_pattern"].as<std::string>();
            if (b["output_subdir"]) cfg.batch.output_subdir = b["output_subdir"].as<std::string>();
            if (b["run_subdir"]) cfg.batch.run_subdir = b["run_subdir"].as<std::string>();
            if (b["runner"]) cfg.batch.runner = b["runner"].as<std::string>();
            if (b["check_design"]) cfg.batch.check_design = b["check_design"].as<bool>();
            if (b["non_fa"]) cfg.batch.non_fa = b["non_fa"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["analysis"]["fa_threshold"] = analysis.fa_threshold;
    node["analysis"]["permutations"] = analysis.permutations;
    node["analysis"]["check_design"] = analysis.check_design;
    node["analysis"]["non_fa"] = analysis.non_fa;
    for (Measure m : analysis.secondary_measures) {
        node["analysis"]["secondary_measures"].push_back(measure_to_string(m));
    }
    node["analysis"]["design_header_rows"] = analysis.design_header_rows;
    node["analysis"]["template"] = analysis.template_path;

    node["fsl"]["bin_dir"] = fsl.bin_dir;

    node["runtime"]["parallel_copies"] = runtime.parallel_copies;

    node["scheduler"]["backend"] = scheduler.backend;
    node["scheduler"]["submit_command"] = scheduler.submit_command;
    node["scheduler"]["wait_command"] = scheduler.wait_command;
    node["scheduler"]["randomise"] = resources_to_yaml(scheduler.randomise);
    node["scheduler"]["pipeline"] = resources_to_yaml(scheduler.pipeline);

    node["batch"]["include_list"] = batch.include_list;
    node["batch"]["design_matrix"] = batch.design_matrix;
    node["batch"]["design_contrast"] = batch.design_contrast;
    node["batch"]["subject_list"] = batch.subject_list;
    node["batch"]["subject_path_pattern"] = batch.subject_path_pattern;
    node["batch"]["output_subdir"] = batch.output_subdir;
    node["batch"]["run_subdir"] = batch.run_subdir;
    node["batch"]["runner"] = batch.runner;
    node["batch"]["check_design"] = batch.check_design;
    node["batch"]["non_fa"] = batch.non_fa;

    return node;
}

void Config::validate() const {
    if (analysis.fa_threshold < 0.0 || analysis.fa_threshold > 1.0) {
        throw ValidationError("analysis.fa_threshold must be in [0,1]");
    }
    if (analysis.permutations < 1 || analysis.permutations > 9999999) {
        throw ValidationError("analysis.permutations must be in [1,9999999]");
    }
    if (analysis.design_header_rows < 0) {
        throw ValidationError("analysis.design_header_rows must be >= 0");
    }
    for (Measure m : analysis.secondary_measures) {
        if (is_primary(m)) {
            throw ValidationError("analysis.secondary_measures must not contain FA");
        }
        if (std::count(analysis.secondary_measures.begin(),
                       analysis.secondary_measures.end(), m) > 1) {
            throw ValidationError("analysis.secondary_measures lists " +
                                  measure_to_string(m) + " more than once");
        }
    }

    if (runtime.parallel_copies < 0) {
        throw ValidationError("runtime.parallel_copies must be >= 0");
    }

    if (scheduler.backend != "lsf" && scheduler.backend != "local") {
        throw ValidationError("scheduler.backend must be 'lsf' or 'local'");
    }
    if (scheduler.backend == "lsf") {
        if (scheduler.submit_command.empty() || scheduler.wait_command.empty()) {
            throw ValidationError("scheduler.submit_command and scheduler.wait_command must be set for lsf");
        }
    }
    validate_resources("scheduler.randomise", scheduler.randomise);
    validate_resources("scheduler.pipeline", scheduler.pipeline);

    if (batch.subject_path_pattern.find("{subject}") == std::string::npos) {
        throw ValidationError("batch.subject_path_pattern must contain {subject}");
    }
    if (batch.include_list.empty() || batch.design_matrix.empty() ||
        batch.design_contrast.empty() || batch.subject_list.empty()) {
        throw ValidationError("batch file names must not be empty");
    }
    if (batch.runner.empty()) {
        throw ValidationError("batch.runner must not be empty");
    }
}

fs::path default_template_path() {
    const char* fsldir = std::getenv("FSLDIR");
    if (!fsldir || !*fsldir) {
        return {};
    }
    return fs::path(fsldir) / "data" / "standard" / "FMRIB58_FA_1mm.nii.gz";
}

std::string fsl_tool(const Config& cfg, const std::string& tool) {
    if (!cfg.fsl.bin_dir.empty()) {
        return (fs::path(cfg.fsl.bin_dir) / tool).string();
    }
    const char* fsldir = std::getenv("FSLDIR");
    if (fsldir && *fsldir) {
        return (fs::path(fsldir) / "bin" / tool).string();
    }
    return tool;
}

} // namespace tbss_pipeline::config
