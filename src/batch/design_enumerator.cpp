#include "tbss_pipeline/batch/design_enumerator.hpp"
#include "tbss_pipeline/config/arguments.hpp"
#include "tbss_pipeline/core/errors.hpp"
#include "tbss_pipeline/core/utils.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace tbss_pipeline::batch {

namespace {

std::vector<fs::path> list_subdirs(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_directory(ec)) {
            out.push_back(entry.path());
        }
    }
    if (ec) {
        throw IOError("Cannot list " + dir.string() + ": " + ec.message());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string design_label(const DesignEntry& e) {
    return e.group + " | " + e.design;
}

} // namespace

std::vector<DesignEntry> enumerate_designs(const fs::path& designs_root) {
    std::error_code ec;
    if (!fs::is_directory(designs_root, ec)) {
        throw ConfigError("Designs directory does not exist: " + designs_root.string());
    }

    std::vector<DesignEntry> designs;
    for (const auto& group_dir : list_subdirs(designs_root)) {
        for (const auto& design_dir : list_subdirs(group_dir)) {
            DesignEntry e;
            e.group = group_dir.filename().string();
            e.design = design_dir.filename().string();
            e.dir = design_dir;
            designs.push_back(std::move(e));
        }
    }
    return designs;
}

SubjectListResult ensure_subject_list(const fs::path& include_file,
                                      const fs::path& data_root,
                                      const std::string& path_pattern,
                                      const fs::path& list_path) {
    SubjectListResult result;
    result.path = list_path;

    std::error_code ec;
    if (fs::exists(list_path, ec)) {
        for (const auto& line : core::read_lines(list_path)) {
            if (!core::trim(line).empty()) ++result.listed;
        }
        return result;
    }

    std::ostringstream content;
    for (const auto& line : core::read_lines(include_file)) {
        const std::string subject = core::trim(line);
        if (subject.empty()) continue;

        fs::path image = data_root / core::replace_all(path_pattern, "{subject}", subject);
        if (!fs::is_regular_file(image, ec)) {
            result.omitted.push_back(subject);
            continue;
        }
        content << fs::weakly_canonical(image).string() << "\n";
        ++result.listed;
    }

    if (result.listed > 0) {
        core::write_text_atomic(list_path, content.str());
        result.written = true;
    }
    return result;
}

DesignEnumerator::DesignEnumerator(const config::Config& cfg,
                                   scheduler::JobSubmitter& submitter,
                                   core::EventEmitter& emitter)
    : cfg_(cfg), submitter_(submitter), emitter_(emitter) {
    std::string tmpl = cfg_.analysis.template_path;
    if (tmpl.empty()) {
        tmpl = config::default_template_path().string();
    }
    template_image_ = config::require_existing_file(tmpl, "--template");
}

std::vector<std::string> DesignEnumerator::build_run_command(const BatchInputs& inputs,
                                                             const DesignEntry& entry,
                                                             const fs::path& output_dir) const {
    std::vector<std::string> cmd = {
        cfg_.batch.runner, "run",
        "--tbss-dir", (output_dir / cfg_.batch.run_subdir).string(),
        "--sub-list", (output_dir / cfg_.batch.subject_list).string(),
        "--design", (entry.dir / cfg_.batch.design_matrix).string(),
        "--contrast", (entry.dir / cfg_.batch.design_contrast).string(),
        "--template", template_image_.string(),
        "--fa-threshold", core::format_decimal(cfg_.analysis.fa_threshold),
        "--perm", std::to_string(cfg_.analysis.permutations)};
    if (cfg_.batch.check_design) {
        cmd.push_back("--check-design");
    }
    if (cfg_.batch.non_fa) {
        cmd.push_back("--non-FA-tbss");
    }
    if (!inputs.config_file.empty()) {
        cmd.push_back("--config");
        cmd.push_back(inputs.config_file.string());
    }
    return cmd;
}

std::vector<SubmittedDesign> DesignEnumerator::submit_all(const BatchInputs& inputs) {
    std::vector<SubmittedDesign> submitted;

    const auto designs = enumerate_designs(inputs.designs_root);
    if (designs.empty()) {
        emitter_.warning("no designs found below " + inputs.designs_root.string());
        std::cerr << "Warning: no designs found below " << inputs.designs_root << std::endl;
        return submitted;
    }

    for (const auto& entry : designs) {
        const std::string label = design_label(entry);
        std::cout << "Processing Design: " << label << std::endl;

        const fs::path output_dir =
            inputs.out_root / cfg_.batch.output_subdir / entry.group / entry.design;
        std::error_code ec;
        fs::create_directories(output_dir, ec);
        if (ec) {
            throw IOError("Cannot create " + output_dir.string() + ": " + ec.message());
        }

        const fs::path include_file = entry.dir / cfg_.batch.include_list;
        const fs::path matrix = entry.dir / cfg_.batch.design_matrix;
        const fs::path contrast = entry.dir / cfg_.batch.design_contrast;
        bool complete = true;
        for (const auto& required : {include_file, matrix, contrast}) {
            if (!fs::is_regular_file(required, ec)) {
                const std::string msg = label + ": missing " + required.string() + "; design skipped";
                std::cerr << "Warning: " << msg << std::endl;
                emitter_.warning(msg);
                complete = false;
                break;
            }
        }
        if (!complete) continue;

        SubjectListResult list = ensure_subject_list(
            include_file, inputs.data_root, cfg_.batch.subject_path_pattern,
            output_dir / cfg_.batch.subject_list);
        for (const auto& subject : list.omitted) {
            const std::string msg = label + " | " + subject + " does not exist";
            std::cout << msg << std::endl;
            emitter_.warning(msg);
        }
        if (list.listed == 0) {
            const std::string msg = label + ": no subject images found; design skipped";
            std::cerr << "Warning: " << msg << std::endl;
            emitter_.warning(msg);
            continue;
        }

        scheduler::JobRequest req;
        req.name = "tbss_" + entry.group + "_" + entry.design;
        req.command = build_run_command(inputs, entry, output_dir);
        req.work_dir = output_dir;
        req.resources = cfg_.scheduler.pipeline;
        req.stdout_log = output_dir / "tbss_run.log";
        req.stderr_log = output_dir / "tbss_run.err";

        scheduler::JobHandle handle = submitter_.submit(req);
        std::cout << "Submitted " << req.name << " as " << handle.id() << " ("
                  << submitter_.backend_name() << "), " << list.listed << " subjects"
                  << std::endl;
        emitter_.job_submitted(req.name, handle.id(), submitter_.backend_name());

        submitted.push_back({entry, output_dir, std::move(handle)});
    }

    return submitted;
}

size_t DesignEnumerator::join_all(std::vector<SubmittedDesign>& submitted) {
    size_t failed = 0;
    for (auto& design : submitted) {
        const std::string name = design.handle.name();
        const std::string id = design.handle.id();
        scheduler::JobResult result = submitter_.join(design.handle);
        emitter_.job_finished(name, id, result.success, result.exit_code);
        if (!result.success) {
            ++failed;
            std::cerr << "Error: " << name << " failed (exit code " << result.exit_code
                      << "); see " << result.stderr_log.string() << std::endl;
            emitter_.error(name + " (" + id + ") failed with code " +
                           std::to_string(result.exit_code));
        }
    }
    return failed;
}

} // namespace tbss_pipeline::batch
