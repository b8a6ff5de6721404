#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tbss_pipeline {

namespace fs = std::filesystem;

// Diffusion scalar measure. FA is the primary measure; the others are
// secondary and are projected onto the FA skeleton.
enum class Measure {
    FA,
    AD,
    MD,
    RD
};

inline std::string measure_to_string(Measure measure) {
    switch (measure) {
        case Measure::FA: return "FA";
        case Measure::AD: return "AD";
        case Measure::MD: return "MD";
        case Measure::RD: return "RD";
        default: return "UNKNOWN";
    }
}

inline std::optional<Measure> string_to_measure(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (norm == "FA") return Measure::FA;
    if (norm == "AD") return Measure::AD;
    if (norm == "MD") return Measure::MD;
    if (norm == "RD") return Measure::RD;
    return std::nullopt;
}

inline bool is_primary(Measure measure) {
    return measure == Measure::FA;
}

// Pipeline stage enumeration
enum class Stage {
    INIT = 0,
    COPY = 1,
    PREPROC = 2,
    REGISTER = 3,
    POSTREG = 4,
    PRESTATS = 5,
    PROJECT = 6,   // secondary measures only: tbss_non_FA
    STATS = 7,
    POSTSTATS_FILL = 8,
    DONE = 9
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::INIT: return "INIT";
        case Stage::COPY: return "COPY";
        case Stage::PREPROC: return "PREPROC";
        case Stage::REGISTER: return "REGISTER";
        case Stage::POSTREG: return "POSTREG";
        case Stage::PRESTATS: return "PRESTATS";
        case Stage::PROJECT: return "PROJECT";
        case Stage::STATS: return "STATS";
        case Stage::POSTSTATS_FILL: return "POSTSTATS_FILL";
        case Stage::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

// Subject as listed in a design's subject list
struct Subject {
    std::string id;          // stem shared by all measure files
    fs::path primary;        // absolute path of the FA image
    fs::path data_dir;       // directory holding the FA image and its siblings
};

// Scheduler resource request
struct Resources {
    int cpus = 1;
    int memory_mb = 15000;
    int walltime_min = 30000;
    bool single_host = true;
    bool notify = false;
};

} // namespace tbss_pipeline
