#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tbss_pipeline::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void write_text_atomic(const fs::path& path, const std::string& text);
void copy_file_overwrite(const fs::path& src, const fs::path& dst);

// Reads a text file line by line, the way bash `mapfile -t` does: a final
// line without a trailing newline still counts, blank lines are kept.
std::vector<std::string> read_lines(const fs::path& path);

// Hash utilities
std::string sha256_file(const fs::path& path);

// Image path utilities (FSL naming)
std::string remove_image_ext(const std::string& filename);
bool is_image_path(const fs::path& path);

// String utilities
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string replace_all(std::string str, const std::string& from, const std::string& to);
std::string shell_quote(const std::string& s);
std::string format_command(const std::vector<std::string>& args);
// Fixed-point with at most 8 decimals and no trailing zeros: 1e-05 -> "0.00001".
std::string format_decimal(double value);

// Glob pattern matching (case-sensitive, '*' and '?' only)
bool glob_match(const std::string& pattern, const std::string& str);
std::vector<fs::path> glob(const fs::path& dir, const std::string& pattern);

} // namespace tbss_pipeline::core
