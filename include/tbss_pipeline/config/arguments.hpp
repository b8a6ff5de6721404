#pragma once

#include <filesystem>
#include <string>

namespace tbss_pipeline::config {

namespace fs = std::filesystem;

// Typed parsing of numeric command-line values. All functions throw
// ConfigError with a message naming the offending flag.

// Digits only, in [1, 9999999].
int parse_permutation_count(const std::string& text);

// Decimal matching ^[+-]?[0-9]+\.?[0-9]*$, in [0, 1].
double parse_threshold(const std::string& text, const std::string& flag = "--fa-threshold");

// Returns the absolute path of an existing regular file given for `flag`.
fs::path require_existing_file(const std::string& value, const std::string& flag);

// Returns the absolute path of an existing directory given for `flag`.
fs::path require_existing_dir(const std::string& value, const std::string& flag);

} // namespace tbss_pipeline::config
