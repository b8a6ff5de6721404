#include "tbss_pipeline/config/arguments.hpp"
#include "tbss_pipeline/core/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <regex>

namespace tbss_pipeline::config {

int parse_permutation_count(const std::string& text) {
    static const std::regex kDigits("^[0-9]+$");
    const std::string message = "'--perm' argument requires integers only [1 - 9999999]";

    if (!std::regex_match(text, kDigits)) {
        throw ConfigError(message + ", got '" + text + "'");
    }
    // Anything longer than 7 digits (after leading zeros) is out of range.
    size_t first = text.find_first_not_of('0');
    if (first == std::string::npos || text.size() - first > 7) {
        throw ConfigError(message + ", got '" + text + "'");
    }
    int value = std::stoi(text.substr(first));
    if (value < 1 || value > 9999999) {
        throw ConfigError(message + ", got '" + text + "'");
    }
    return value;
}

double parse_threshold(const std::string& text, const std::string& flag) {
    static const std::regex kDecimal("^[+-]?[0-9]+\\.?[0-9]*$");
    const std::string message = "'" + flag + "' argument requires a decimal in [0.0 - 1.0]";

    if (!std::regex_match(text, kDecimal)) {
        throw ConfigError(message + ", got '" + text + "'");
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        throw ConfigError(message + ", got '" + text + "'");
    }
    if (value < 0.0 || value > 1.0) {
        throw ConfigError(message + ", got '" + text + "'");
    }
    return value;
}

fs::path require_existing_file(const std::string& value, const std::string& flag) {
    std::error_code ec;
    if (value.empty() || !fs::is_regular_file(value, ec)) {
        throw ConfigError("'" + flag + "' option was not specified or the file does not exist.");
    }
    return fs::absolute(value);
}

fs::path require_existing_dir(const std::string& value, const std::string& flag) {
    std::error_code ec;
    if (value.empty() || !fs::is_directory(value, ec)) {
        throw ConfigError("'" + flag + "' option was not specified or the directory does not exist.");
    }
    return fs::absolute(value);
}

} // namespace tbss_pipeline::config
