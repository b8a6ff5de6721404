#pragma once

#include <string>

// Prints the gate decision of every stage of an existing run directory.
int status_command(const std::string &tbss_dir, const std::string &config_path,
                   bool non_fa, bool as_json);
