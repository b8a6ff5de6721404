#pragma once

#include "tbss_pipeline/config/configuration.hpp"

#include <streambuf>
#include <string>

namespace tbss_pipeline::runner {

// Loads and validates a YAML config; an empty path yields the defaults.
config::Config load_config(const std::string &path);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace tbss_pipeline::runner
