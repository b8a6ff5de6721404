#pragma once

#include <stdexcept>
#include <string>

namespace tbss_pipeline {

class TbssError : public std::runtime_error {
public:
    explicit TbssError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public TbssError {
public:
    explicit ConfigError(const std::string& message)
        : TbssError("Config error: " + message) {}
};

class ValidationError : public TbssError {
public:
    explicit ValidationError(const std::string& message)
        : TbssError("Validation error: " + message) {}
};

class ConsistencyError : public TbssError {
public:
    explicit ConsistencyError(const std::string& message)
        : TbssError("Consistency error: " + message) {}
};

class IOError : public TbssError {
public:
    explicit IOError(const std::string& message)
        : TbssError("I/O error: " + message) {}
};

class ProcessError : public TbssError {
public:
    explicit ProcessError(const std::string& message)
        : TbssError("Process error: " + message) {}
};

class SchedulerError : public TbssError {
public:
    explicit SchedulerError(const std::string& message)
        : TbssError("Scheduler error: " + message) {}
};

class StageError : public TbssError {
public:
    explicit StageError(const std::string& message)
        : TbssError("Stage error: " + message) {}
};

} // namespace tbss_pipeline
