#pragma once

#include <stdexcept>
#include <string>

namespace habitat_seg {

class HabitatSegError : public std::runtime_error {
public:
    explicit HabitatSegError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public HabitatSegError {
public:
    explicit ConfigError(const std::string& message)
        : HabitatSegError("Config error: " + message) {}
};

class ValidationError : public HabitatSegError {
public:
    explicit ValidationError(const std::string& message)
        : HabitatSegError("Validation error: " + message) {}
};

class IOError : public HabitatSegError {
public:
    explicit IOError(const std::string& message)
        : HabitatSegError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class InferenceError : public HabitatSegError {
public:
    explicit InferenceError(const std::string& message)
        : HabitatSegError("Inference error: " + message) {}
};

// Planner/register invariant violated; a programming defect, never patched over
class InternalConsistencyError : public HabitatSegError {
public:
    explicit InternalConsistencyError(const std::string& message)
        : HabitatSegError("Internal consistency fault: " + message) {}
};

class PipelineError : public HabitatSegError {
public:
    explicit PipelineError(const std::string& message)
        : HabitatSegError("Pipeline error: " + message) {}
};

class StopRequested : public HabitatSegError {
public:
    StopRequested() : HabitatSegError("Stop requested by user") {}
};

} // namespace habitat_seg
