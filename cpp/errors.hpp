#pragma once

#include <stdexcept>
#include <string>

namespace pharmiq {

class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
    virtual const char* kind() const noexcept { return "engine_error"; }
};

// Not enough history for the requested operation. Callers fall back to their own heuristic.
class InsufficientDataError : public EngineError {
public:
    using EngineError::EngineError;
    const char* kind() const noexcept override { return "insufficient_data"; }
};

// A candidate model could not be fitted (degenerate or too-short input).
class ComputationError : public EngineError {
public:
    using EngineError::EngineError;
    const char* kind() const noexcept override { return "computation"; }
};

class ConfigurationError : public EngineError {
public:
    using EngineError::EngineError;
    const char* kind() const noexcept override { return "configuration"; }
};

}
