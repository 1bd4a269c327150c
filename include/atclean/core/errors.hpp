#pragma once

#include <stdexcept>
#include <string>

namespace atclean {

class AtCleanError : public std::runtime_error {
public:
    explicit AtCleanError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public AtCleanError {
public:
    explicit ConfigError(const std::string& message)
        : AtCleanError("Config error: " + message) {}
};

class ValidationError : public AtCleanError {
public:
    explicit ValidationError(const std::string& message)
        : AtCleanError("Validation error: " + message) {}
};

class IOError : public AtCleanError {
public:
    explicit IOError(const std::string& message)
        : AtCleanError("I/O error: " + message) {}
};

class DataInsufficientError : public AtCleanError {
public:
    explicit DataInsufficientError(const std::string& message)
        : AtCleanError("Insufficient data: " + message) {}
};

class AlignmentError : public AtCleanError {
public:
    explicit AlignmentError(const std::string& message)
        : AtCleanError("Alignment error: " + message) {}
};

class MonteCarloDrawError : public AtCleanError {
public:
    explicit MonteCarloDrawError(const std::string& message)
        : AtCleanError("Monte Carlo draw error: " + message) {}
};

class PipelineError : public AtCleanError {
public:
    explicit PipelineError(const std::string& message)
        : AtCleanError("Pipeline error: " + message) {}
};

} // namespace atclean
