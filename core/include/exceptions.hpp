#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class PositionSizingException : public std::runtime_error {
    public:
        explicit PositionSizingException(const std::string& message)
            : std::runtime_error(message) {}

        explicit PositionSizingException(const char* message)
            : std::runtime_error(message) {}
    };

    // Invalid run configuration. Always names the offending parameter so the
    // caller can report a single categorized failure before any work starts.
    class ConfigException : public PositionSizingException {
    public:
        ConfigException(const std::string& parameter, const std::string& message)
            : PositionSizingException("Invalid configuration parameter '" + parameter + "': " + message),
              parameter_(parameter), detail_(message) {}

        const std::string& parameter() const { return parameter_; }
        const std::string& detail() const { return detail_; }

    private:
        std::string parameter_;
        std::string detail_;
    };

    // Specific exception types
    class SimulationException : public PositionSizingException {
    public: using PositionSizingException::PositionSizingException; };

    class ReportException : public PositionSizingException {
    public: using PositionSizingException::PositionSizingException; };

} // namespace core
