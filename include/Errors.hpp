#pragma once
#include <stdexcept>
#include <string>

namespace tekton {
    // Build script authoring mistakes: never retried, abort the current run.
    class ConfigurationError : public std::runtime_error {
    public:
        explicit ConfigurationError(const std::string &what) : std::runtime_error(what) {
        }
    };

    // A dependency (or requested target) name that no registered target carries.
    class TargetNotFoundError : public ConfigurationError {
    public:
        explicit TargetNotFoundError(const std::string &target_name);

        [[nodiscard]] const std::string &target_name() const { return name; }

    private:
        std::string name;
    };

    // Fault raised while a task or an action runs.
    class TaskExecutionError : public std::runtime_error {
    public:
        explicit TaskExecutionError(const std::string &what) : std::runtime_error(what) {
        }
    };
} // namespace tekton
