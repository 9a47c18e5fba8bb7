#pragma once
#include "Task.hpp"
#include <string>

namespace tekton {
    // Runs a command through /bin/sh -c after ${VAR} expansion against the
    // context properties. The exit status is the result code.
    class ShellTask : public TaskBase {
    public:
        explicit ShellTask(std::string command, const std::string &description = "");

        static std::shared_ptr<ShellTask> create(const std::string &command, const std::string &description = "");

        // By default a non-zero status throws TaskExecutionError.
        ShellTask &do_not_fail_on_error();

        ShellTask &redirect_output(const std::string &stdout_path, const std::string &stderr_path);

        ShellTask &working_directory(const std::string &dir);

        [[nodiscard]] const std::string &command() const { return cmd; }

        [[nodiscard]] bool fails_on_error() const { return fail_on_error; }

    protected:
        int do_execute(TaskContext &context) override;

        [[nodiscard]] std::string description_for_log() const override;

    private:
        std::string cmd;
        std::string stdout_path;
        std::string stderr_path;
        std::string work_dir;
        bool fail_on_error = true;
    };

    /**
     * @brief Run @p cmd with /bin/sh -c and wait for it.
     * @param cmd The command line.
     * @param out_path File receiving stdout, inherited when empty.
     * @param err_path File receiving stderr, inherited when empty.
     * @param dir Working directory of the child, inherited when empty.
     * @return The exit status, or 128 + signal number when the child was killed.
     * @throws TaskExecutionError if the child cannot be forked or waited for.
     */
    int run_shell(const std::string &cmd, const std::string &out_path = "", const std::string &err_path = "",
                  const std::string &dir = "");
} // namespace tekton
