#pragma once
#include "TaskContext.hpp"
#include <functional>
#include <memory>
#include <string>

namespace tekton {
    /**
     * @brief Minimal unit of work of a build.
     *
     * A task runs against the shared TaskContext and returns an integer result
     * code. Failures are reported by throwing, never through the code.
     */
    class Task {
    public:
        virtual ~Task() = default;

        /**
         * @brief Run the task.
         * @param context The context shared by every task of the run.
         * @return The task's result code.
         */
        virtual int execute(TaskContext &context) = 0;

        /**
         * @brief Human readable description, empty when none was given.
         */
        [[nodiscard]] virtual std::string description() const = 0;
    };

    using TaskPtr = std::shared_ptr<Task>;

    /**
     * @brief Common execute() wrapper for concrete tasks.
     *
     * Subclasses implement do_execute(). When log_duration() is true the time
     * spent is logged once do_execute() returns or throws.
     */
    class TaskBase : public Task {
    public:
        int execute(TaskContext &context) final;

        [[nodiscard]] std::string description() const override { return desc; }

        void set_task_description(const std::string &text) { desc = text; }

    protected:
        virtual int do_execute(TaskContext &context) = 0;

        [[nodiscard]] virtual bool log_duration() const { return false; }

        [[nodiscard]] virtual std::string description_for_log() const { return description(); }

    private:
        std::string desc;
    };

    // Task backed by a callable, mostly used by code-defined builds.
    class FunctionTask : public TaskBase {
    public:
        using Function = std::function<int(TaskContext &)>;

        explicit FunctionTask(Function fn, const std::string &description = "");

        static TaskPtr create(Function fn, const std::string &description = "");

    protected:
        int do_execute(TaskContext &context) override;

    private:
        Function function;
    };
} // namespace tekton
