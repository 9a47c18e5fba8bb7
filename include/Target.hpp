#pragma once
#include "Task.hpp"
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace tekton {
    class TargetTree;

    using TargetAction = std::function<void(TaskContext &)>;

    /**
     * @brief A named, dependency-aware unit of a build.
     *
     * A target combines an optional action, an ordered list of tasks and the
     * names of the targets it depends on. Dependencies are kept as names and
     * only resolved through the owning TargetTree when the target executes, so
     * a target may depend on a name registered later.
     *
     * Targets are tasks themselves and can be added to another target's task
     * list. The dependency and task lists must not change once the target has
     * started executing.
     *
     * Targets are always shared-owned: build them with create() or
     * TargetTree::add_target(name).
     */
    class Target : public TaskBase, public std::enable_shared_from_this<Target> {
        // Only Target and TargetTree can construct one.
        class Key {
            Key() = default;

            friend class Target;
            friend class TargetTree;
        };

    public:
        Target(Key, std::string target_name);

        Target(Key, TargetTree &tree, std::string target_name);

        static std::shared_ptr<Target> create(const std::string &target_name);

        /**
         * @brief Append dependency names. Duplicates are kept, the tree runs a
         * target at most once per run anyway.
         */
        Target &depends_on(const std::string &target_name);

        Target &depends_on(std::initializer_list<std::string> target_names);

        Target &depends_on(const Target &target);

        Target &depends_on(std::initializer_list<std::shared_ptr<Target>> targets);

        /**
         * @brief Set the target action.
         * @throws ConfigurationError if an action was already set with do_action().
         */
        Target &do_action(TargetAction action);

        /**
         * @brief Replace the target action, whatever was set before.
         */
        Target &override_do(TargetAction action);

        Target &add_task(TaskPtr task);

        Target &add_task(std::initializer_list<TaskPtr> new_tasks);

        /**
         * @brief Make this target the default target of its tree.
         * @throws ConfigurationError if the target was not added to a tree.
         */
        Target &set_as_default();

        Target &set_description(const std::string &text);

        // Hidden targets are left out of the target listing but still run.
        Target &set_as_hidden();

        /**
         * @brief Attach this target to @p tree and register it by name.
         * @return The tree, for chaining.
         * @throws ConfigurationError if the tree already has a target of that name.
         */
        TargetTree &add_to_tree(TargetTree &tree);

        [[nodiscard]] const std::string &name() const { return target_name; }

        [[nodiscard]] bool is_hidden() const { return hidden; }

        [[nodiscard]] bool has_action() const { return static_cast<bool>(action); }

        [[nodiscard]] const std::vector<std::string> &dependencies() const { return deps; }

        [[nodiscard]] const std::vector<TaskPtr> &tasks() const { return task_list; }

        [[nodiscard]] TargetTree *tree() const { return owner; }

    protected:
        int do_execute(TaskContext &context) override;

        [[nodiscard]] bool log_duration() const override { return true; }

        [[nodiscard]] std::string description_for_log() const override { return target_name; }

    private:
        friend class TargetTree;

        std::string target_name;
        std::vector<std::string> deps;
        std::vector<TaskPtr> task_list;
        TargetAction action;
        bool action_set = false; // through do_action() only
        bool hidden = false;
        TargetTree *owner = nullptr;
    };

    using TargetPtr = std::shared_ptr<Target>;
} // namespace tekton
