#pragma once
#include "Target.hpp"
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tekton {
    /**
     * @brief Registry of the targets of a build and memo of one run.
     *
     * The tree owns every registered target, the set of target names already
     * executed and the optional default target. A target runs at most once
     * for the lifetime of a tree: the executed set only grows.
     *
     * Single threaded: targets execute as a plain nested call chain.
     */
    class TargetTree {
    public:
        TargetTree() = default;

        TargetTree(const TargetTree &) = delete;

        TargetTree &operator=(const TargetTree &) = delete;

        /**
         * @brief Register @p target under its name and attach it to this tree.
         * @throws ConfigurationError if a target with the same name is registered.
         */
        void add_target(const TargetPtr &target);

        /**
         * @brief Create, attach and register a target named @p target_name.
         * @return The new target, for fluent configuration.
         * @throws ConfigurationError if a target with the same name is registered.
         */
        Target &add_target(const std::string &target_name);

        /**
         * @brief Register the built-in "help" target listing the targets on @p os.
         */
        Target &add_help_target(std::ostream &os);

        // Last call wins.
        void set_default_target(Target &target);

        [[nodiscard]] Target *default_target() const { return default_; }

        [[nodiscard]] bool has_target(const std::string &target_name) const;

        /**
         * @brief Look a target up by name.
         * @throws TargetNotFoundError if no target has that name.
         */
        [[nodiscard]] Target &get_target(const std::string &target_name) const;

        // Names among @p target_names that are not registered, in the given order.
        [[nodiscard]] std::vector<std::string> missing_targets(const std::vector<std::string> &target_names) const;

        [[nodiscard]] std::size_t target_count() const { return targets.size(); }

        // Registered targets in registration order.
        [[nodiscard]] std::vector<Target *> targets_in_order() const;

        void mark_target_as_executed(const Target &target);

        [[nodiscard]] bool was_executed(const std::string &target_name) const;

        [[nodiscard]] const std::unordered_set<std::string> &executed_targets() const { return executed; }

        /**
         * @brief Run every dependency of the named target not yet executed.
         *
         * Dependencies are looked up by name and run in declaration order.
         * Those already in the executed set are skipped, so a target shared
         * by several dependents runs once.
         *
         * @throws TargetNotFoundError if the target or one of its dependencies
         *         is not registered.
         */
        void ensure_dependencies_executed(TaskContext &context, const std::string &target_name);

        /**
         * @brief Execute the named target with its dependencies.
         * @return The target's result code, 0 if it already ran in this tree.
         * @throws TargetNotFoundError if no target has that name.
         */
        int run_target(TaskContext &context, const std::string &target_name);

        /**
         * @brief List the visible targets with their descriptions.
         */
        void print_targets(std::ostream &os) const;

    private:
        std::unordered_map<std::string, TargetPtr> targets;
        std::vector<std::string> order; // registration order
        std::unordered_set<std::string> executed;
        Target *default_ = nullptr;
    };
} // namespace tekton
