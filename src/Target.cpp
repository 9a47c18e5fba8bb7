#include "../include/Target.hpp"
#include "../include/TargetTree.hpp"
#include "../include/Errors.hpp"

using namespace tekton;

Target::Target(Key, std::string target_name) : target_name(std::move(target_name)) {
}

Target::Target(Key, TargetTree &tree, std::string target_name) : target_name(std::move(target_name)), owner(&tree) {
}

TargetPtr Target::create(const std::string &target_name) {
    return std::make_shared<Target>(Key{}, target_name);
}

Target &Target::depends_on(const std::string &dependency) {
    deps.push_back(dependency);
    return *this;
}

Target &Target::depends_on(const std::initializer_list<std::string> target_names) {
    deps.insert(deps.end(), target_names.begin(), target_names.end());
    return *this;
}

Target &Target::depends_on(const Target &target) {
    deps.push_back(target.name());
    return *this;
}

Target &Target::depends_on(const std::initializer_list<TargetPtr> targets) {
    for (const auto &t: targets) deps.push_back(t->name());
    return *this;
}

Target &Target::do_action(TargetAction new_action) {
    if (action_set) {
        throw ConfigurationError(target_name + ": " + _("target action was already set"));
    }
    action = std::move(new_action);
    action_set = true;
    return *this;
}

Target &Target::override_do(TargetAction new_action) {
    action = std::move(new_action);
    return *this;
}

Target &Target::add_task(TaskPtr task) {
    task_list.push_back(std::move(task));
    return *this;
}

Target &Target::add_task(const std::initializer_list<TaskPtr> new_tasks) {
    task_list.insert(task_list.end(), new_tasks.begin(), new_tasks.end());
    return *this;
}

Target &Target::set_as_default() {
    if (owner == nullptr) {
        throw ConfigurationError(target_name + ": " + _("target must be added to a target tree before it can be the default"));
    }
    owner->set_default_target(*this);
    return *this;
}

Target &Target::set_description(const std::string &text) {
    set_task_description(text);
    return *this;
}

Target &Target::set_as_hidden() {
    hidden = true;
    return *this;
}

TargetTree &Target::add_to_tree(TargetTree &tree) {
    tree.add_target(shared_from_this());
    return tree;
}

int Target::do_execute(TaskContext &context) {
    if (owner == nullptr) {
        throw ConfigurationError(target_name + ": " + _("target tree must be set before the target is executed"));
    }

    // Marked before the dependencies run: a dependency cycle leading back
    // here finds this target already executed and stops.
    owner->mark_target_as_executed(*this);
    owner->ensure_dependencies_executed(context, target_name);

    // action-less targets only sequence their dependencies and tasks
    if (action) action(context);

    int res = 0;
    for (const auto &task: task_list) {
        res = task->execute(context);
    }
    return res;
}
