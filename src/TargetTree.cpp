#include "../include/TargetTree.hpp"
#include "../include/Errors.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>

using namespace tekton;

TargetNotFoundError::TargetNotFoundError(const std::string &target_name)
    : ConfigurationError(std::string(_("target not found")) + ": " + target_name)
    , name(target_name) {
}

void TargetTree::add_target(const TargetPtr &target) {
    if (targets.find(target->name()) != targets.end()) {
        throw ConfigurationError(std::string(_("target with this name already exists")) + ": " + target->name());
    }
    target->owner = this;
    targets.emplace(target->name(), target);
    order.push_back(target->name());
}

Target &TargetTree::add_target(const std::string &target_name) {
    const auto target = std::make_shared<Target>(Target::Key{}, *this, target_name);
    add_target(target);
    return *target;
}

Target &TargetTree::add_help_target(std::ostream &os) {
    return add_target("help")
            .set_description(_("Displays the available targets of the build"))
            .do_action([this, &os](TaskContext &) { print_targets(os); });
}

void TargetTree::set_default_target(Target &target) {
    default_ = &target;
}

bool TargetTree::has_target(const std::string &target_name) const {
    return targets.find(target_name) != targets.end();
}

Target &TargetTree::get_target(const std::string &target_name) const {
    const auto it = targets.find(target_name);
    if (it == targets.end()) throw TargetNotFoundError(target_name);
    return *it->second;
}

std::vector<std::string> TargetTree::missing_targets(const std::vector<std::string> &target_names) const {
    std::vector<std::string> missing;
    for (const auto &n: target_names) {
        if (!has_target(n)) missing.push_back(n);
    }
    return missing;
}

std::vector<Target *> TargetTree::targets_in_order() const {
    std::vector<Target *> out;
    out.reserve(order.size());
    for (const auto &n: order) out.push_back(targets.at(n).get());
    return out;
}

void TargetTree::mark_target_as_executed(const Target &target) {
    executed.insert(target.name());
}

bool TargetTree::was_executed(const std::string &target_name) const {
    return executed.find(target_name) != executed.end();
}

void TargetTree::ensure_dependencies_executed(TaskContext &context, const std::string &target_name) {
    const Target &target = get_target(target_name);
    for (const auto &dependency: target.dependencies()) {
        Target &dependent = get_target(dependency);
        if (was_executed(dependent.name())) continue;
        dependent.execute(context);
    }
}

int TargetTree::run_target(TaskContext &context, const std::string &target_name) {
    Target &target = get_target(target_name);
    if (was_executed(target_name)) {
        context.log_info(target_name + ": " + _("already executed"));
        return 0;
    }
    return target.execute(context);
}

void TargetTree::print_targets(std::ostream &os) const {
    std::size_t width = 0;
    for (const auto *t: targets_in_order()) {
        if (!t->is_hidden()) width = std::max(width, t->name().size());
    }
    os << _("Targets:") << '\n';
    for (const auto *t: targets_in_order()) {
        if (t->is_hidden()) continue;
        os << "  " << std::left << std::setw(static_cast<int>(width)) << t->name();
        if (!t->description().empty()) os << "  " << t->description();
        if (t == default_) os << " [" << _("default") << "]";
        os << '\n';
    }
    os << std::flush;
}
