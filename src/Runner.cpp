#include "../include/Runner.hpp"
#include "../include/Errors.hpp"
#include <exception>

using namespace tekton;

Runner::Runner(TargetTree &tree, TaskContext &context) : tree(tree), context(context) {
}

int Runner::run(const std::vector<std::string> &target_names) {
    failed.clear();
    std::vector<std::string> names = target_names;
    if (names.empty()) {
        const Target *def = tree.default_target();
        if (def == nullptr) {
            tree.print_targets(context.log());
            return 0;
        }
        names.push_back(def->name());
    }

    if (const auto missing = tree.missing_targets(names); !missing.empty()) {
        for (const auto &n: missing) {
            context.log_error(std::string(_("target not found")) + ": " + n);
        }
        return 1;
    }

    for (const auto &name: names) {
        try {
            const int rc = tree.run_target(context, name);
            context.status(name + " (" + _("result") + " " + std::to_string(rc) + ")", true);
        } catch (const ConfigurationError &e) {
            failed = name;
            context.log_error(std::string(_("build script error")) + ": " + e.what());
            return 1;
        } catch (const std::exception &e) {
            failed = name;
            context.log_error(name + ": " + e.what());
            return 1;
        }
    }
    context.status(_("Build completed successfully"), true);
    return 0;
}
