#pragma once
#include <libintl.h>
#include <iosfwd>
#include <string>
#include <vector>
#include "TargetTree.hpp"
#include "TaskContext.hpp"

#ifndef TEKTON_GETTEXT_DEFINED
#define _(String) gettext(String)
#define TEKTON_GETTEXT_DEFINED
#endif

namespace tekton {
    // Executes the targets requested for one invocation.
    class Runner {
    public:
        Runner(TargetTree &tree, TaskContext &context);

        /**
         * @brief Run the requested targets in order against one executed set.
         *
         * With no names the default target runs; with neither names nor a
         * default the target list is printed. Unknown names are all reported
         * before anything runs.
         *
         * @return 0 when every target completed, 1 otherwise.
         */
        int run(const std::vector<std::string> &target_names);

        // Name of the target that raised the last fault, empty if none.
        [[nodiscard]] const std::string &failed_target() const { return failed; }

    private:
        TargetTree &tree;
        TaskContext &context;
        std::string failed;
    };
} // namespace tekton
