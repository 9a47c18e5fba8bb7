#pragma once
#include <libintl.h>
#include <iostream>
#include <string>
#include <unordered_map>

#ifndef TEKTON_GETTEXT_DEFINED
#define _(String) gettext(String)
#define TEKTON_GETTEXT_DEFINED
#endif

namespace tekton {
    using PropertyMap = std::unordered_map<std::string, std::string>;

    // Replace every ${NAME} found in @p vars; unknown names are kept as written.
    std::string expand_variables(const std::string &in, const PropertyMap &vars);

    // Shared state handed unchanged to every action and task of a run:
    // the log stream and the build properties (-D NAME=VALUE, @let).
    class TaskContext {
    public:
        explicit TaskContext(std::ostream &log = std::cout);

        // Logging
        void log_info(const std::string &text) const;

        void log_error(const std::string &text) const;

        void status(const std::string &msg, bool ok) const;

        [[nodiscard]] std::ostream &log() const { return out; }

        // Properties
        void set_property(const std::string &name, const std::string &value);

        [[nodiscard]] bool has_property(const std::string &name) const;

        [[nodiscard]] std::string get_property(const std::string &name, const std::string &fallback = "") const;

        [[nodiscard]] const PropertyMap &properties() const { return props; }

        std::string expand(const std::string &in) const; // remplace ${VAR}

        // Abort the current action or task
        [[noreturn]] void fail(const std::string &msg) const;

    private:
        std::ostream &out;
        PropertyMap props;
    };
} // namespace tekton
