#include "../include/TaskContext.hpp"
#include "../include/Console.hpp"
#include "../include/Errors.hpp"
#include <regex>

using namespace tekton;

TaskContext::TaskContext(std::ostream &log) : out(log) {
}

void TaskContext::log_info(const std::string &text) const {
    out << "   " << text << '\n';
}

void TaskContext::log_error(const std::string &text) const {
    print_status(out, text, "!!", true);
}

void TaskContext::status(const std::string &msg, const bool ok) const {
    print_status(out, msg, ok ? "ok" : "!!", !ok);
}

void TaskContext::set_property(const std::string &name, const std::string &value) {
    props[name] = value;
}

bool TaskContext::has_property(const std::string &name) const {
    return props.find(name) != props.end();
}

std::string TaskContext::get_property(const std::string &name, const std::string &fallback) const {
    if (const auto it = props.find(name); it != props.end()) return it->second;
    return fallback;
}

std::string tekton::expand_variables(const std::string &in, const PropertyMap &vars) {
    static const std::regex re(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");
    std::string result;
    result.reserve(in.size());
    std::sregex_iterator it(in.begin(), in.end(), re);
    size_t last = 0;
    for (const std::sregex_iterator end; it != end; ++it) {
        const auto &m = *it;
        result.append(in, last, static_cast<size_t>(m.position()) - last);
        if (const auto itv = vars.find(m[1].str()); itv != vars.end()) result += itv->second;
        else result += m.str();
        last = static_cast<size_t>(m.position() + m.length());
    }
    result.append(in, last, std::string::npos);
    return result;
}

std::string TaskContext::expand(const std::string &in) const {
    return expand_variables(in, props);
}

void TaskContext::fail(const std::string &msg) const {
    throw TaskExecutionError(msg);
}
