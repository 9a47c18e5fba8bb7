#include "../include/BuildScript.hpp"
#include "../include/Errors.hpp"
#include "../include/ShellTask.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <regex>
#include <sstream>
#include <stdexcept>

using namespace tekton;
namespace fs = std::filesystem;

// ------------ Helpers ------------
std::string BuildScript::trim(const std::string &x) {
    auto start = x.begin();
    while (start != x.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto rend = x.rbegin();
    while (rend != x.rend() && std::isspace(static_cast<unsigned char>(*rend))) {
        ++rend;
    }
    if (start >= rend.base()) return {};
    return std::string(start, rend.base());
}

bool BuildScript::starts_with(const std::string &s, const std::string &p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0
           && (s.size() == p.size() || std::isspace(static_cast<unsigned char>(s[p.size()])));
}

std::vector<std::string> BuildScript::split_ws(const std::string &line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) tokens.push_back(std::move(tok));
    return tokens;
}

std::string BuildScript::strip_quotes(const std::string &x) {
    std::string t = trim(x);
    if (t.size() >= 2) {
        const char a = t.front(), b = t.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            t = t.substr(1, t.size() - 2);
        }
    }
    return t;
}

bool BuildScript::is_truthy(const std::string &v) {
    if (v.empty()) return false;
    std::string s;
    s.reserve(v.size());
    for (const char c: v) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return !(s == "0" || s == "false" || s == "no" || s == "off");
}

bool BuildScript::str_to_int(const std::string &s, long long &out) {
    char *end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

std::string BuildScript::attribute(const std::string &rest, const std::string &key) {
    const std::regex re("\\b" + key + R"_TK(\s*=\s*"([^"]*)")_TK");
    std::smatch m;
    if (std::regex_search(rest, m, re) && m.size() >= 2) return m[1].str();
    return {};
}

TargetAction BuildScript::shell_action(const std::string &cmd) {
    return [cmd](TaskContext &context) {
        const std::string expanded = context.expand(cmd);
        context.log_info("$ " + expanded);
        if (const int rc = run_shell(expanded); rc != 0) {
            context.fail(expanded + ": " + _("command failed with code") + " " + std::to_string(rc));
        }
    };
}

// ------------ Core ------------

BuildScript::BuildScript(TargetTree &tree, const FileWrapper &files, const PropertyMap &overrides)
    : tree(tree)
    , files(files)
    , vars(overrides) {
    for (const auto &[name, value]: overrides) locked.insert(name);
}

void BuildScript::bad(const std::string &msg) const {
    std::string where = currentFile.empty() ? std::string("<script>") : currentFile;
    throw ConfigurationError("[tekton] " + where + ":" + std::to_string(currentLine) + ": " + msg);
}

Target &BuildScript::current_target(const char *directive) const {
    if (current == nullptr) bad(std::string(directive) + " " + _("used outside of @target"));
    return *current;
}

void BuildScript::parse_file(const std::string &path) {
    const fs::path p = fs::absolute(path).lexically_normal();
    if (include_depth >= include_depth_max) bad(_("Include depth exceeded"));
    if (!files.exists(p.string())) bad(std::string(_("Failed to open file: ")) + p.string());

    const std::string key = p.string();
    if (include_guard.find(key) != include_guard.end()) {
        bad(std::string(_("Circular include detected: ")) + key);
    }

    std::string content;
    try {
        content = files.read_all_text(key);
    } catch (const std::runtime_error &e) {
        bad(e.what());
    }

    // RAII guard pour stack, guard set et position courante
    struct IncludeGuardRAII {
        BuildScript *self;
        std::string key;
        std::string savedFile;
        int savedLine;

        IncludeGuardRAII(BuildScript *s, std::string k, const fs::path &pth)
            : self(s), key(std::move(k)), savedFile(s->currentFile), savedLine(s->currentLine) {
            self->include_guard.insert(key);
            self->file_stack.push_back(pth);
            self->include_depth++;
            self->currentFile = pth.string();
            self->currentLine = 0;
        }

        ~IncludeGuardRAII() {
            self->include_guard.erase(key);
            if (!self->file_stack.empty()) self->file_stack.pop_back();
            self->include_depth--;
            self->currentFile = savedFile;
            self->currentLine = savedLine;
        }
    } guard(this, key, p);

    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        ++currentLine;
        parse_line(line);
    }
}

void BuildScript::parse_line(const std::string &line) {
    const std::string s = trim(line);
    if (s.empty()) return;
    if (s.rfind("//", 0) == 0 || s.front() == '#') return;

    // ----- @include -----
    if (starts_with(s, "@include")) {
        if (current != nullptr) bad(_("@include inside a target"));
        std::string rest = trim(s.substr(std::string("@include").size()));
        if (rest.empty()) bad(_("@include expects a path"));
        rest = strip_quotes(rest);
        rest = strip_quotes(expand_vars(rest));

        // base = dossier du fichier courant; fallback = cwd
        const fs::path base = file_stack.empty() ? fs::current_path() : file_stack.back().parent_path();
        const fs::path target = fs::absolute(base / rest).lexically_normal();
        if (!files.exists(target.string())) {
            bad(std::string(_("@include file not found: ")) + target.string());
        }
        parse_file(target.string());
        return;
    }

    // ----- @let -----
    if (starts_with(s, "@let")) {
        const std::string rest = trim(s.substr(std::string("@let").size()));
        if (rest.empty()) bad(_("@let expects NAME=VALUE or NAME VALUE"));
        const auto eq = rest.find('=');
        std::string name, value;
        if (eq == std::string::npos) {
            const auto toks = split_ws(rest);
            name = toks[0];
            if (toks.size() == 1) {
                value = "1";
            } else {
                for (size_t i = 1; i < toks.size(); ++i) {
                    if (i > 1) value.push_back(' ');
                    value += toks[i];
                }
            }
        } else {
            name = trim(rest.substr(0, eq));
            value = trim(rest.substr(eq + 1));
        }
        static const std::regex nameRe(R"([A-Za-z_][A-Za-z0-9_]*)");
        if (!std::regex_match(name, nameRe)) bad(std::string(_("@let invalid name: ")) + name);
        if (locked.find(name) != locked.end()) return;
        vars[name] = expand_vars(strip_quotes(value));
        return;
    }

    // ----- @require -----
    if (starts_with(s, "@require")) {
        const std::string rest = trim(s.substr(std::string("@require").size()));
        if (rest.empty()) bad(_("@require expects an expression"));
        if (!eval_require_expr(rest)) {
            bad(std::string(_("@require failed: ")) + rest);
        }
        return;
    }

    // ----- Target blocks -----
    if (starts_with(s, "@target")) {
        if (current != nullptr) bad(_("@target inside another target"));
        const auto toks = split_ws(expand_vars(s.substr(std::string("@target").size())));
        if (toks.size() != 1) bad(_("@target expects a single name"));
        try {
            current = &tree.add_target(toks[0]);
        } catch (const ConfigurationError &e) {
            bad(e.what());
        }
        return;
    }
    if (starts_with(s, "@end")) {
        if (current == nullptr) bad(_("@end outside of @target"));
        current = nullptr;
        return;
    }
    if (starts_with(s, "@depends")) {
        Target &t = current_target("@depends");
        const auto toks = split_ws(expand_vars(s.substr(std::string("@depends").size())));
        if (toks.empty()) bad(_("@depends expects target names"));
        for (const auto &dep: toks) t.depends_on(dep);
        return;
    }
    if (starts_with(s, "@desc")) {
        Target &t = current_target("@desc");
        t.set_description(expand_vars(strip_quotes(s.substr(std::string("@desc").size()))));
        return;
    }
    if (starts_with(s, "@hidden")) {
        current_target("@hidden").set_as_hidden();
        return;
    }
    if (starts_with(s, "@default")) {
        current_target("@default").set_as_default();
        return;
    }
    if (starts_with(s, "@do") || starts_with(s, "@override")) {
        const bool overriding = starts_with(s, "@override");
        Target &t = current_target(overriding ? "@override" : "@do");
        const std::string cmd = attribute(s, "cmd");
        if (cmd.empty()) bad(_("action expects cmd=\"...\""));
        if (overriding) {
            t.override_do(shell_action(cmd));
            return;
        }
        try {
            t.do_action(shell_action(cmd));
        } catch (const ConfigurationError &e) {
            bad(e.what());
        }
        return;
    }
    if (starts_with(s, "@task")) {
        Target &t = current_target("@task");
        const std::string cmd = attribute(s, "cmd");
        if (cmd.empty()) bad(_("@task missing cmd=\"...\""));
        const auto task = ShellTask::create(cmd, expand_vars(attribute(s, "desc")));
        const std::string out = attribute(s, "stdout");
        const std::string err = attribute(s, "stderr");
        if (!out.empty() || !err.empty()) task->redirect_output(out, err);
        if (const std::string dir = attribute(s, "dir"); !dir.empty()) task->working_directory(dir);
        static const std::regex allowFailRe(R"(\ballow_fail\b)");
        // allow_fail outside of quoted values only
        static const std::regex quotedRe(R"("[^"]*")");
        if (std::regex_search(std::regex_replace(s, quotedRe, "\"\""), allowFailRe)) task->do_not_fail_on_error();
        t.add_task(task);
        return;
    }
    bad(std::string(_("Unknown directive: ")) + s);
}

void BuildScript::finalize() {
    if (current != nullptr) {
        bad(std::string(_("Missing @end for target ")) + current->name());
    }
}

void BuildScript::export_variables(TaskContext &context) const {
    for (const auto &[name, value]: vars) {
        if (!context.has_property(name)) context.set_property(name, value);
    }
}

std::string BuildScript::expand_vars(const std::string &in) const {
    return expand_variables(in, vars);
}

// ---------- eval_require_expr ----------
bool BuildScript::eval_require_expr(const std::string &raw) const {
    const std::string s = trim(raw);
    if (s.empty()) return false;

    std::vector<std::string> tok;
    {
        bool inq = false;
        std::string cur;
        for (const char c: s) {
            if (c == '"') {
                inq = !inq;
                continue;
            }
            if (!inq && std::isspace(static_cast<unsigned char>(c))) {
                if (!cur.empty()) {
                    tok.push_back(cur);
                    cur.clear();
                }
            } else {
                cur.push_back(c);
            }
        }
        if (!cur.empty()) tok.push_back(cur);
    }
    if (tok.empty()) return false;

    if (tok.size() == 1) {
        return is_truthy(expand_vars(tok[0]));
    }
    if (tok.size() >= 3) {
        const std::string L = expand_vars(tok[0]);
        const std::string OP = tok[1];
        // re-colle le RHS (au cas où il y avait des espaces entre guillemets)
        std::string R;
        for (size_t i = 2; i < tok.size(); ++i) {
            if (i > 2) R.push_back(' ');
            R += tok[i];
        }
        R = expand_vars(R);

        long long Li = 0, Ri = 0;
        const bool ints = str_to_int(L, Li) && str_to_int(R, Ri);

        if (OP == "==") return L == R;
        if (OP == "!=") return L != R;
        if (OP == ">") return ints && Li > Ri;
        if (OP == "<") return ints && Li < Ri;
        if (OP == ">=") return ints && Li >= Ri;
        if (OP == "<=") return ints && Li <= Ri;
        bad(std::string(_("@require unknown operator: ")) + OP);
    }
    return false;
}
