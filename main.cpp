#include "BuildScript.hpp"
#include "Console.hpp"
#include "Errors.hpp"
#include "FileWrapper.hpp"
#include "Runner.hpp"
#include "TargetTree.hpp"
#include "TaskContext.hpp"
#include <clocale>
#include <iostream>
#include <string>
#include <vector>

#ifndef TEKTON_LOCALEDIR
#define TEKTON_LOCALEDIR "/usr/share/locale"
#endif

using namespace tekton;

static void usage(std::ostream &os) {
    os << _("Usage: tekton [-f FILE] [-D NAME=VALUE]... [--list] [target...]") << '\n'
       << _("  -f FILE          build script to load (default: tekton.tk)") << '\n'
       << _("  -D NAME=VALUE    define a build property, overrides @let") << '\n'
       << _("  -l, --list       list the available targets and exit") << '\n'
       << _("  -h, --help       show this help and exit") << '\n';
}

int main(const int argc, char **argv) {
    std::setlocale(LC_ALL, "");
    bindtextdomain("tekton", TEKTON_LOCALEDIR);
    textdomain("tekton");

    std::string script = "tekton.tk";
    PropertyMap defines;
    std::vector<std::string> targets;
    bool list_only = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            usage(std::cout);
            return 0;
        }
        if (arg == "-l" || arg == "--list") {
            list_only = true;
        } else if (arg == "-f") {
            if (i + 1 >= argc) {
                usage(std::cerr);
                return 2;
            }
            script = argv[++i];
        } else if (arg.rfind("-D", 0) == 0) {
            std::string def = arg.substr(2);
            if (def.empty() && i + 1 < argc) def = argv[++i];
            const auto eq = def.find('=');
            if (def.empty() || eq == 0) {
                usage(std::cerr);
                return 2;
            }
            if (eq == std::string::npos) defines[def] = "1";
            else defines[def.substr(0, eq)] = def.substr(eq + 1);
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << _("Unknown option: ") << arg << '\n';
            usage(std::cerr);
            return 2;
        } else {
            targets.push_back(arg);
        }
    }

    TaskContext context(std::cout);
    for (const auto &[name, value]: defines) context.set_property(name, value);

    TargetTree tree;
    const LocalFileWrapper files{};
    BuildScript loader(tree, files, defines);
    try {
        tree.add_help_target(std::cout);
        loader.parse_file(script);
        loader.finalize();
    } catch (const ConfigurationError &e) {
        print_status(std::cerr, e.what(), "!!", true);
        return 1;
    }
    loader.export_variables(context);

    if (list_only) {
        tree.print_targets(std::cout);
        return 0;
    }

    Runner runner(tree, context);
    return runner.run(targets);
}
