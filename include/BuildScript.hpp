#pragma once
#include <libintl.h>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>
#include "FileWrapper.hpp"
#include "TargetTree.hpp"
#include "TaskContext.hpp"

#ifndef TEKTON_GETTEXT_DEFINED
#define _(String) gettext(String)
#define TEKTON_GETTEXT_DEFINED
#endif

namespace tekton {
    // Loads a line oriented build script into a TargetTree:
    //
    //   @let OUT=build
    //   @target compile
    //     @desc Compile sources
    //     @depends prepare
    //     @task cmd="make -C ${OUT}" desc="make"
    //   @end
    //
    // Targets are registered as their @target line is read; dependencies stay
    // names and are resolved when the tree runs.
    class BuildScript {
    public:
        // Variables in @p overrides (e.g. -D NAME=VALUE) are not changed by @let.
        BuildScript(TargetTree &tree, const FileWrapper &files, const PropertyMap &overrides = {});

        // Parsing
        void parse_file(const std::string &path);

        void parse_line(const std::string &line);

        // Checks that every @target block was closed.
        void finalize();

        // Accès
        [[nodiscard]] const PropertyMap &variables() const { return vars; }

        // Copy the variables into the context properties, not overriding existing ones.
        void export_variables(TaskContext &context) const;

        std::string expand_vars(const std::string &in) const; // remplace ${VAR}
        bool eval_require_expr(const std::string &raw) const; // évalue @require

    private:
        // Helpers
        static std::string trim(const std::string &x);

        static bool starts_with(const std::string &s, const std::string &p);

        static std::vector<std::string> split_ws(const std::string &line);

        static std::string strip_quotes(const std::string &x);

        static bool is_truthy(const std::string &v);

        static bool str_to_int(const std::string &s, long long &out);

        // Value of key="..." in @p rest, empty when absent
        static std::string attribute(const std::string &rest, const std::string &key);

        static TargetAction shell_action(const std::string &cmd);

        // Erreur contextualisée
        [[noreturn]] void bad(const std::string &msg) const;

        Target &current_target(const char *directive) const;

        TargetTree &tree;
        const FileWrapper &files;
        PropertyMap vars; // @let
        std::unordered_set<std::string> locked; // set from the command line

        // Contexte parsing
        Target *current = nullptr; // open @target block
        std::string currentFile;
        int currentLine = 0;
        std::vector<std::filesystem::path> file_stack; // pile des fichiers
        std::unordered_set<std::string> include_guard; // chemins absolus visités
        int include_depth = 0;
        const int include_depth_max = 32;
    };
} // namespace tekton
