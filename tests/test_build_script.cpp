#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../include/BuildScript.hpp"
#include "../include/Errors.hpp"
#include "../include/ShellTask.hpp"

using namespace tekton;

namespace
{
    // Scripts kept in memory, keyed by absolute path.
    class MemoryFiles : public FileWrapper
    {
    public:
        std::map<std::string, std::string> files;

        [[nodiscard]] bool exists(const std::string &path) const override
        {
            return files.find(path) != files.end();
        }

        [[nodiscard]] std::string read_all_text(const std::string &path) const override
        {
            const auto it = files.find(path);
            if (it == files.end()) throw std::runtime_error("no such file: " + path);
            return it->second;
        }
    };

    struct TmpFile
    {
        std::string path;

        explicit TmpFile(std::string p) : path(std::move(p))
        {
        }

        ~TmpFile() { std::remove(path.c_str()); }
    };

    void load(TargetTree &tree, const std::string &dsl, const PropertyMap &overrides = {})
    {
        MemoryFiles fs;
        fs.files["/project/tekton.tk"] = dsl;
        BuildScript script(tree, fs, overrides);
        script.parse_file("/project/tekton.tk");
        script.finalize();
    }
} // namespace

TEST(BuildScript, TargetsWithDependenciesAndTasks)
{
    TargetTree tree;
    load(tree,
         "// build\n"
         "@target compile\n"
         "  @desc \"Compile sources\"\n"
         "  @task cmd=\"make -j4\" desc=\"make\"\n"
         "  @task cmd=\"strip app\"\n"
         "@end\n"
         "\n"
         "# packaging\n"
         "@target package\n"
         "  @depends compile test\n"
         "  @default\n"
         "@end\n");

    ASSERT_EQ(tree.target_count(), 2u);
    const Target &compile = tree.get_target("compile");
    EXPECT_EQ(compile.description(), "Compile sources");
    ASSERT_EQ(compile.tasks().size(), 2u);
    EXPECT_EQ(compile.tasks()[0]->description(), "make");
    const auto shell = std::dynamic_pointer_cast<ShellTask>(compile.tasks()[1]);
    ASSERT_NE(shell, nullptr);
    EXPECT_EQ(shell->command(), "strip app");
    EXPECT_TRUE(shell->fails_on_error());

    const Target &package = tree.get_target("package");
    const std::vector<std::string> deps{"compile", "test"}; // test: late bound, not required here
    EXPECT_EQ(package.dependencies(), deps);
    EXPECT_EQ(tree.default_target(), &package);
}

TEST(BuildScript, HiddenAndAllowFail)
{
    TargetTree tree;
    load(tree,
         "@target lint\n"
         "@hidden\n"
         "@task cmd=\"cppcheck src\" allow_fail\n"
         "@task cmd=\"echo allow_fail\"\n"
         "@end\n");

    const Target &lint = tree.get_target("lint");
    EXPECT_TRUE(lint.is_hidden());
    ASSERT_EQ(lint.tasks().size(), 2u);
    EXPECT_FALSE(std::dynamic_pointer_cast<ShellTask>(lint.tasks()[0])->fails_on_error());
    EXPECT_TRUE(std::dynamic_pointer_cast<ShellTask>(lint.tasks()[1])->fails_on_error());
}

TEST(BuildScript, LetAndExpansion)
{
    TargetTree tree;
    MemoryFiles fs;
    fs.files["/project/tekton.tk"] =
            "@let APP=demo\n"
            "@let OUT \"build/${APP}\"\n"
            "@let VERBOSE\n"
            "@target ${APP}\n"
            "@desc Build ${APP} into ${OUT}\n"
            "@end\n";
    BuildScript script(tree, fs);
    script.parse_file("/project/tekton.tk");
    script.finalize();

    EXPECT_EQ(script.variables().at("APP"), "demo");
    EXPECT_EQ(script.variables().at("OUT"), "build/demo");
    EXPECT_EQ(script.variables().at("VERBOSE"), "1");
    EXPECT_EQ(tree.get_target("demo").description(), "Build demo into build/demo");
}

TEST(BuildScript, CommandLineOverridesLet)
{
    TargetTree tree;
    MemoryFiles fs;
    fs.files["/project/tekton.tk"] = "@let MODE=debug\n@let OTHER=x\n";
    BuildScript script(tree, fs, {{"MODE", "release"}});
    script.parse_file("/project/tekton.tk");

    EXPECT_EQ(script.variables().at("MODE"), "release");

    std::ostringstream log;
    TaskContext ctx(log);
    ctx.set_property("OTHER", "from-context");
    script.export_variables(ctx);
    EXPECT_EQ(ctx.get_property("MODE"), "release");
    EXPECT_EQ(ctx.get_property("OTHER"), "from-context");
    const PropertyMap expected{{"MODE", "release"}, {"OTHER", "from-context"}};
    EXPECT_EQ(ctx.properties(), expected);
}

TEST(BuildScript, RequireExpressions)
{
    TargetTree tree;
    MemoryFiles fs;
    BuildScript script(tree, fs, {{"JOBS", "8"}, {"MODE", "release"}, {"OFF", "no"}});
    EXPECT_TRUE(script.eval_require_expr("${JOBS} >= 4"));
    EXPECT_FALSE(script.eval_require_expr("${JOBS} < 4"));
    EXPECT_TRUE(script.eval_require_expr("${MODE} == release"));
    EXPECT_TRUE(script.eval_require_expr("${MODE} != \"debug build\""));
    EXPECT_TRUE(script.eval_require_expr("${MODE}"));
    EXPECT_FALSE(script.eval_require_expr("${OFF}"));
    EXPECT_FALSE(script.eval_require_expr("${MODE} > 3"));
}

TEST(BuildScript, FailedRequireThrows)
{
    TargetTree tree;
    EXPECT_THROW(load(tree, "@let JOBS=1\n@require ${JOBS} > 2\n"), ConfigurationError);
}

TEST(BuildScript, IncludeRelativeToCurrentFile)
{
    TargetTree tree;
    MemoryFiles fs;
    fs.files["/project/tekton.tk"] =
            "@let DIR=scripts\n"
            "@include \"${DIR}/common.tk\"\n"
            "@target all\n@depends clean\n@end\n";
    fs.files["/project/scripts/common.tk"] = "@target clean\n@task cmd=\"rm -rf build\"\n@end\n";
    BuildScript script(tree, fs);
    script.parse_file("/project/tekton.tk");
    script.finalize();

    EXPECT_TRUE(tree.has_target("clean"));
    EXPECT_TRUE(tree.has_target("all"));
}

TEST(BuildScript, IncludeInsideTargetThrows)
{
    TargetTree tree;
    MemoryFiles fs;
    fs.files["/project/tekton.tk"] = "@target outer\n@include inner.tk\n@depends lib\n@end\n";
    fs.files["/project/inner.tk"] = "@end\n@target lib\n@end\n";
    BuildScript script(tree, fs);
    try {
        script.parse_file("/project/tekton.tk");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError &e) {
        EXPECT_NE(std::string(e.what()).find("/project/tekton.tk:2"), std::string::npos) << e.what();
    }
    EXPECT_FALSE(tree.has_target("lib"));
}

TEST(BuildScript, CircularIncludeThrows)
{
    TargetTree tree;
    MemoryFiles fs;
    fs.files["/project/a.tk"] = "@include b.tk\n";
    fs.files["/project/b.tk"] = "@include a.tk\n";
    BuildScript script(tree, fs);
    EXPECT_THROW(script.parse_file("/project/a.tk"), ConfigurationError);
}

TEST(BuildScript, ErrorCarriesFileAndLine)
{
    TargetTree tree;
    try {
        load(tree, "@target a\n@end\n@frobnicate\n");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError &e) {
        EXPECT_NE(std::string(e.what()).find("/project/tekton.tk:3"), std::string::npos) << e.what();
    }
}

TEST(BuildScript, IncludedErrorReportsIncludedFile)
{
    TargetTree tree;
    MemoryFiles fs;
    fs.files["/project/tekton.tk"] = "@include inc.tk\n";
    fs.files["/project/inc.tk"] = "\n@end\n";
    BuildScript script(tree, fs);
    try {
        script.parse_file("/project/tekton.tk");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError &e) {
        EXPECT_NE(std::string(e.what()).find("/project/inc.tk:2"), std::string::npos) << e.what();
    }
}

TEST(BuildScript, SecondDoThrowsOverrideAllowed)
{
    TargetTree tree;
    EXPECT_THROW(load(tree, "@target a\n@do cmd=\"true\"\n@do cmd=\"false\"\n@end\n"), ConfigurationError);

    TargetTree other;
    EXPECT_NO_THROW(load(other, "@target a\n@do cmd=\"false\"\n@override cmd=\"true\"\n@end\n"));
    EXPECT_TRUE(other.get_target("a").has_action());

    std::ostringstream log;
    TaskContext ctx(log);
    EXPECT_EQ(other.run_target(ctx, "a"), 0);
}

TEST(BuildScript, FailingActionThrowsAtRun)
{
    TargetTree tree;
    load(tree, "@target a\n@do cmd=\"exit 4\"\n@end\n");
    std::ostringstream log;
    TaskContext ctx(log);
    EXPECT_THROW(tree.run_target(ctx, "a"), TaskExecutionError);
}

TEST(BuildScript, DuplicateTargetThrows)
{
    TargetTree tree;
    EXPECT_THROW(load(tree, "@target a\n@end\n@target a\n@end\n"), ConfigurationError);
}

TEST(BuildScript, StructureErrors)
{
    {
        TargetTree tree;
        EXPECT_THROW(load(tree, "@depends a\n"), ConfigurationError);
    }
    {
        TargetTree tree;
        EXPECT_THROW(load(tree, "@target a\n@target b\n"), ConfigurationError);
    }
    {
        TargetTree tree;
        EXPECT_THROW(load(tree, "@target a\n"), ConfigurationError); // missing @end
    }
    {
        TargetTree tree;
        EXPECT_THROW(load(tree, "@target a\n@task desc=\"nothing\"\n@end\n"), ConfigurationError);
    }
    {
        TargetTree tree;
        EXPECT_THROW(load(tree, "@target two names\n@end\n"), ConfigurationError);
    }
}

TEST(BuildScript, MissingFileThrows)
{
    TargetTree tree;
    MemoryFiles fs;
    BuildScript script(tree, fs);
    EXPECT_THROW(script.parse_file("/project/none.tk"), ConfigurationError);
}

TEST(BuildScript, LocalFileWrapperReadsScript)
{
    TmpFile tf("tekton_local_script.tk");
    {
        std::ofstream o(tf.path);
        o << "@target hello\n@task cmd=\"echo hello\"\n@end\n";
    }
    TargetTree tree;
    const LocalFileWrapper files{};
    EXPECT_TRUE(files.exists(tf.path));
    EXPECT_FALSE(files.exists("tekton_no_such_script.tk"));

    BuildScript script(tree, files);
    script.parse_file(tf.path);
    script.finalize();
    EXPECT_TRUE(tree.has_target("hello"));
}
