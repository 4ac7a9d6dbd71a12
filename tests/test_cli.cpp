/**
 * @file test_cli.cpp
 * @brief Unit tests for CLI functionality (GoogleTest)
 *
 * Tests cover:
 * - describe_policy: --explain output
 * - add_pattern_lists: command-line patterns extending an options file
 * - run_cli: exit codes and output streams
 */

#include <gtest/gtest.h>

#include "confmerge/Cli.hpp"
#include "confmerge/Loader.hpp"
#include "confmerge/Options.hpp"
#include "confmerge/Policy.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace confmerge;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/**
 * @brief RAII helper for temporary directory trees.
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() /
                      ("confmerge_cli_dir_" + std::to_string(std::rand()))) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }

    std::string create_file(const std::string& name, const std::string& content) {
        fs::path file_path = path_ / name;
        fs::create_directories(file_path.parent_path());
        std::ofstream out(file_path);
        out << content;
        return file_path.string();
    }

private:
    fs::path path_;
};

/**
 * @brief Runs run_cli() on a list of arguments, capturing both streams
 */
struct CliRun {
    int code = -1;
    std::string out;
    std::string err;
};

CliRun run(std::vector<std::string> args) {
    args.insert(args.begin(), "confmerge");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    std::ostringstream out;
    std::ostringstream err;
    CliRun result;
    result.code = run_cli(static_cast<int>(args.size()), argv.data(), out, err);
    result.out = out.str();
    result.err = err.str();
    return result;
}

} // namespace

// ============================================================================
// describe_policy
// ============================================================================

TEST(DescribePolicy, AbsoluteBeatsRelative) {
    PolicyOptions opts;
    opts.overwrite = {"$.storage.files"};
    opts.append = {".files"};
    MergePolicy policy(opts);

    EXPECT_EQ(describe_policy(policy, "$.storage.files"),
              "path:      $.storage.files\n"
              "conflict:  overwrite (absolute pattern $.storage.files)\n"
              "resolve:   no\n");

    EXPECT_EQ(describe_policy(policy, "$.passwd.files"),
              "path:      $.passwd.files\n"
              "conflict:  append (relative pattern .files)\n"
              "resolve:   no\n");
}

TEST(DescribePolicy, DefaultWhenNothingMatches) {
    PolicyOptions opts;
    opts.default_overwrite = true;
    opts.resolve_path = {".local"};
    MergePolicy policy(opts);

    EXPECT_EQ(describe_policy(policy, "$.ignition.local"),
              "path:      $.ignition.local\n"
              "conflict:  overwrite (default)\n"
              "resolve:   yes\n");

    MergePolicy append_default;
    EXPECT_NE(describe_policy(append_default, "$.x").find("conflict:  append (default)"),
              std::string::npos);
}

// ============================================================================
// add_pattern_lists
// ============================================================================

TEST(AddPatternLists, ExtendsLoadedOptions) {
    MergeOptions opts;
    opts.overwrite_patterns = {".local"};
    opts.append_patterns = {"$.storage.files"};

    add_pattern_lists(opts, " .local, $.version ", "", ".local,,");

    EXPECT_EQ(opts.overwrite_patterns, std::vector<std::string>({".local", "$.version"}));
    EXPECT_EQ(opts.append_patterns, std::vector<std::string>({"$.storage.files"}));
    EXPECT_EQ(opts.resolve_path_patterns, std::vector<std::string>({".local"}));
}

// ============================================================================
// run_cli
// ============================================================================

TEST(RunCli, HelpExitsZero) {
    CliRun r = run({"--help"});

    EXPECT_EQ(r.code, kExitOk);
    EXPECT_NE(r.out.find("--resolve-path"), std::string::npos);
    EXPECT_TRUE(r.err.empty());
}

TEST(RunCli, UnknownFlagIsUsageError) {
    CliRun r = run({"--no-such-flag", "a.yaml"});

    EXPECT_EQ(r.code, kExitUsage);
    EXPECT_EQ(r.err.rfind("Error: ", 0), 0u);
}

TEST(RunCli, NoSourcesIsUsageError) {
    CliRun r = run({});

    EXPECT_EQ(r.code, kExitUsage);
    EXPECT_NE(r.err.find("no sources given"), std::string::npos);
}

TEST(RunCli, MergesToStdout) {
    TempDir dir;
    dir.create_file("a.json", R"({"list": [1], "name": "a"})");
    dir.create_file("b.json", R"({"list": [2], "port": 80})");

    CliRun r = run({"-d", dir.path(), "a.json", "b.json"});

    ASSERT_EQ(r.code, kExitOk) << r.err;
    Value merged = parse_document(r.out, Format::Json);
    EXPECT_EQ(merged["list"], Value::array({1, 2}));
    EXPECT_EQ(merged["name"], "a");
    EXPECT_EQ(merged["port"], 80);
}

TEST(RunCli, FormatFlagAndOutFile) {
    TempDir dir;
    dir.create_file("a.json", R"({"a": 1})");
    std::string out_path = (fs::path(dir.path()) / "merged.yaml").string();

    CliRun r = run({"-d", dir.path(), "-f", "yaml", "-o", out_path, "a.json"});

    ASSERT_EQ(r.code, kExitOk) << r.err;
    EXPECT_TRUE(r.out.empty());
    EXPECT_EQ(load_document_file(out_path), Value::object({{"a", 1}}));
}

TEST(RunCli, OverwriteFlagResolvesConflict) {
    TempDir dir;
    dir.create_file("a.json", R"({"version": 1})");
    dir.create_file("b.json", R"({"version": 2})");

    CliRun conflict = run({"-d", dir.path(), "a.json", "b.json"});
    EXPECT_EQ(conflict.code, kExitError);
    EXPECT_NE(conflict.err.find("b.json"), std::string::npos);

    CliRun resolved = run({"-d", dir.path(), "--overwrite", ".version", "a.json", "b.json"});
    ASSERT_EQ(resolved.code, kExitOk) << resolved.err;
    EXPECT_EQ(parse_document(resolved.out, Format::Json)["version"], 2);
}

TEST(RunCli, MissingSourceIsError) {
    TempDir dir;
    CliRun r = run({"-d", dir.path(), "missing.yaml"});

    EXPECT_EQ(r.code, kExitError);
    EXPECT_NE(r.err.find("missing.yaml"), std::string::npos);
}

TEST(RunCli, UnknownOutputFormatIsError) {
    TempDir dir;
    dir.create_file("a.json", "{}");

    CliRun r = run({"-d", dir.path(), "-f", "xml", "a.json"});
    EXPECT_EQ(r.code, kExitError);
}

TEST(RunCli, ExplainCombinesConfigAndFlags) {
    TempDir dir;
    std::string config = dir.create_file("opts.yaml",
        "default_overwrite: false\n"
        "overwrite: [\".local\"]\n");

    CliRun from_file = run({"-c", config, "--explain", "$.ignition.local"});
    ASSERT_EQ(from_file.code, kExitOk) << from_file.err;
    EXPECT_NE(from_file.out.find("overwrite (relative pattern .local)"), std::string::npos);

    CliRun from_flag = run({"-c", config, "--append", "$.storage.files",
                            "--explain", "$.storage.files"});
    ASSERT_EQ(from_flag.code, kExitOk) << from_flag.err;
    EXPECT_NE(from_flag.out.find("append (absolute pattern $.storage.files)"), std::string::npos);
}

TEST(RunCli, ConflictingPatternsAreError) {
    CliRun r = run({"--overwrite", "storage", "--append", "$.storage", "--explain", "$.storage"});

    EXPECT_EQ(r.code, kExitError);
    EXPECT_NE(r.err.find("$.storage"), std::string::npos);
}

TEST(RunCli, BadOptionsFileIsError) {
    TempDir dir;
    std::string config = dir.create_file("opts.yaml", "overwrites: [\".local\"]\n");

    CliRun r = run({"-c", config, "a.yaml"});
    EXPECT_EQ(r.code, kExitError);
    EXPECT_NE(r.err.find("overwrites"), std::string::npos);
}
