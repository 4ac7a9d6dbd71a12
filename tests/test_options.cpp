/**
 * @file test_options.cpp
 * @brief Tests for merge options loading (GoogleTest)
 */

#include <gtest/gtest.h>
#include "confmerge/Errors.hpp"
#include "confmerge/Options.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace confmerge;

TEST(MergeOptions, FromValue) {
    Value data = {
        {"files_dir", "configs"},
        {"default_overwrite", true},
        {"overwrite", Value::array({".local"})},
        {"append", Value::array({"$.storage.files", "passwd.users"})},
        {"resolve_path", ".local"}
    };

    MergeOptions opts = merge_options_from_value(data);

    EXPECT_EQ(opts.source_base_directory, "configs");
    EXPECT_TRUE(opts.default_overwrite);
    EXPECT_EQ(opts.overwrite_patterns, std::vector<std::string>({".local"}));
    EXPECT_EQ(opts.append_patterns, std::vector<std::string>({"$.storage.files", "passwd.users"}));
    EXPECT_EQ(opts.resolve_path_patterns, std::vector<std::string>({".local"}));
}

TEST(MergeOptions, DefaultsWhenEmpty) {
    MergeOptions opts = merge_options_from_value(Value::object());

    EXPECT_TRUE(opts.source_base_directory.empty());
    EXPECT_FALSE(opts.default_overwrite);
    EXPECT_TRUE(opts.overwrite_patterns.empty());
}

TEST(MergeOptions, PolicyPart) {
    MergeOptions opts;
    opts.default_overwrite = true;
    opts.overwrite_patterns = {"a"};
    opts.append_patterns = {"b"};
    opts.resolve_path_patterns = {".c"};

    PolicyOptions policy = opts.policy();
    EXPECT_TRUE(policy.default_overwrite);
    EXPECT_EQ(policy.overwrite, opts.overwrite_patterns);
    EXPECT_EQ(policy.append, opts.append_patterns);
    EXPECT_EQ(policy.resolve_path, opts.resolve_path_patterns);
}

TEST(MergeOptions, UnknownKeyRejected) {
    Value data = {{"overwrites", Value::array({".local"})}};
    EXPECT_THROW(merge_options_from_value(data), OptionsError);
}

TEST(MergeOptions, WrongTypesRejected) {
    EXPECT_THROW(merge_options_from_value({{"default_overwrite", "yes"}}), OptionsError);
    EXPECT_THROW(merge_options_from_value({{"files_dir", 3}}), OptionsError);
    EXPECT_THROW(merge_options_from_value({{"append", Value::array({1})}}), OptionsError);
    EXPECT_THROW(merge_options_from_value(Value::array({1})), OptionsError);
}

TEST(MergeOptions, LoadFromYamlFile) {
    fs::path path = fs::temp_directory_path() /
                    ("confmerge_opts_" + std::to_string(std::rand()) + ".yaml");
    {
        std::ofstream out(path);
        out << "files_dir: configs\n"
               "overwrite:\n"
               "  - .local\n"
               "resolve_path: [\".local\"]\n";
    }

    MergeOptions opts = load_merge_options(path.string());
    std::error_code ec;
    fs::remove(path, ec);

    EXPECT_EQ(opts.source_base_directory, "configs");
    EXPECT_EQ(opts.overwrite_patterns, std::vector<std::string>({".local"}));
    EXPECT_EQ(opts.resolve_path_patterns, std::vector<std::string>({".local"}));
}
