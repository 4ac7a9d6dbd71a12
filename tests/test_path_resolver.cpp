/**
 * @file test_path_resolver.cpp
 * @brief Tests for file-relative path rewriting (GoogleTest)
 */

#include <gtest/gtest.h>
#include "confmerge/PathResolver.hpp"

using namespace confmerge;

// ============================================================================
// join_path
// ============================================================================

TEST(JoinPath, Simple) {
    EXPECT_EQ(join_path("host-dir", "foo.ign"), "host-dir/foo.ign");
}

TEST(JoinPath, DotDirectory) {
    EXPECT_EQ(join_path(".", "foo.ign"), "foo.ign");
}

TEST(JoinPath, EmptyDirectory) {
    EXPECT_EQ(join_path("", "./files/foo.ign"), "files/foo.ign");
}

TEST(JoinPath, ParentSegments) {
    EXPECT_EQ(join_path("a/b", "../c"), "a/c");
    EXPECT_EQ(join_path("a", "../../c"), "../c");
}

TEST(JoinPath, CleansSeparators) {
    EXPECT_EQ(join_path("a/", "b//c/"), "a/b/c");
}

TEST(JoinPath, AbsoluteValueStaysUnderDirectory) {
    EXPECT_EQ(join_path("a", "/etc/hosts"), "a/etc/hosts");
}

TEST(JoinPath, EmptyValue) {
    EXPECT_EQ(join_path("a/b", ""), "a/b");
}

TEST(JoinPath, BothEmpty) {
    EXPECT_EQ(join_path("", ""), "");
}

// ============================================================================
// resolve_paths
// ============================================================================

class ResolvePathsTest : public ::testing::Test {
protected:
    MergePolicy policy = MergePolicy::build([] {
        PolicyOptions opts;
        opts.resolve_path = {".local"};
        return opts;
    }());
};

TEST_F(ResolvePathsTest, RewritesMatchingString) {
    Value doc = {{"storage", {{"local", "foo.ign"}, {"path", "/etc/foo"}}}};
    resolve_paths(doc, "host-dir", policy);

    EXPECT_EQ(doc["storage"]["local"], "host-dir/foo.ign");
    EXPECT_EQ(doc["storage"]["path"], "/etc/foo");
}

TEST_F(ResolvePathsTest, ScopedToSourceDirectory) {
    Value host = {{"contents", {{"local", "foo.ign"}}}};
    Value common = host;

    resolve_paths(host, "host-dir", policy);
    resolve_paths(common, "common", policy);

    EXPECT_EQ(host["contents"]["local"], "host-dir/foo.ign");
    EXPECT_EQ(common["contents"]["local"], "common/foo.ign");
}

TEST_F(ResolvePathsTest, NonStringScalarsUnchanged) {
    Value doc = {{"a", {{"local", 42}}}, {"b", {{"local", true}}}, {"c", {{"local", nullptr}}}};
    Value before = doc;
    resolve_paths(doc, "dir", policy);

    EXPECT_EQ(doc, before);
}

TEST_F(ResolvePathsTest, SequenceOfStringsRewritten) {
    Value doc = {{"local", Value::array({"a.ign", "b.ign"})}};
    resolve_paths(doc, "dir", policy);

    EXPECT_EQ(doc["local"], Value::array({"dir/a.ign", "dir/b.ign"}));
}

TEST_F(ResolvePathsTest, PartiallyResolvableSequenceLeftUnchanged) {
    // One entry cannot be rewritten, so none are
    Value doc = {{"local", {"a.ign", 7, "b.ign"}}};
    resolve_paths(doc, "dir", policy);

    EXPECT_EQ(doc["local"], Value::array({"a.ign", 7, "b.ign"}));
}

TEST_F(ResolvePathsTest, MappingsInsideSequencesResolved) {
    Value doc = {
        {"storage", {
            {"files", {
                {{"path", "/etc/a"}, {"contents", {{"local", "a.txt"}}}},
                {{"path", "/etc/b"}, {"contents", {{"local", "b.txt"}}}}
            }}
        }}
    };
    resolve_paths(doc, "host", policy);

    EXPECT_EQ(doc["storage"]["files"][0]["contents"]["local"], "host/a.txt");
    EXPECT_EQ(doc["storage"]["files"][1]["contents"]["local"], "host/b.txt");
    EXPECT_EQ(doc["storage"]["files"][0]["path"], "/etc/a");
}

TEST_F(ResolvePathsTest, NonMatchingPathsUntouched) {
    Value doc = {{"storage", {{"remote", "foo.ign"}, {"list", {"x", "y"}}}}};
    Value before = doc;
    resolve_paths(doc, "dir", policy);

    EXPECT_EQ(doc, before);
}

TEST_F(ResolvePathsTest, SequencePathIsKeyPath) {
    // Elements share the key's path; nested sequences do not extend it
    Value doc = Value::object();
    doc["local"] = Value::array({Value::array({"a", "b"}), Value::array({"c"})});
    resolve_paths(doc, "d", policy);

    Value expected = Value::array({Value::array({"d/a", "d/b"}), Value::array({"d/c"})});
    EXPECT_EQ(doc["local"], expected);
}

TEST(ResolvePaths, NoPatternsIsNoOp) {
    MergePolicy policy;
    Value doc = {{"local", "foo.ign"}};
    resolve_paths(doc, "dir", policy);

    EXPECT_EQ(doc["local"], "foo.ign");
}

TEST(ResolvePaths, AbsolutePattern) {
    PolicyOptions opts;
    opts.resolve_path = {"$.ignition.source"};
    MergePolicy policy(opts);

    Value doc = {{"ignition", {{"source", "base.ign"}}}, {"source", "other.ign"}};
    resolve_paths(doc, "common", policy);

    EXPECT_EQ(doc["ignition"]["source"], "common/base.ign");
    EXPECT_EQ(doc["source"], "other.ign");
}
