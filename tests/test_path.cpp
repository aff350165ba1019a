/**
 * @file test_path.cpp
 * @brief Unit tests for Path and resolve_path (GoogleTest)
 *
 * Covers:
 * - flat keys are matched literally, even with dots
 * - key paths descend into objects and arrays
 * - empty paths always fail
 * - missing keys, bad indices and scalar descent
 */

#include <gtest/gtest.h>
#include "unbox/Path.hpp"
#include "unbox/Errors.hpp"

using namespace unbox;

// ============================================================================
// split_dot_path / join_dot_path
// ============================================================================

TEST(SplitDotPath, SplitsOnDots) {
    EXPECT_EQ(split_dot_path("a.b.c"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(split_dot_path("single"), (std::vector<std::string>{"single"}));
}

TEST(SplitDotPath, SkipsEmptySegments) {
    EXPECT_TRUE(split_dot_path("").empty());
    EXPECT_TRUE(split_dot_path(".").empty());
    EXPECT_TRUE(split_dot_path("..").empty());
    EXPECT_EQ(split_dot_path("a..b."), (std::vector<std::string>{"a", "b"}));
}

TEST(JoinDotPath, JoinsSegments) {
    EXPECT_EQ(join_dot_path({"a", "b", "c"}), "a.b.c");
    EXPECT_EQ(join_dot_path({}), "");
}

// ============================================================================
// Path construction
// ============================================================================

TEST(PathConstruction, StringIsFlatKey) {
    Path path = "a.b";
    ASSERT_EQ(path.segments().size(), 1u);
    EXPECT_EQ(path.segments()[0], "a.b");
    EXPECT_EQ(path.str(), "a.b");
}

TEST(PathConstruction, KeyPathSplits) {
    Path path = Path::key_path("a.b.0");
    EXPECT_EQ(path.segments(), (std::vector<std::string>{"a", "b", "0"}));
    EXPECT_EQ(path.str(), "a.b.0");
}

TEST(PathConstruction, ExplicitKeys) {
    Path path = Path::keys({"first", "second.with.dots"});
    EXPECT_EQ(path.segments().size(), 2u);
    EXPECT_EQ(path.str(), "first.second.with.dots");
}

TEST(PathConstruction, EmptyVariantsHaveNoSegments) {
    EXPECT_TRUE(Path::key("").empty());
    EXPECT_TRUE(Path::key_path("").empty());
    EXPECT_TRUE(Path::key_path("..").empty());
    EXPECT_TRUE(Path::keys({}).empty());
}

// ============================================================================
// resolve_path - success
// ============================================================================

class ResolvePathTest : public ::testing::Test {
protected:
    Value tree = {
        {"a", {{"b", {{{"c", 7}}}}}},
        {"dotted.key", "literal"},
        {"dotted", {{"key", "nested"}}},
        {"name", "John"},
        {"nothing", nullptr}
    };
};

TEST_F(ResolvePathTest, FlatKey) {
    auto found = resolve_path(tree, "name");
    ASSERT_TRUE(found);
    EXPECT_EQ(*found.value, "John");
    EXPECT_EQ(found.key, "name");
}

TEST_F(ResolvePathTest, NestedKeyPathThroughArray) {
    auto found = resolve_path(tree, Path::key_path("a.b.0.c"));
    ASSERT_TRUE(found);
    EXPECT_EQ(*found.value, 7);
    EXPECT_EQ(found.key, "c");
}

TEST_F(ResolvePathTest, FlatKeyWithDotIsLiteral) {
    auto found = resolve_path(tree, Path::key("dotted.key"));
    ASSERT_TRUE(found);
    EXPECT_EQ(*found.value, "literal");
}

TEST_F(ResolvePathTest, KeyPathWithDotDescends) {
    auto found = resolve_path(tree, Path::key_path("dotted.key"));
    ASSERT_TRUE(found);
    EXPECT_EQ(*found.value, "nested");
}

TEST_F(ResolvePathTest, SingleSegmentKeyPathEqualsFlatKey) {
    auto flat = resolve_path(tree, Path::key("name"));
    auto keyed = resolve_path(tree, Path::key_path("name"));
    ASSERT_TRUE(flat);
    ASSERT_TRUE(keyed);
    EXPECT_EQ(flat.value, keyed.value);
}

TEST_F(ResolvePathTest, NullValueResolves) {
    auto found = resolve_path(tree, "nothing");
    ASSERT_TRUE(found);
    EXPECT_TRUE(found.value->is_null());
}

TEST_F(ResolvePathTest, PointsIntoTree) {
    auto found = resolve_path(tree, Path::key_path("a.b"));
    ASSERT_TRUE(found);
    EXPECT_EQ(found.value, &tree["a"]["b"]);
}

// ============================================================================
// resolve_path - failures
// ============================================================================

TEST_F(ResolvePathTest, EmptyPathFails) {
    for (const Path& path : {Path::key(""), Path::key_path(""), Path::key_path(".")}) {
        auto found = resolve_path(tree, path);
        EXPECT_FALSE(found);
        ASSERT_TRUE(found.error.has_value());
        EXPECT_EQ(found.error->kind(), PathError::Kind::EmptyPath);
    }
}

TEST_F(ResolvePathTest, MissingKey) {
    auto found = resolve_path(tree, Path::key_path("a.missing"));
    EXPECT_FALSE(found);
    ASSERT_TRUE(found.error.has_value());
    EXPECT_EQ(found.error->kind(), PathError::Kind::MissingKey);
    EXPECT_EQ(found.error->key(), "missing");
}

TEST_F(ResolvePathTest, IndexOutOfRange) {
    auto found = resolve_path(tree, Path::key_path("a.b.1.c"));
    EXPECT_FALSE(found);
    ASSERT_TRUE(found.error.has_value());
    EXPECT_EQ(found.error->kind(), PathError::Kind::MissingKey);
    EXPECT_EQ(found.error->key(), "1");
}

TEST_F(ResolvePathTest, NonNumericIndex) {
    auto found = resolve_path(tree, Path::key_path("a.b.first"));
    EXPECT_FALSE(found);
    EXPECT_EQ(found.error->kind(), PathError::Kind::MissingKey);

    found = resolve_path(tree, Path::key_path("a.b.-1"));
    EXPECT_FALSE(found);
    EXPECT_EQ(found.error->kind(), PathError::Kind::MissingKey);
}

TEST_F(ResolvePathTest, DescendIntoScalar) {
    auto found = resolve_path(tree, Path::key_path("name.first"));
    EXPECT_FALSE(found);
    ASSERT_TRUE(found.error.has_value());
    EXPECT_EQ(found.error->kind(), PathError::Kind::InvalidValue);
    EXPECT_EQ(found.error->key(), "first");
    EXPECT_EQ(found.error->value(), "John");
}

TEST_F(ResolvePathTest, ContainsPath) {
    EXPECT_TRUE(contains_path(tree, Path::key_path("a.b.0.c")));
    EXPECT_FALSE(contains_path(tree, Path::key_path("a.b.0.d")));
    EXPECT_FALSE(contains_path(tree, Path::key_path("")));
}
