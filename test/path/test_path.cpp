#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "src/path/path.hpp"
#include "src/path/pattern_path.hpp"

using namespace path;

TEST(PathTest, ParsesAPath) {
    auto p = StringPath::parse("a/b/c");
    EXPECT_EQ(p.size(), 3u);
}

TEST(PathTest, HeadAndTail) {
    auto p = StringPath::parse("a/b/c");
    EXPECT_EQ(p.head(), "a");
    EXPECT_EQ(p.tail().head(), "b");
    EXPECT_EQ(p.last(), "c");
    EXPECT_EQ(p.parent().last(), "b");
}

TEST(PathTest, EmptyStringIsEmptyPath) {
    auto p = StringPath::parse("");
    EXPECT_TRUE(p.empty());
    EXPECT_EQ(p.to_string(), "");
}

TEST(PathTest, ComparesPaths) {
    auto path1 = StringPath::parse("a/b/c");
    auto path2 = StringPath::parse("a/b/c");
    auto path3 = StringPath::parse("a");
    auto path4 = StringPath::parse("");
    EXPECT_TRUE(path1.equals(path2));
    EXPECT_FALSE(path1.equals(path3));
    EXPECT_FALSE(path1.equals(path4));
    EXPECT_EQ(path1, path2);
    EXPECT_EQ(path4, StringPath());
}

TEST(PathTest, EscapedDelimiterStaysInElement) {
    auto p = StringPath::parse(R"(a\/b/c)");
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p.head(), "a/b");
    EXPECT_EQ(p.to_string(), R"(a\/b/c)");
}

TEST(PathTest, DoubledEscapeIsLiteralEscape) {
    auto p = StringPath::parse(R"(a\\/b/c)");
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p.head(), "a\\");
    EXPECT_EQ(p.to_string(), R"(a\\/b/c)");
}

TEST(PathTest, EmptySegmentsAreAbsorbed) {
    EXPECT_EQ(StringPath::parse("/a//b/"), StringPath::of("a", "b"));
}

TEST(PathTest, RoundTripsRenderedValues) {
    auto p = StringPath::of("a/b", "c\\", "", "d;e");
    auto nonempty = StringPath::of("a/b", "c\\", "d;e", "\\/");
    EXPECT_EQ(StringPath::parse(nonempty.to_string()), nonempty);
    EXPECT_EQ(StringPath::parse(nonempty.to_string('!'), '!'), nonempty);
    EXPECT_EQ(p.to_string(), R"(a\/b/c\\//d;e)");
}

TEST(PathTest, RoundTripsParsedText) {
    for (const char* text : {"", "a", "a/b/c", R"(a\/b/c)", R"(a\\/b)", R"(\\\/)"}) {
        EXPECT_EQ(StringPath::parse(text).to_string(), text) << text;
    }
}

TEST(PathTest, HeadOfEmptyPathThrows) {
    StringPath empty;
    EXPECT_THROW(empty.head(), std::out_of_range);
    EXPECT_THROW(empty.last(), std::out_of_range);
}

TEST(PathTest, DerivationsAreTotal) {
    StringPath empty;
    EXPECT_TRUE(empty.tail().empty());
    EXPECT_TRUE(empty.parent().empty());
    EXPECT_TRUE(StringPath::of("a").consume(5).empty());
    EXPECT_EQ(StringPath::of("a", "b").consume(0), StringPath::of("a", "b"));
}

TEST(PathTest, NegativeConsumeCountsFromEnd) {
    auto p = StringPath::of("a", "b", "c");
    EXPECT_EQ(p.consume(-1), StringPath::of("c"));
    EXPECT_EQ(p.consume(-2), StringPath::of("b", "c"));
    EXPECT_EQ(p.consume(-10), p);
    EXPECT_TRUE(StringPath().consume(-1).empty());
}

TEST(PathTest, DerivationsDoNotMutateReceiver) {
    auto p = StringPath::of("a", "b");
    auto q = p.add("c").prepend("z");
    EXPECT_EQ(p, StringPath::of("a", "b"));
    EXPECT_EQ(q, StringPath::of("z", "a", "b", "c"));
    EXPECT_EQ(p.add_all(StringPath::of("x", "y")), StringPath::of("a", "b", "x", "y"));
    EXPECT_EQ(p.add("c", "d").size(), 4u);
}

TEST(PathTest, SliceClampsLikeArraySlice) {
    auto p = StringPath::of("a", "b", "c", "d");
    EXPECT_EQ(p.slice(1, 3), StringPath::of("b", "c"));
    EXPECT_EQ(p.slice(2, 100), StringPath::of("c", "d"));
    EXPECT_EQ(p.slice(-2, 4), StringPath::of("c", "d"));
    EXPECT_EQ(p.slice(0, -1), StringPath::of("a", "b", "c"));
    EXPECT_TRUE(p.slice(3, 1).empty());
    EXPECT_TRUE(p.slice(10, 20).empty());
    EXPECT_EQ(p.slice(-100, 1), StringPath::of("a"));
}

TEST(PathTest, StartsWithAndEndsWith) {
    auto p = StringPath::parse("a/b/c");
    EXPECT_TRUE(p.starts_with(StringPath::parse("a/b")));
    EXPECT_FALSE(p.starts_with(StringPath::parse("b")));
    EXPECT_TRUE(p.ends_with(StringPath::parse("b/c")));
    EXPECT_FALSE(p.ends_with(StringPath::parse("a/b")));
    EXPECT_FALSE(p.starts_with(StringPath::parse("a/b/c/d")));
    EXPECT_TRUE(p.starts_with(StringPath()));
    EXPECT_TRUE(p.ends_with(StringPath()));
    EXPECT_TRUE(StringPath().starts_with(StringPath()));
    EXPECT_TRUE(p.starts_with(p));
}

TEST(PathTest, FindReturnsFirstMatch) {
    auto p = StringPath::of("apple", "banana", "avocado");
    auto starts_with_a = [](const std::string& s) { return !s.empty() && s[0] == 'a'; };
    auto found = p.find(starts_with_a);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "apple");
    EXPECT_EQ(p.find_index([](const std::string& s) { return s == "avocado"; }), 2);
    EXPECT_FALSE(p.find([](const std::string& s) { return s.empty(); }).has_value());
    EXPECT_EQ(p.find_index([](const std::string& s) { return s.empty(); }), -1);
}

TEST(PathTest, GenericElementTypes) {
    auto p = Path<int>::of(1, 2, 3);
    EXPECT_EQ(p.tail().head(), 2);
    EXPECT_EQ(p.to_string(), "1/2/3");
    EXPECT_TRUE(p.ends_with(Path<int>::of(3)));
}

TEST(PathTest, DerivationsKeepConcreteType) {
    auto p = PatternPath::parse("a/b*");
    static_assert(std::is_same_v<decltype(p.tail()), PatternPath>);
    static_assert(std::is_same_v<decltype(p.parent()), PatternPath>);
    static_assert(std::is_same_v<decltype(p.slice(0, 1)), PatternPath>);
    static_assert(std::is_same_v<decltype(StringPath().add("x")), StringPath>);
    EXPECT_EQ(p.tail().size(), 1u);
}
