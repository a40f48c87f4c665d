#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "src/span/source_manager.hpp"
#include "src/utils/debug_context.hpp"

TEST(SourceManagerTest, LineAndColumn) {
    span::SourceManager sources;
    auto id = sources.add_source("<input>", "ab\ncd");
    auto loc = sources.to_line_col(id, 4);
    EXPECT_EQ(loc.line, 2u);
    EXPECT_EQ(loc.column, 2u);
    EXPECT_EQ(sources.line_view(id, 1), "ab");
    EXPECT_EQ(sources.line_view(id, 2), "cd");
}

TEST(SourceManagerTest, FormatsCaretUnderSpan) {
    span::SourceManager sources;
    sources.add_source("<other>", "unused");
    auto id = sources.add_source("<input>", "a;k=1=2");
    EXPECT_EQ(sources.format_span({id, 5, 6}), "<input>:1:6\n 1 | a;k=1=2\n   |      ^");
    EXPECT_EQ(sources.format_span(span::Span::invalid()), "<unknown span>");
}

TEST(SourceManagerTest, UnknownSourceThrows) {
    span::SourceManager sources;
    EXPECT_THROW(sources.get_source(3), std::out_of_range);
}

TEST(DebugContextTest, PrefixesInnermostInput) {
    EXPECT_EQ(debug::format_with_context("boom"), "boom");
    {
        auto outer = debug::push("matrix path", "a/b");
        auto inner = debug::push("pattern", "b{");
        EXPECT_EQ(debug::format_with_context("boom"), "In matrix path -> pattern 'b{': boom");
    }
    EXPECT_EQ(debug::depth(), 0u);
}

TEST(DebugContextTest, ScopeUnwindsOnException) {
    try {
        auto scope = debug::push("pattern", "{a");
        EXPECT_EQ(debug::depth(), 1u);
        throw std::runtime_error(debug::format_with_context("unterminated '{'"));
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "In pattern '{a': unterminated '{'");
    }
    EXPECT_EQ(debug::depth(), 0u);
}
