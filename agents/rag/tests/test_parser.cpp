#include "../include/parser.hpp"
#include <gtest/gtest.h>

TEST(TextDocumentParser, SplitsOnHeadings) {
    TextDocumentParser parser;
    auto doc = parser.parse_text("Preamble line.\n\n# Methods\n\nWe ran a trial.\n\nRESULTS\nIt worked.\n", "fallback");
    EXPECT_EQ(doc.info.metadata.at("title"), "Methods");
    EXPECT_EQ(doc.info.chunking_method, "paragraph");
    ASSERT_EQ(doc.chunks.size(), 3u);
    EXPECT_EQ(doc.chunks[0].section_name, "body");
    EXPECT_EQ(doc.chunks[1].section_name, "Methods");
    EXPECT_EQ(doc.chunks[1].content, "We ran a trial.");
    EXPECT_EQ(doc.chunks[2].section_name, "RESULTS");
    ASSERT_NE(find_section(doc.info.sections, "RESULTS"), nullptr);
    EXPECT_EQ(*find_section(doc.info.sections, "RESULTS"), "It worked.");
}

TEST(TextDocumentParser, SectionsKeepDocumentOrder) {
    TextDocumentParser parser;
    auto doc = parser.parse_text("# Methods\nM text.\n# Results\nR text.\n# Key findings\nK text.\n# Results\nMore R.\n", "t");
    ASSERT_EQ(doc.info.sections.size(), 3u);
    EXPECT_EQ(doc.info.sections[0].first, "Methods");
    EXPECT_EQ(doc.info.sections[1].first, "Results");
    EXPECT_EQ(doc.info.sections[1].second, "R text.\n\nMore R.");
    EXPECT_EQ(doc.info.sections[2].first, "Key findings");
}

TEST(TextDocumentParser, FallbackTitleWithoutHeadings) {
    TextDocumentParser parser;
    auto doc = parser.parse_text("just prose here\n", "my_paper");
    EXPECT_EQ(doc.info.metadata.at("title"), "my_paper");
    ASSERT_EQ(doc.chunks.size(), 1u);
    EXPECT_NE(find_section(doc.info.sections, "body"), nullptr);
}

TEST(TextDocumentParser, LongSectionIsChunked) {
    TextParserOptions opts;
    opts.max_chars = 50;
    opts.overlap = 10;
    TextDocumentParser parser(opts);
    std::string text;
    for (int i = 0; i < 6; ++i) text += "Paragraph number " + std::to_string(i) + " text.\n\n";
    auto doc = parser.parse_text(text, "t");
    EXPECT_GT(doc.chunks.size(), 1u);
    for (const auto& c : doc.chunks) EXPECT_LE(c.content.size(), 50u);
}

TEST(TextDocumentParser, MissingFileThrows) {
    TextDocumentParser parser;
    EXPECT_THROW(parser.parse("/nonexistent/paper.txt"), std::runtime_error);
}
