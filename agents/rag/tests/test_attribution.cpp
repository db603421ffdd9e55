#include "../include/attribution.hpp"
#include "../include/errors.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <cmath>

// Unit vector whose cosine with (1, 0) is c.
static std::vector<float> at_cosine(float c) {
    return {c, std::sqrt(1.0f - c * c)};
}

class AttributionTest : public ::testing::Test {
protected:
    void add_doc(const std::string& id, const std::vector<float>& cosines) {
        DocumentRecord d;
        d.document_id = id;
        for (size_t i = 0; i < cosines.size(); ++i) {
            std::string text = id + " chunk " + std::to_string(i);
            emb->set(text, at_cosine(cosines[i]));
            d.chunks.push_back(std::make_shared<Chunk>(text, ChunkMeta{id, "body", (int)i}));
        }
        corpus.add(std::move(d));
    }

    std::shared_ptr<FakeEmbedder> emb = std::make_shared<FakeEmbedder>();
    CorpusStore corpus;
    AttributionScorer scorer{emb, corpus};
};

TEST_F(AttributionTest, TopThreeAndMeanConfidence) {
    emb->set("the sentence", {1.0f, 0.0f});
    add_doc("p", {0.9f, 0.4f, 0.8f, 0.1f});
    auto res = scorer.attribute("p", "the sentence");
    ASSERT_EQ(res.sources.size(), 3u);
    EXPECT_EQ(res.sources[0].chunk->meta().chunk_index, 0);
    EXPECT_EQ(res.sources[1].chunk->meta().chunk_index, 2);
    EXPECT_EQ(res.sources[2].chunk->meta().chunk_index, 1);
    EXPECT_NEAR(res.sources[0].score, 0.9f, 1e-4);
    EXPECT_NEAR(res.confidence, 0.7f, 1e-4);
}

TEST_F(AttributionTest, FewerChunksThanTopK) {
    emb->set("s", {1.0f, 0.0f});
    add_doc("p", {0.5f});
    auto res = scorer.attribute("p", "s");
    ASSERT_EQ(res.sources.size(), 1u);
    EXPECT_NEAR(res.confidence, 0.5f, 1e-4);
}

TEST_F(AttributionTest, OnlyScoresTheRequestedDocument) {
    emb->set("s", {1.0f, 0.0f});
    add_doc("p", {0.2f, 0.3f});
    add_doc("q", {1.0f});
    auto res = scorer.attribute("p", "s");
    for (const auto& sc : res.sources) EXPECT_EQ(sc.chunk->meta().document_id, "p");
    EXPECT_NEAR(res.confidence, 0.25f, 1e-4);
}

TEST_F(AttributionTest, DocumentWithoutChunksHasZeroConfidence) {
    DocumentRecord d;
    d.document_id = "empty";
    corpus.add(std::move(d));
    auto res = scorer.attribute("empty", "anything");
    EXPECT_TRUE(res.sources.empty());
    EXPECT_EQ(res.confidence, 0.0f);
    EXPECT_EQ(emb->calls.load(), 0);
}

TEST_F(AttributionTest, ErrorsForUnknownDocumentAndBlankSentence) {
    add_doc("p", {0.5f});
    try {
        scorer.attribute("nope", "s");
        FAIL();
    } catch (const RagError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
    try {
        scorer.attribute("p", "  ");
        FAIL();
    } catch (const RagError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EmptyQuery);
    }
}
