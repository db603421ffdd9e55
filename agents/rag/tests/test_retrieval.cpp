#include "../include/retrieval.hpp"
#include "../include/errors.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

class RetrievalTest : public ::testing::Test {
protected:
    void SetUp() override {
        opts.index_path = file.str();
        mgr = std::make_unique<VectorIndexManager>(emb, opts);
        engine = std::make_unique<RetrievalEngine>(emb, *mgr, llm);
    }

    void build() {
        std::vector<ChunkPtr> chunks{
            std::make_shared<Chunk>("statins lower cholesterol", ChunkMeta{"p1", "results", 0}),
            std::make_shared<Chunk>("exercise improves mood", ChunkMeta{"p1", "results", 1}),
            std::make_shared<Chunk>("coffee consumption and sleep", ChunkMeta{"p2", "body", 0})};
        ASSERT_TRUE(mgr->rebuild(chunks).ok);
    }

    template <typename F>
    static ErrorCode code_of(F&& f) {
        try {
            f();
        } catch (const RagError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected RagError";
        return ErrorCode::RebuildFailed;
    }

    std::shared_ptr<FakeEmbedder> emb = std::make_shared<FakeEmbedder>();
    std::shared_ptr<FakeLlm> llm = std::make_shared<FakeLlm>();
    TempPath file;
    IndexManagerOptions opts;
    std::unique_ptr<VectorIndexManager> mgr;
    std::unique_ptr<RetrievalEngine> engine;
};

TEST_F(RetrievalTest, BlankQueryIsRejectedBeforeEmbedding) {
    build();
    int before = emb->calls.load();
    EXPECT_EQ(code_of([&] { engine->query("   ", SearchScope::all(), 3); }), ErrorCode::EmptyQuery);
    EXPECT_EQ(emb->calls.load(), before);
}

TEST_F(RetrievalTest, NoIndexMeansNotReady) {
    EXPECT_EQ(code_of([&] { engine->query("statins", SearchScope::all(), 3); }), ErrorCode::IndexNotReady);
    EXPECT_EQ(emb->calls.load(), 0);
}

TEST_F(RetrievalTest, ZeroKIsInvalid) {
    build();
    EXPECT_EQ(code_of([&] { engine->query("statins", SearchScope::all(), 0); }), ErrorCode::InvalidArgument);
}

TEST_F(RetrievalTest, ExactTextRanksFirst) {
    build();
    auto hits = engine->query("exercise improves mood", SearchScope::all(), 2);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].chunk->content(), "exercise improves mood");
    EXPECT_NEAR(hits[0].score, 1.0f, 1e-5);
    EXPECT_GE(hits[0].score, hits[1].score);
}

TEST_F(RetrievalTest, EmbeddingFailurePropagates) {
    build();
    emb->fail = true;
    EXPECT_EQ(code_of([&] { engine->query("statins", SearchScope::all(), 1); }), ErrorCode::EmbeddingServiceError);
}

TEST_F(RetrievalTest, AnswerCitesRetrievedSources) {
    build();
    auto res = engine->query_with_answer("statins lower cholesterol", SearchScope::all(), 2);
    EXPECT_TRUE(res.answered);
    EXPECT_EQ(res.sources.size(), 2u);
    ASSERT_EQ(res.citations.size(), 1u);
    EXPECT_EQ(res.citations[0].index, 1);
    EXPECT_EQ(res.citations[0].document_id, "p1");
    EXPECT_EQ(llm->answer_calls.load(), 1);
}

TEST_F(RetrievalTest, NoSourcesMeansNoModelCall) {
    build();
    auto res = engine->query_with_answer("statins", SearchScope::document("unknown"), 3);
    EXPECT_FALSE(res.answered);
    EXPECT_TRUE(res.sources.empty());
    EXPECT_EQ(res.answer, RetrievalEngine::no_answer_text());
    EXPECT_EQ(llm->answer_calls.load(), 0);
}
