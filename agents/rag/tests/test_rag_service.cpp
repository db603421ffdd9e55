#include "../include/rag.hpp"
#include "../include/errors.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <thread>

class RagServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        IndexManagerOptions o;
        o.index_path = file.str();
        service = std::make_unique<RagService>(emb, llm, std::make_shared<TextDocumentParser>(), o);
    }

    static std::vector<RawChunk> raw(std::vector<std::string> texts, const std::string& section = "body") {
        std::vector<RawChunk> out;
        for (auto& t : texts) out.push_back({t, section});
        return out;
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
    std::unique_ptr<RagService> service;
};

TEST_F(RagServiceTest, IngestIndexesAndAttachesTopics) {
    llm->topics_by_marker["oncology"] = {"cancer", "immunotherapy"};
    auto res = service->ingest("p1", raw({"oncology trial results", "", "second passage"}), {});
    EXPECT_EQ(res.document_id, "p1");
    EXPECT_EQ(res.chunk_count, 2u);
    EXPECT_TRUE(res.index_updated);
    EXPECT_TRUE(res.warning.empty());
    EXPECT_EQ(res.topics, (std::set<std::string>{"cancer", "immunotherapy"}));

    auto info = service->document_info("p1");
    EXPECT_EQ(info.total_chunks, 2u);
    EXPECT_EQ(info.topics, res.topics);
    EXPECT_EQ(info.chunking_method, "unknown");

    auto chunks = service->chunks("p1", 0, 10);
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[1]->meta().chunk_index, 1);
    EXPECT_EQ(chunks[1]->content(), "second passage");

    auto hits = service->query("oncology trial results", SearchScope::all(), 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].chunk->meta().document_id, "p1");
}

TEST_F(RagServiceTest, ReingestIsIdempotent) {
    service->ingest("p1", raw({"alpha", "beta"}), {});
    int calls = emb->calls.load();
    service->ingest("p1", raw({"alpha", "beta"}), {});
    EXPECT_EQ(emb->calls.load(), calls);
    EXPECT_EQ(service->list_documents(), (std::vector<std::string>{"p1"}));
    EXPECT_EQ(service->index_health().vector_count, 2u);
}

TEST_F(RagServiceTest, IngestValidation) {
    EXPECT_EQ(code_of([&] { service->ingest(" ", raw({"x"}), {}); }), ErrorCode::InvalidArgument);
    EXPECT_EQ(code_of([&] { service->ingest("p", raw({"", "  "}), {}); }), ErrorCode::InvalidArgument);
    EXPECT_TRUE(service->list_documents().empty());
}

TEST_F(RagServiceTest, EmbeddingOutageStoresDocumentWithWarning) {
    service->ingest("p1", raw({"first"}), {});
    emb->fail = true;
    auto res = service->ingest("p2", raw({"second"}), {});
    EXPECT_FALSE(res.index_updated);
    EXPECT_FALSE(res.warning.empty());
    EXPECT_EQ(service->list_documents().size(), 2u);
    EXPECT_EQ(service->index_health().vector_count, 1u);
}

TEST_F(RagServiceTest, TopicFailureOnlyWarns) {
    llm->fail_topics = true;
    auto res = service->ingest("p1", raw({"text"}), {});
    EXPECT_TRUE(res.index_updated);
    EXPECT_TRUE(res.topics.empty());
    EXPECT_NE(res.warning.find("topic"), std::string::npos);
}

TEST_F(RagServiceTest, RemoveDropsFromIndex) {
    service->ingest("p1", raw({"keep me"}), {});
    service->ingest("p2", raw({"drop me"}), {});
    auto res = service->remove("p2");
    EXPECT_TRUE(res.index_updated);
    EXPECT_EQ(service->index_health().vector_count, 1u);
    EXPECT_TRUE(service->query("drop me", SearchScope::document("p2"), 3).empty());
    EXPECT_EQ(code_of([&] { service->remove("p2"); }), ErrorCode::NotFound);

    service->remove("p1");
    EXPECT_EQ(code_of([&] { service->query("keep me", SearchScope::all(), 1); }), ErrorCode::IndexNotReady);
}

TEST_F(RagServiceTest, ConcurrentIngestsAllLandInIndex) {
    const int n = 6;
    std::vector<std::thread> threads;
    for (int t = 0; t < n; ++t) {
        threads.emplace_back([this, t]() {
            service->ingest("doc" + std::to_string(t), raw({"passage number " + std::to_string(t)}), {});
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(service->list_documents().size(), (size_t)n);
    EXPECT_EQ(service->index_health().vector_count, (size_t)n);
}

TEST_F(RagServiceTest, SummarizeAndExplain) {
    service->ingest("p1", raw({"a long passage about trials"}), {});
    EXPECT_EQ(service->summarize("p1", "patient").rfind("patient: ", 0), 0u);
    llm->fail_summary = true;
    EXPECT_EQ(code_of([&] { service->summarize("p1", "patient"); }), ErrorCode::GenerationServiceError);
    EXPECT_EQ(code_of([&] { service->summarize("nope", "patient"); }), ErrorCode::NotFound);

    auto ex = service->explain_text("p1", "p-value", "", "", "patient");
    EXPECT_EQ(ex.at("explanation"), "explained: p-value");
    EXPECT_EQ(code_of([&] { service->explain_text("p1", " ", "", "", "patient"); }), ErrorCode::EmptyQuery);
    EXPECT_EQ(code_of([&] { service->explain_text("x", "t", "", "", "patient"); }), ErrorCode::NotFound);
}

TEST_F(RagServiceTest, SynthesizePassesResolvedPapers) {
    service->ingest("p1", raw({"one"}), {});
    auto out = service->synthesize({"p1", "missing"}, "comparison");
    EXPECT_EQ(out.at("documents"), nlohmann::json::array({"p1"}));
    EXPECT_EQ(code_of([&] { service->synthesize({"missing"}, "comparison"); }), ErrorCode::NoValidDocuments);
}

TEST_F(RagServiceTest, IngestFileUsesTimestampedId) {
    TempPath txt(".txt");
    {
        std::ofstream out(txt.path());
        out << "# Effects of Sleep\n\nSleep matters.\n\n## Results\n\nPeople slept more.\n";
    }
    auto res = service->ingest_file(txt.path());
    auto suffix = "_" + txt.path().filename().string();
    ASSERT_GT(res.document_id.size(), suffix.size());
    EXPECT_EQ(res.document_id.substr(res.document_id.size() - suffix.size()), suffix);
    EXPECT_EQ(res.document_id[8], '_');
    auto info = service->document_info(res.document_id);
    EXPECT_EQ(info.metadata.at("title"), "Effects of Sleep");
    EXPECT_EQ(info.chunking_method, "paragraph");

    EXPECT_EQ(code_of([&] { service->ingest_file("/nonexistent/file.txt"); }), ErrorCode::InvalidArgument);
}

TEST_F(RagServiceTest, SaveIndexPersists) {
    EXPECT_EQ(code_of([&] { service->save_index(); }), ErrorCode::IndexNotReady);
    service->ingest("p1", raw({"persist"}), {});
    service->save_index();
    EXPECT_TRUE(service->index_health().index_file_exists);
    EXPECT_NE(VectorIndexManager::read_index_file(file.str()), nullptr);
}
