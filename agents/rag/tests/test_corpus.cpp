#include "../include/corpus.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

static DocumentRecord make_doc(const std::string& id, std::vector<std::string> texts) {
    DocumentRecord d;
    d.document_id = id;
    int i = 0;
    for (auto& t : texts) d.chunks.push_back(std::make_shared<Chunk>(t, ChunkMeta{id, "body", i++}));
    return d;
}

TEST(Chunk, EmbeddingIsComputedOnce) {
    FakeEmbedder emb;
    Chunk c("some text", ChunkMeta{"d", "body", 0});
    EXPECT_FALSE(c.has_embedding());
    EXPECT_EQ(c.cached_embedding(), nullptr);
    auto first = c.embedding(emb);
    c.embedding(emb);
    EXPECT_EQ(emb.calls.load(), 1);
    EXPECT_TRUE(c.has_embedding());
    EXPECT_EQ(*c.cached_embedding(), first);
}

TEST(Chunk, AdoptDoesNotOverwrite) {
    Chunk c("x", ChunkMeta{"d", "body", 0}, {1.0f, 2.0f});
    c.adopt_embedding({9.0f});
    EXPECT_EQ(c.cached_embedding()->size(), 2u);
    EXPECT_EQ(c.fingerprint(), sha1_hex("x"));
}

TEST(CorpusStore, AllChunksFollowInsertionOrder) {
    CorpusStore store;
    store.add(make_doc("b", {"b0", "b1"}));
    store.add(make_doc("a", {"a0"}));
    auto chunks = store.all_chunks();
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0]->content(), "b0");
    EXPECT_EQ(chunks[1]->content(), "b1");
    EXPECT_EQ(chunks[2]->content(), "a0");
    EXPECT_EQ(store.ids(), (std::vector<std::string>{"b", "a"}));
}

TEST(CorpusStore, ReplaceKeepsSlotAndLastWriteWins) {
    CorpusStore store;
    store.add(make_doc("a", {"old"}));
    store.add(make_doc("b", {"b0"}));
    store.add(make_doc("a", {"new0", "new1"}));
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.ids(), (std::vector<std::string>{"a", "b"}));
    auto chunks = store.all_chunks();
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0]->content(), "new0");
}

TEST(CorpusStore, GetThrowsNotFound) {
    CorpusStore store;
    EXPECT_EQ(store.find("missing"), nullptr);
    EXPECT_FALSE(store.contains("missing"));
    try {
        store.get("missing");
        FAIL() << "expected NotFound";
    } catch (const RagError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST(CorpusStore, RemoveDropsDocument) {
    CorpusStore store;
    store.add(make_doc("a", {"a0"}));
    EXPECT_TRUE(store.remove("a"));
    EXPECT_FALSE(store.remove("a"));
    EXPECT_TRUE(store.all_chunks().empty());
}

TEST(CorpusStore, SetTopicsRequiresCurrentRevision) {
    CorpusStore store;
    auto r1 = store.add(make_doc("a", {"a0"}));
    auto r2 = store.add(make_doc("a", {"a1"}));
    EXPECT_NE(r1, r2);
    EXPECT_FALSE(store.set_topics("a", r1, {"stale"}));
    EXPECT_TRUE(store.get("a")->topics.empty());
    EXPECT_TRUE(store.set_topics("a", r2, {"fresh"}));
    EXPECT_EQ(store.get("a")->topics, (std::set<std::string>{"fresh"}));
    EXPECT_FALSE(store.set_topics("missing", r2, {"x"}));
}

TEST(CorpusStore, SnapshotsSurviveLaterWrites) {
    CorpusStore store;
    auto rev = store.add(make_doc("a", {"a0"}));
    auto before = store.get("a");
    store.set_topics("a", rev, {"t"});
    EXPECT_TRUE(before->topics.empty());
    EXPECT_EQ(store.get("a")->topics.size(), 1u);
}
