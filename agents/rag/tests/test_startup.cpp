#include "../include/startup.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <thread>

using namespace std::chrono_literals;

class StartupTest : public ::testing::Test {
protected:
    IndexManagerOptions opts() {
        IndexManagerOptions o;
        o.index_path = file.str();
        return o;
    }

    void write_index() {
        VectorIndexManager writer(emb, opts());
        ASSERT_TRUE(writer.rebuild({std::make_shared<Chunk>("saved text", ChunkMeta{"d", "body", 0})}).ok);
        writer.save();
    }

    std::shared_ptr<FakeEmbedder> emb = std::make_shared<FakeEmbedder>();
    std::shared_ptr<FakeSearchSubsystem> search = std::make_shared<FakeSearchSubsystem>();
    TempPath file;
};

TEST_F(StartupTest, IdleBeforeStart) {
    VectorIndexManager mgr(emb, opts());
    StartupOrchestrator orch(mgr, search);
    auto s = orch.state();
    EXPECT_EQ(s.phase, StartupPhase::Idle);
    EXPECT_FALSE(s.index_ready);
    EXPECT_FALSE(s.search_subsystem_ready);
    EXPECT_FALSE(s.init_in_progress);
}

TEST_F(StartupTest, LoadsPersistedIndexAndInitializesSearch) {
    write_index();
    VectorIndexManager mgr(emb, opts());
    StartupOrchestrator orch(mgr, search);
    ASSERT_TRUE(orch.start());
    ASSERT_TRUE(orch.wait_settled(5s));
    auto s = orch.state();
    EXPECT_EQ(s.phase, StartupPhase::Settled);
    EXPECT_TRUE(s.index_ready);
    EXPECT_TRUE(s.search_subsystem_ready);
    EXPECT_FALSE(s.init_in_progress);
    EXPECT_TRUE(mgr.ready());
    EXPECT_EQ(mgr.health().vector_count, 1u);
}

TEST_F(StartupTest, MissingIndexFileStillSettlesReady) {
    VectorIndexManager mgr(emb, opts());
    StartupOrchestrator orch(mgr, search);
    ASSERT_TRUE(orch.start());
    ASSERT_TRUE(orch.wait_settled(5s));
    EXPECT_TRUE(orch.state().index_ready);
    EXPECT_FALSE(mgr.ready());
}

TEST_F(StartupTest, SecondStartWhileInProgressIsIgnored) {
    search->delay = 300ms;
    VectorIndexManager mgr(emb, opts());
    StartupOrchestrator orch(mgr, search);
    ASSERT_TRUE(orch.start());
    EXPECT_FALSE(orch.start());
    EXPECT_TRUE(orch.state().init_in_progress);
    EXPECT_EQ(orch.state().phase, StartupPhase::InitInProgress);
    ASSERT_TRUE(orch.wait_settled(5s));
    EXPECT_EQ(search->calls.load(), 1);
}

TEST_F(StartupTest, SlowSearchInitTimesOut) {
    search->delay = 2s;
    VectorIndexManager mgr(emb, opts());
    StartupOptions so;
    so.search_init_timeout = 100ms;
    StartupOrchestrator orch(mgr, search, so);
    auto t0 = std::chrono::steady_clock::now();
    ASSERT_TRUE(orch.start());
    ASSERT_TRUE(orch.wait_settled(1500ms));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1500ms);
    auto s = orch.state();
    EXPECT_TRUE(s.index_ready);
    EXPECT_FALSE(s.search_subsystem_ready);
    EXPECT_FALSE(s.init_in_progress);
}

TEST_F(StartupTest, SlowIndexLoadTimesOutAndLateIndexIsDropped) {
    write_index();
    VectorIndexManager mgr(emb, opts());
    StartupOptions so;
    so.index_load_timeout = 100ms;
    so.index_loader = [](const std::string& path) {
        std::this_thread::sleep_for(400ms);
        return VectorIndexManager::read_index_file(path);
    };
    StartupOrchestrator orch(mgr, search, so);
    auto t0 = std::chrono::steady_clock::now();
    ASSERT_TRUE(orch.start());
    ASSERT_TRUE(orch.wait_settled(1500ms));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 400ms);
    auto s = orch.state();
    EXPECT_EQ(s.phase, StartupPhase::Settled);
    EXPECT_FALSE(s.index_ready);
    EXPECT_TRUE(s.search_subsystem_ready);
    EXPECT_FALSE(s.init_in_progress);

    std::this_thread::sleep_for(600ms);
    EXPECT_FALSE(orch.state().index_ready);
    EXPECT_FALSE(mgr.ready());
}

TEST_F(StartupTest, FailedSearchInitLeavesFlagFalse) {
    search->fail = true;
    VectorIndexManager mgr(emb, opts());
    StartupOrchestrator orch(mgr, search);
    ASSERT_TRUE(orch.start());
    ASSERT_TRUE(orch.wait_settled(5s));
    EXPECT_FALSE(orch.state().search_subsystem_ready);
    EXPECT_TRUE(orch.state().index_ready);
}

TEST_F(StartupTest, CanRestartAfterSettling) {
    VectorIndexManager mgr(emb, opts());
    StartupOrchestrator orch(mgr, search);
    ASSERT_TRUE(orch.start());
    ASSERT_TRUE(orch.wait_settled(5s));
    ASSERT_TRUE(orch.start());
    ASSERT_TRUE(orch.wait_settled(5s));
    EXPECT_EQ(search->calls.load(), 2);
}

TEST_F(StartupTest, RebuildDuringLoadWins) {
    write_index();
    search->delay = 200ms;
    VectorIndexManager mgr(emb, opts());
    ASSERT_TRUE(mgr.rebuild({std::make_shared<Chunk>("a", ChunkMeta{"n", "body", 0}),
                             std::make_shared<Chunk>("b", ChunkMeta{"n", "body", 1})}).ok);
    StartupOrchestrator orch(mgr, search);
    ASSERT_TRUE(orch.start());
    ASSERT_TRUE(orch.wait_settled(5s));
    EXPECT_TRUE(orch.state().index_ready);
    EXPECT_EQ(mgr.health().vector_count, 2u);
}
