#pragma once
#include "search_subsystem.hpp"
#include "vector_index.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using IndexLoader = std::function<std::shared_ptr<const VectorIndex>(const std::string& path)>;

struct StartupOptions {
    std::chrono::milliseconds index_load_timeout{30000};
    std::chrono::milliseconds search_init_timeout{60000};
    // Empty means VectorIndexManager::read_index_file.
    IndexLoader index_loader;
};

enum class StartupPhase { Idle, InitInProgress, Settled };

const char* startup_phase_name(StartupPhase phase);

struct StartupState {
    StartupPhase phase{StartupPhase::Idle};
    bool index_ready{false};
    bool search_subsystem_ready{false};
    bool init_in_progress{false};
};

// Loads the persisted index and initialises the search subsystem in the
// background, each bounded by its own timeout. A subtask that overruns is
// abandoned: it keeps running detached and its result is discarded.
class StartupOrchestrator {
public:
    StartupOrchestrator(VectorIndexManager& index, std::shared_ptr<SearchSubsystem> search,
                        StartupOptions opts = {});
    ~StartupOrchestrator();

    StartupOrchestrator(const StartupOrchestrator&) = delete;
    StartupOrchestrator& operator=(const StartupOrchestrator&) = delete;

    // Returns immediately. No-op (returns false) while a previous start is still in progress.
    bool start();
    StartupState state() const;
    // Waits until the current initialisation settles. Returns false on timeout.
    bool wait_settled(std::chrono::milliseconds timeout) const;

private:
    struct Board;

    void supervise(std::shared_ptr<Board> board);
    void settle_index(std::shared_ptr<const VectorIndex> loaded, const std::string& error);
    void settle_search(const std::string& error);

    VectorIndexManager& index_;
    std::shared_ptr<SearchSubsystem> search_;
    StartupOptions opts_;

    std::atomic<bool> init_in_progress_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> index_ready_{false};
    std::atomic<bool> search_ready_{false};

    mutable std::mutex state_mtx_;
    mutable std::condition_variable settled_cv_;
    std::shared_ptr<Board> board_;
    std::thread supervisor_;
};
