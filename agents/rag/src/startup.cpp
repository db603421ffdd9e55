#include "../include/startup.hpp"
#include "../include/log.hpp"
#include <algorithm>
#include <system_error>

// Shared with detached workers, which may outlive the orchestrator.
struct StartupOrchestrator::Board {
    std::mutex mtx;
    std::condition_variable cv;
    bool stop{false};

    bool index_done{false};
    std::shared_ptr<const VectorIndex> loaded;
    std::string index_error;

    bool search_done{false};
    std::string search_error;
};

const char* startup_phase_name(StartupPhase phase) {
    switch (phase) {
        case StartupPhase::Idle: return "idle";
        case StartupPhase::InitInProgress: return "init_in_progress";
        case StartupPhase::Settled: return "settled";
    }
    return "unknown";
}

StartupOrchestrator::StartupOrchestrator(VectorIndexManager& index, std::shared_ptr<SearchSubsystem> search,
                                         StartupOptions opts)
    : index_(index), search_(std::move(search)), opts_(opts) {}

StartupOrchestrator::~StartupOrchestrator() {
    std::shared_ptr<Board> board;
    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        board = board_;
    }
    if (board) {
        std::lock_guard<std::mutex> lock(board->mtx);
        board->stop = true;
        board->cv.notify_all();
    }
    if (supervisor_.joinable()) supervisor_.join();
}

bool StartupOrchestrator::start() {
    bool expected = false;
    if (!init_in_progress_.compare_exchange_strong(expected, true)) {
        log_info("startup already in progress, skipping duplicate initialization");
        return false;
    }
    if (supervisor_.joinable()) supervisor_.join();

    auto board = std::make_shared<Board>();
    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        board_ = board;
    }
    started_ = true;
    log_info("startup: loading index and initializing search subsystem in the background");

    std::string path = index_.options().index_path;
    IndexLoader loader = opts_.index_loader;
    if (!loader) loader = &VectorIndexManager::read_index_file;
    try {
        std::thread([board, path, loader]() {
            std::shared_ptr<const VectorIndex> loaded;
            std::string error;
            try {
                loaded = loader(path);
            } catch (const std::exception& e) {
                error = e.what();
            }
            std::lock_guard<std::mutex> lock(board->mtx);
            board->index_done = true;
            board->loaded = std::move(loaded);
            board->index_error = std::move(error);
            board->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(board->mtx);
        board->index_done = true;
        board->index_error = std::string("could not start index loader: ") + e.what();
    }

    auto search = search_;
    try {
        std::thread([board, search]() {
            std::string error;
            try {
                if (!search) throw std::runtime_error("no search subsystem configured");
                search->initialize();
            } catch (const std::exception& e) {
                error = e.what();
                if (error.empty()) error = "unknown error";
            }
            std::lock_guard<std::mutex> lock(board->mtx);
            board->search_done = true;
            board->search_error = std::move(error);
            board->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(board->mtx);
        board->search_done = true;
        board->search_error = std::string("could not start search initializer: ") + e.what();
    }

    try {
        supervisor_ = std::thread(&StartupOrchestrator::supervise, this, board);
    } catch (const std::system_error& e) {
        log_error(std::string("could not start startup supervisor: ") + e.what());
        {
            std::lock_guard<std::mutex> lock(board->mtx);
            board->stop = true;
        }
        {
            std::lock_guard<std::mutex> lock(state_mtx_);
            init_in_progress_ = false;
        }
        settled_cv_.notify_all();
        return false;
    }
    return true;
}

void StartupOrchestrator::settle_index(std::shared_ptr<const VectorIndex> loaded, const std::string& error) {
    if (!error.empty()) {
        log_warn("no usable persisted index, starting empty: " + error);
    } else if (!loaded) {
        log_info("persisted index holds no vectors, starting empty");
    } else {
        size_t n = loaded->size();
        if (index_.adopt_loaded(std::move(loaded))) {
            log_info("background task: loaded index with " + std::to_string(n) + " vectors");
        }
    }
    index_ready_ = true;
}

void StartupOrchestrator::settle_search(const std::string& error) {
    if (!error.empty()) {
        log_error("search subsystem initialization failed: " + error);
        return;
    }
    search_ready_ = true;
    log_info("background task: search subsystem initialized");
}

void StartupOrchestrator::supervise(std::shared_ptr<Board> board) {
    auto t0 = std::chrono::steady_clock::now();
    auto index_deadline = t0 + opts_.index_load_timeout;
    auto search_deadline = t0 + opts_.search_init_timeout;
    bool index_settled = false, search_settled = false;

    std::unique_lock<std::mutex> lock(board->mtx);
    while (!(index_settled && search_settled) && !board->stop) {
        auto now = std::chrono::steady_clock::now();
        if (!index_settled) {
            if (board->index_done) {
                index_settled = true;
                auto loaded = std::move(board->loaded);
                auto error = board->index_error;
                lock.unlock();
                settle_index(std::move(loaded), error);
                lock.lock();
                continue;
            }
            if (now >= index_deadline) {
                index_settled = true;
                log_warn("index loading timed out after " + std::to_string(opts_.index_load_timeout.count()) +
                         " ms; abandoning it, index stays empty");
                continue;
            }
        }
        if (!search_settled) {
            if (board->search_done) {
                search_settled = true;
                auto error = board->search_error;
                lock.unlock();
                settle_search(error);
                lock.lock();
                continue;
            }
            if (now >= search_deadline) {
                search_settled = true;
                log_warn("search subsystem initialization timed out after " +
                         std::to_string(opts_.search_init_timeout.count()) + " ms; it will be unavailable");
                continue;
            }
        }
        auto next = index_settled ? search_deadline
                  : search_settled ? index_deadline
                  : std::min(index_deadline, search_deadline);
        board->cv.wait_until(lock, next);
    }
    bool interrupted = board->stop && !(index_settled && search_settled);
    lock.unlock();

    if (interrupted) log_info("startup interrupted by shutdown");
    log_info(std::string("startup settled: index_ready=") + (index_ready_ ? "true" : "false") +
             " search_subsystem_ready=" + (search_ready_ ? "true" : "false"));
    {
        std::lock_guard<std::mutex> state_lock(state_mtx_);
        init_in_progress_ = false;
    }
    settled_cv_.notify_all();
}

StartupState StartupOrchestrator::state() const {
    StartupState s;
    s.init_in_progress = init_in_progress_;
    s.index_ready = index_ready_;
    s.search_subsystem_ready = search_ready_;
    s.phase = s.init_in_progress ? StartupPhase::InitInProgress
            : started_ ? StartupPhase::Settled
            : StartupPhase::Idle;
    return s;
}

bool StartupOrchestrator::wait_settled(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mtx_);
    return settled_cv_.wait_for(lock, timeout, [this]() { return !init_in_progress_.load(); });
}
