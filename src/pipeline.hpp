#pragma once

#include "cancel_token.hpp"
#include "channel.hpp"
#include "config.hpp"
#include "renderer.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

enum class RunStatus {
    Idle,
    Running,
    Completed,   // every image delivered
    Cancelled,   // stopped by cancel() before the end
    Failed,      // worker fatal or protocol violation; see error()
};

const char* run_status_name(RunStatus s);

// Snapshot of the run, readable from any thread.
struct PipelineState {
    RunStatus status        = RunStatus::Idle;
    bool      cancelled     = false;
    uint32_t  total         = 0;
    uint32_t  next_expected = 0;   // next index the consumer will see
    uint32_t  issued        = 0;   // jobs handed to workers
    uint64_t  rendered      = 0;
    uint64_t  failed        = 0;   // renders that produced an error result
    uint64_t  delivered     = 0;
    uint64_t  discarded     = 0;   // issued but dropped by cancellation
    size_t    peak_pending  = 0;   // high-water mark of the reorder map
};

// -----------------------------------------------------------------------
// Pipeline: owns jobs, workers, reordering and shutdown
//
// Threads: N workers, one ordering unit and one supervisor. Workers push
// into a bounded completion channel; the ordering unit restores index order
// into a one-slot delivery channel read by next(). A fatal condition fails
// and cancels the run on the thread that hits it, then goes to the
// supervisor, which joins everything once all units have stopped.
// -----------------------------------------------------------------------
class Pipeline {
public:
    Pipeline(IImageRenderer& renderer, const PipelineConfig& cfg);

    // Cancels and joins every thread, however long that takes.
    ~Pipeline();

    Pipeline(const Pipeline&)            = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Starts generating images 0..count-1 and returns at once. Returns empty
    // string on success, or an error message. One run per pipeline.
    std::string run(uint32_t count, int width, int height);

    // Next result in index order; blocks until it is ready. False once the
    // sequence has ended: all delivered, cancelled, or failed.
    bool next(Result& out);

    // Idempotent. Stops new renders and wakes every blocked thread; renders
    // already in progress finish and are dropped.
    void cancel();

    // cancel(), then waits up to `grace` for all threads to exit. False on
    // timeout; threads are then still running and get joined by the
    // destructor.
    bool shutdown(std::chrono::milliseconds grace);

    RunStatus     status() const;
    std::string   error() const;
    PipelineState state() const;

    int worker_count() const { return n_workers; }
    int live_workers() const;

private:
    void ordering_loop();
    void supervisor_loop();
    void fail(const std::string& msg);
    void report_fault(const std::string& msg);
    void unit_exited();
    void signal_cancel();

    IImageRenderer& renderer;
    PipelineConfig  cfg;
    CancelToken     token;

    int      n_workers = 0;
    uint32_t total     = 0;
    bool     started   = false;

    std::unique_ptr<BoundedChannel<std::string>> faults;
    std::unique_ptr<JobFeed>                     feed;
    std::unique_ptr<WorkerPool>                  pool;
    std::unique_ptr<BoundedChannel<Result>>      ordered;

    std::thread ordering_thread;
    std::thread supervisor_thread;

    mutable std::mutex      state_mtx;
    std::condition_variable cv_finished;
    RunStatus               run_status = RunStatus::Idle;
    std::string             run_error;
    bool                    finished   = false;

    std::atomic<int>      live_units{0};
    std::atomic<uint64_t> n_delivered{0};
    std::atomic<uint64_t> n_discarded{0};
    std::atomic<size_t>   peak_pending{0};
};
