#pragma once

#include "cancel_token.hpp"
#include "channel.hpp"
#include "renderer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// -----------------------------------------------------------------------
// JobFeed: the single pull point for jobs 0..count-1
//
// Jobs go out in ascending index order. With a non-zero window, index i is
// only handed out once i < floor + window, where the floor is the consumer's
// next expected index; this caps how far workers can run ahead.
// -----------------------------------------------------------------------
class JobFeed {
public:
    JobFeed(uint32_t count, int width, int height, uint32_t window,
            CancelToken& token);
    ~JobFeed();

    JobFeed(const JobFeed&)            = delete;
    JobFeed& operator=(const JobFeed&) = delete;

    // Blocks until the next job is admitted. False when all jobs are out or
    // the token is cancelled.
    bool acquire(Job& out);

    // Raises the floor; never lowers it.
    void advance_floor(uint32_t next_expected);

    uint32_t count() const { return total; }
    uint32_t issued() const;

private:
    mutable std::mutex      mtx;
    std::condition_variable cv_admit;
    CancelToken&            token;
    int                     waker_id = -1;
    uint32_t                total;
    int                     width;
    int                     height;
    uint32_t                window;
    uint32_t                cursor = 0;
    uint32_t                floor  = 0;
};

// -----------------------------------------------------------------------
// WorkerPool: N render threads sharing one JobFeed
// -----------------------------------------------------------------------
class WorkerPool {
public:
    using FatalHandler = std::function<void(const std::string&)>;
    using IdleHandler  = std::function<void()>;

    // n_workers < 1 is treated as 1.
    WorkerPool(int n_workers, size_t result_capacity, CancelToken& token);

    // Joins every worker. The owner cancels the token first unless the feed
    // is known to be exhausted.
    ~WorkerPool();

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Spawns the workers and returns the completion channel immediately.
    // on_fatal runs on a worker that cannot continue; on_idle runs once, on
    // the last worker to exit, after the channel is closed.
    BoundedChannel<Result>& start(JobFeed& feed, IImageRenderer& renderer,
                                  FatalHandler on_fatal, IdleHandler on_idle);

    BoundedChannel<Result>& results() { return completions; }

    int worker_count() const { return n_workers; }
    int live_workers() const;

    // Waits until every worker has exited, at most `grace`.
    bool wait_idle_for(std::chrono::milliseconds grace);
    void join();

    uint64_t rendered()  const { return n_rendered.load(); }
    uint64_t failed()    const { return n_failed.load(); }
    uint64_t discarded() const { return n_discarded.load(); }
    uint64_t fatals()    const { return n_fatal.load(); }

private:
    void worker_loop(int id);
    void worker_exit();

    int                     n_workers;
    CancelToken&            token;
    BoundedChannel<Result>  completions;
    JobFeed*                feed     = nullptr;
    IImageRenderer*         renderer = nullptr;
    FatalHandler            on_fatal;
    IdleHandler             on_idle;

    std::vector<std::thread> workers;
    mutable std::mutex       mtx;
    std::condition_variable  cv_idle;
    int                      live = 0;

    std::atomic<uint64_t> n_rendered{0};
    std::atomic<uint64_t> n_failed{0};
    std::atomic<uint64_t> n_discarded{0};
    std::atomic<uint64_t> n_fatal{0};
};
