#include "worker_pool.hpp"
#include "log.hpp"

#include <exception>
#include <utility>

// -----------------------------------------------------------------------
// JobFeed
// -----------------------------------------------------------------------
JobFeed::JobFeed(uint32_t count, int w, int h, uint32_t win, CancelToken& tok)
    : token(tok), total(count), width(w), height(h), window(win)
{
    waker_id = token.add_waker([this] {
        { std::lock_guard<std::mutex> lock(mtx); }
        cv_admit.notify_all();
    });
}

JobFeed::~JobFeed()
{
    token.remove_waker(waker_id);
}

bool JobFeed::acquire(Job& out)
{
    std::unique_lock<std::mutex> lock(mtx);
    cv_admit.wait(lock, [this] {
        return token.cancelled() || cursor >= total
            || window == 0 || cursor - floor < window;
    });
    if (token.cancelled() || cursor >= total) return false;

    out.index  = cursor++;
    out.width  = width;
    out.height = height;
    return true;
}

void JobFeed::advance_floor(uint32_t next_expected)
{
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (next_expected <= floor) return;
        floor = next_expected;
    }
    cv_admit.notify_all();
}

uint32_t JobFeed::issued() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return cursor;
}

// -----------------------------------------------------------------------
// WorkerPool
// -----------------------------------------------------------------------
WorkerPool::WorkerPool(int n, size_t result_capacity, CancelToken& tok)
    : n_workers(n < 1 ? 1 : n), token(tok), completions(result_capacity, &tok)
{
}

WorkerPool::~WorkerPool()
{
    join();
}

BoundedChannel<Result>& WorkerPool::start(JobFeed& f, IImageRenderer& r,
                                          FatalHandler fatal, IdleHandler idle)
{
    feed     = &f;
    renderer = &r;
    on_fatal = std::move(fatal);
    on_idle  = std::move(idle);

    {
        std::lock_guard<std::mutex> lock(mtx);
        live = n_workers;
    }
    workers.reserve(n_workers);
    for (int i = 0; i < n_workers; ++i)
        workers.emplace_back([this, i] { worker_loop(i); });

    LOG_INFO("worker pool started with %d workers, completion capacity %zu",
             n_workers, completions.capacity());
    return completions;
}

int WorkerPool::live_workers() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return live;
}

bool WorkerPool::wait_idle_for(std::chrono::milliseconds grace)
{
    std::unique_lock<std::mutex> lock(mtx);
    return cv_idle.wait_for(lock, grace, [this] { return live == 0; });
}

void WorkerPool::join()
{
    for (auto& t : workers)
        if (t.joinable()) t.join();
    workers.clear();
}

void WorkerPool::worker_exit()
{
    bool last = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        last = (--live == 0);
    }
    if (!last) return;

    completions.close();
    if (on_idle) on_idle();
    {
        std::lock_guard<std::mutex> lock(mtx);
        cv_idle.notify_all();
    }
}

// -----------------------------------------------------------------------
// Worker loop: pull, render, emit; every wait watches the token
// -----------------------------------------------------------------------
void WorkerPool::worker_loop(int id)
{
    set_thread_name("worker-" + std::to_string(id));
    LOG_DEBUG("worker %d started", id);

    Job job;
    while (feed->acquire(job)) {
        if (token.cancelled()) {
            ++n_discarded;
            break;
        }

        Result res;
        res.index = job.index;

        std::string fatal;
        try {
            std::string err = renderer->render(job, res.pixels, res.caption);
            const size_t expected = PixelBuffer::bytes_for(job.width, job.height);
            if (err.empty() && (res.pixels.bytes.size() != expected
                                || res.pixels.width != job.width
                                || res.pixels.height != job.height)) {
                err = "renderer returned " + std::to_string(res.pixels.bytes.size())
                    + " bytes, expected " + std::to_string(expected);
            }
            if (!err.empty()) {
                LOG_WARN("render of image %u failed: %s", job.index, err.c_str());
                res.error = std::move(err);
                res.pixels = PixelBuffer{};
                res.pixels.width  = job.width;
                res.pixels.height = job.height;
                res.caption.clear();
                ++n_failed;
            } else {
                ++n_rendered;
            }
        } catch (const std::exception& e) {
            fatal = "worker " + std::to_string(id) + " failed on image "
                  + std::to_string(job.index) + ": " + e.what();
        } catch (...) {
            fatal = "worker " + std::to_string(id) + " failed on image "
                  + std::to_string(job.index) + ": unknown exception";
        }

        if (!fatal.empty()) {
            LOG_ERROR("%s", fatal.c_str());
            ++n_discarded;
            ++n_fatal;
            if (on_fatal) on_fatal(fatal);
            break;
        }

        LOG_TRACE("worker %d emitting image %u", id, job.index);
        if (!completions.push(std::move(res))) {
            ++n_discarded;
            break;
        }
    }

    LOG_DEBUG("worker %d stopped", id);
    worker_exit();
}
