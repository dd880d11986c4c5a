#include "pipeline.hpp"
#include "log.hpp"
#include "ordering_buffer.hpp"

#include <algorithm>
#include <utility>
#include <vector>

const char* run_status_name(RunStatus s)
{
    switch (s) {
        case RunStatus::Idle:      return "idle";
        case RunStatus::Running:   return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Cancelled: return "cancelled";
        case RunStatus::Failed:    return "failed";
    }
    return "unknown";
}

Pipeline::Pipeline(IImageRenderer& r, const PipelineConfig& c)
    : renderer(r), cfg(c)
{
}

Pipeline::~Pipeline()
{
    cancel();
    if (supervisor_thread.joinable()) supervisor_thread.join();
}

// -----------------------------------------------------------------------
// run: builds the stages and spawns N + 2 threads
// -----------------------------------------------------------------------
std::string Pipeline::run(uint32_t count, int width, int height)
{
    if (started)
        return "pipeline already started";
    if (token.cancelled())
        return "pipeline was cancelled before it started";
    if (count == 0)
        return "image count must be positive";
    if (width <= 0 || height <= 0)
        return "image width and height must be positive";

    started   = true;
    total     = count;
    n_workers = resolve_worker_count(cfg.worker_count);

    const size_t   capacity = static_cast<size_t>(std::max(1, cfg.completion_capacity));
    const uint32_t window   = static_cast<uint32_t>(capacity) + static_cast<uint32_t>(n_workers);

    faults  = std::make_unique<BoundedChannel<std::string>>(n_workers + 2);
    feed    = std::make_unique<JobFeed>(count, width, height, window, token);
    pool    = std::make_unique<WorkerPool>(n_workers, capacity, token);
    ordered = std::make_unique<BoundedChannel<Result>>(1, &token);

    {
        std::lock_guard<std::mutex> lock(state_mtx);
        run_status = RunStatus::Running;
    }
    live_units = 2;  // the worker pool as a whole, plus the ordering unit

    LOG_INFO("pipeline: %u images of %dx%d, %d workers, capacity %zu, window %u",
             count, width, height, n_workers, capacity, window);

    pool->start(*feed, renderer,
                [this](const std::string& msg) { report_fault(msg); },
                [this] { unit_exited(); });
    ordering_thread   = std::thread(&Pipeline::ordering_loop, this);
    supervisor_thread = std::thread(&Pipeline::supervisor_loop, this);
    return {};  // success
}

// -----------------------------------------------------------------------
// Consumer side
// -----------------------------------------------------------------------
bool Pipeline::next(Result& out)
{
    if (!started || token.cancelled()) return false;

    if (!ordered->pop(out)) {
        std::lock_guard<std::mutex> lock(state_mtx);
        if (run_status == RunStatus::Running && !token.cancelled()
                && n_delivered.load() == total) {
            run_status = RunStatus::Completed;
            LOG_INFO("pipeline: all %u images delivered", total);
        }
        return false;
    }

    const uint64_t expected = n_delivered.load();
    if (out.index != expected) {
        ++n_discarded;
        fail("protocol violation: delivered index " + std::to_string(out.index)
             + " while " + std::to_string(expected) + " was expected");
        return false;
    }
    ++n_delivered;
    return true;
}

void Pipeline::signal_cancel()
{
    if (token.cancel() && started)
        LOG_INFO("pipeline: cancellation signalled after %llu of %u images delivered",
                 static_cast<unsigned long long>(n_delivered.load()), total);
}

void Pipeline::cancel()
{
    {
        std::lock_guard<std::mutex> lock(state_mtx);
        if (run_status == RunStatus::Running)
            run_status = RunStatus::Cancelled;
    }
    signal_cancel();
}

void Pipeline::fail(const std::string& msg)
{
    {
        std::lock_guard<std::mutex> lock(state_mtx);
        if (run_status == RunStatus::Failed || run_status == RunStatus::Completed)
            return;
        run_status = RunStatus::Failed;
        run_error  = msg;
    }
    LOG_ERROR("pipeline failed: %s", msg.c_str());
    signal_cancel();
}

// -----------------------------------------------------------------------
// Shutdown: bounded wait for every unit to acknowledge
// -----------------------------------------------------------------------
bool Pipeline::shutdown(std::chrono::milliseconds grace)
{
    cancel();
    if (!started) return true;

    {
        std::unique_lock<std::mutex> lock(state_mtx);
        if (!cv_finished.wait_for(lock, grace, [this] { return finished; })) {
            lock.unlock();
            LOG_WARN("shutdown: %d worker(s) still running after %lld ms",
                     live_workers(), static_cast<long long>(grace.count()));
            return false;
        }
    }
    if (supervisor_thread.joinable()) supervisor_thread.join();

    n_discarded += ordered->drain();

    const PipelineState st = state();
    LOG_INFO("shutdown complete (%s): %u issued, %llu delivered, %llu discarded",
             run_status_name(st.status), st.issued,
             static_cast<unsigned long long>(st.delivered),
             static_cast<unsigned long long>(st.discarded));
    return true;
}

RunStatus Pipeline::status() const
{
    std::lock_guard<std::mutex> lock(state_mtx);
    return run_status;
}

std::string Pipeline::error() const
{
    std::lock_guard<std::mutex> lock(state_mtx);
    return run_error;
}

PipelineState Pipeline::state() const
{
    PipelineState st;
    st.status        = status();
    st.cancelled     = token.cancelled();
    st.total         = total;
    st.delivered     = n_delivered.load();
    st.next_expected = static_cast<uint32_t>(st.delivered);
    st.discarded     = n_discarded.load();
    st.peak_pending  = peak_pending.load();
    if (feed) st.issued = feed->issued();
    if (pool) {
        st.rendered   = pool->rendered();
        st.failed     = pool->failed();
        st.discarded += pool->discarded();
    }
    return st;
}

int Pipeline::live_workers() const
{
    return pool ? pool->live_workers() : 0;
}

// -----------------------------------------------------------------------
// Ordering unit: sole owner of the reorder map
// -----------------------------------------------------------------------
void Pipeline::ordering_loop()
{
    set_thread_name("ordering");

    OrderingBuffer           ob(total);
    std::vector<Result>      ready;
    BoundedChannel<Result>&  completions = pool->results();
    Result                   res;

    while (completions.pop(res)) {
        ready.clear();
        const std::string err = ob.accept(std::move(res), ready);
        if (!err.empty()) {
            ++n_discarded;
            report_fault(err);
            break;
        }
        if (ob.peak_pending() > peak_pending.load())
            peak_pending = ob.peak_pending();

        size_t pushed = 0;
        for (; pushed < ready.size(); ++pushed)
            if (!ordered->push(std::move(ready[pushed]))) break;
        n_discarded += ready.size() - pushed;
        if (pushed < ready.size()) break;

        feed->advance_floor(ob.next_expected());
    }

    // Workers are gone or cancelled; anything still buffered is dropped.
    // Workers emit each issued index exactly once, so this and the accept()
    // rejection above only fire on an internal bug.
    if (!ob.complete() && !token.cancelled() && completions.closed()
            && pool->fatals() == 0) {
        report_fault("protocol violation: result stream ended at index "
                     + std::to_string(ob.next_expected()) + " of "
                     + std::to_string(total));
    }
    n_discarded += ob.discard_pending();
    n_discarded += completions.drain();

    ordered->close();
    LOG_DEBUG("ordering unit stopped at index %u", ob.next_expected());
    unit_exited();
}

// -----------------------------------------------------------------------
// Supervisor: turns fatal reports into a failed run, then joins everyone
// -----------------------------------------------------------------------
// The run is failed here, on the reporting thread, before that thread can
// close any channel downstream; the consumer never sees a finished stream
// with the status still Running.
void Pipeline::report_fault(const std::string& msg)
{
    fail(msg);
    if (!faults->push(msg))
        LOG_ERROR("fault after supervisor stopped: %s", msg.c_str());
}

void Pipeline::unit_exited()
{
    if (live_units.fetch_sub(1) == 1)
        faults->close();
}

void Pipeline::supervisor_loop()
{
    set_thread_name("supervisor");

    std::string msg;
    int         n_faults = 0;
    while (faults->pop(msg)) {
        ++n_faults;
        LOG_DEBUG("supervisor: fault %d recorded: %s", n_faults, msg.c_str());
    }

    if (ordering_thread.joinable()) ordering_thread.join();
    pool->join();

    {
        std::lock_guard<std::mutex> lock(state_mtx);
        finished = true;
    }
    cv_finished.notify_all();
    LOG_DEBUG("supervisor: all units stopped");
}
