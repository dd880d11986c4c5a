#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

// One-way stop signal shared by every blocking point of a pipeline.
// Blocking primitives register a waker that kicks their condition variable,
// so a cancel reaches threads that are already parked.
class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&)            = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    // Only the first call flips the token and runs the wakers; it returns true.
    bool cancel()
    {
        if (flag.exchange(true, std::memory_order_acq_rel)) return false;

        std::lock_guard<std::mutex> run_lock(run_mtx);
        std::vector<std::function<void()>> to_run;
        {
            std::lock_guard<std::mutex> lock(mtx);
            for (auto& w : wakers) to_run.push_back(w.second);
        }
        for (auto& w : to_run) w();
        return true;
    }

    bool cancelled() const { return flag.load(std::memory_order_acquire); }

    // Runs `wake` at cancel time, or right away if already cancelled (then
    // the returned id is -1).
    int add_waker(std::function<void()> wake)
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!flag.load(std::memory_order_acquire)) {
                const int id = next_id++;
                wakers.emplace(id, std::move(wake));
                return id;
            }
        }
        wake();
        return -1;
    }

    // Waits out a cancel that is running wakers, so the owner can be destroyed.
    void remove_waker(int id)
    {
        if (id < 0) return;
        std::lock_guard<std::mutex> run_lock(run_mtx);
        std::lock_guard<std::mutex> lock(mtx);
        wakers.erase(id);
    }

private:
    std::atomic<bool>                     flag{false};
    std::mutex                            mtx;
    std::mutex                            run_mtx;
    std::map<int, std::function<void()>>  wakers;
    int                                   next_id = 0;
};
