#pragma once

#include "cancel_token.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

// Bounded multi-producer / multi-consumer queue.
// push blocks while full, pop blocks while empty; both give up once the
// channel is closed or the attached token is cancelled.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity, CancelToken* cancel = nullptr)
        : cap(capacity > 0 ? capacity : 1), token(cancel)
    {
        if (token)
            waker_id = token->add_waker([this] { wake_all(); });
    }

    ~BoundedChannel()
    {
        if (token) token->remove_waker(waker_id);
    }

    BoundedChannel(const BoundedChannel&)            = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // False if the item was not accepted (closed or cancelled); it is dropped.
    bool push(T item)
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv_not_full.wait(lock, [this] {
            return items.size() < cap || is_closed || is_cancelled();
        });
        if (is_closed || is_cancelled()) return false;
        items.push_back(std::move(item));
        lock.unlock();
        cv_not_empty.notify_one();
        return true;
    }

    // False once closed and drained, or as soon as the token is cancelled.
    bool pop(T& out)
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv_not_empty.wait(lock, [this] {
            return !items.empty() || is_closed || is_cancelled();
        });
        if (is_cancelled() || items.empty()) return false;
        out = std::move(items.front());
        items.pop_front();
        lock.unlock();
        cv_not_full.notify_one();
        return true;
    }

    // Non-blocking; ignores cancellation so leftovers can be flushed.
    bool try_pop(T& out)
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (items.empty()) return false;
        out = std::move(items.front());
        items.pop_front();
        cv_not_full.notify_one();
        return true;
    }

    // Drops everything still queued. Returns how many items were dropped.
    size_t drain()
    {
        std::deque<T> dropped;
        {
            std::lock_guard<std::mutex> lock(mtx);
            dropped.swap(items);
        }
        cv_not_full.notify_all();
        return dropped.size();
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mtx);
            is_closed = true;
        }
        cv_not_full.notify_all();
        cv_not_empty.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return is_closed;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mtx);
        return items.size();
    }

    size_t capacity() const { return cap; }

private:
    bool is_cancelled() const { return token && token->cancelled(); }

    void wake_all()
    {
        // Taking the lock orders the wake after any in-progress predicate check
        { std::lock_guard<std::mutex> lock(mtx); }
        cv_not_full.notify_all();
        cv_not_empty.notify_all();
    }

    std::deque<T>           items;
    mutable std::mutex      mtx;
    std::condition_variable cv_not_full;
    std::condition_variable cv_not_empty;
    size_t                  cap;
    bool                    is_closed = false;
    CancelToken*            token     = nullptr;
    int                     waker_id  = -1;
};
