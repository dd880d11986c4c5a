#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "cancel_token.hpp"
#include "channel.hpp"

using namespace std::chrono;

int test_count = 0;
int pass_count = 0;

void check(const char* name, bool passed) {
    test_count++;
    if (passed) {
        std::cout << "✓ " << name << " PASSED\n";
        pass_count++;
    } else {
        std::cout << "✗ " << name << " FAILED\n";
    }
}

void test_fifo_with_backpressure() {
    BoundedChannel<int> ch(2);
    std::thread producer([&] {
        for (int i = 0; i < 100; ++i) ch.push(i);
        ch.close();
    });

    std::vector<int> got;
    size_t max_size = 0;
    int v = 0;
    while (ch.pop(v)) {
        got.push_back(v);
        max_size = std::max(max_size, ch.size());
    }
    producer.join();

    bool ordered = got.size() == 100;
    for (size_t i = 0; ordered && i < got.size(); ++i) ordered = got[i] == static_cast<int>(i);
    check("items arrive in push order", ordered);
    check("never holds more than capacity", max_size <= 2);
}

void test_close_semantics() {
    BoundedChannel<int> ch(4);
    ch.push(1);
    ch.push(2);
    ch.close();
    int v = 0;
    check("push after close rejected", !ch.push(3));
    check("pop drains after close", ch.pop(v) && v == 1 && ch.pop(v) && v == 2);
    check("pop ends once drained", !ch.pop(v));
    check("closed flag", ch.closed());
}

void test_cancel_wakes_blocked_push() {
    CancelToken token;
    BoundedChannel<int> ch(1, &token);
    ch.push(0);

    std::atomic<bool> result{true};
    std::atomic<bool> returned{false};
    std::thread producer([&] {
        result = ch.push(1);   // full: parks here
        returned = true;
    });
    std::this_thread::sleep_for(milliseconds(30));
    check("push is parked while full", !returned.load());

    const auto t0 = steady_clock::now();
    token.cancel();
    producer.join();
    const auto waited = duration_cast<milliseconds>(steady_clock::now() - t0).count();
    check("cancel releases a blocked push", returned.load() && !result.load());
    check("release is prompt", waited < 100);
}

void test_cancel_wakes_blocked_pop() {
    CancelToken token;
    BoundedChannel<int> ch(4, &token);

    std::atomic<bool> result{true};
    std::thread consumer([&] {
        int v = 0;
        result = ch.pop(v);
    });
    std::this_thread::sleep_for(milliseconds(20));
    token.cancel();
    consumer.join();
    check("cancel releases a blocked pop", !result.load());

    int v = 0;
    check("pop after cancel fails at once", !ch.pop(v));
}

void test_cancel_hides_queued_items() {
    CancelToken token;
    BoundedChannel<int> ch(4, &token);
    ch.push(7);
    ch.push(8);
    token.cancel();
    int v = 0;
    check("pop refuses queued items after cancel", !ch.pop(v));
    check("try_pop still flushes", ch.try_pop(v) && v == 7);
    check("drain counts the rest", ch.drain() == 1 && ch.size() == 0);
}

void test_token() {
    CancelToken token;
    int woken = 0;
    const int id = token.add_waker([&] { ++woken; });
    int removed_calls = 0;
    const int id2 = token.add_waker([&] { ++removed_calls; });
    token.remove_waker(id2);

    check("not cancelled initially", !token.cancelled());
    check("first cancel flips", token.cancel());
    check("second cancel is a no-op", !token.cancel());
    check("waker ran once", woken == 1);
    check("removed waker never runs", removed_calls == 0);

    int late = 0;
    const int id3 = token.add_waker([&] { ++late; });
    check("late waker runs at once", late == 1 && id3 == -1);
    token.remove_waker(id);
}

int main() {
    std::cout << "=== Channel and cancel token tests ===\n\n";

    test_fifo_with_backpressure();
    test_close_semantics();
    test_cancel_wakes_blocked_push();
    test_cancel_wakes_blocked_pop();
    test_cancel_hides_queued_items();
    test_token();

    std::cout << "\n" << pass_count << "/" << test_count << " tests passed.\n";
    return (pass_count == test_count) ? 0 : 1;
}
