#include <algorithm>
#include <iostream>
#include <numeric>
#include <random>
#include <vector>

#include "ordering_buffer.hpp"

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

static Result make(uint32_t idx) {
    Result r;
    r.index = idx;
    r.caption = std::to_string(idx);
    return r;
}

void test_in_order_passthrough() {
    OrderingBuffer ob(3);
    std::vector<Result> ready;
    bool ok = true;
    for (uint32_t i = 0; i < 3; ++i) {
        ready.clear();
        ok = ok && ob.accept(make(i), ready).empty();
        ok = ok && ready.size() == 1 && ready[0].index == i;
    }
    check("in-order results pass straight through", ok);
    check("complete after last", ob.complete() && ob.pending() == 0);
}

void test_reverse_arrival() {
    OrderingBuffer ob(3);
    std::vector<Result> ready;
    ob.accept(make(2), ready);
    ob.accept(make(1), ready);
    check("nothing released before index 0", ready.empty() && ob.pending() == 2);

    ob.accept(make(0), ready);
    check("index 0 releases the whole run",
          ready.size() == 3 && ready[0].index == 0 && ready[1].index == 1
          && ready[2].index == 2);
    check("captions travel with results", ready[2].caption == "2");
    check("peak pending recorded", ob.peak_pending() == 2);
    check("next expected advanced", ob.next_expected() == 3);
}

void test_gap_holds_successors() {
    OrderingBuffer ob(6);
    std::vector<Result> ready;
    ob.accept(make(0), ready);
    ob.accept(make(2), ready);
    ob.accept(make(3), ready);
    ob.accept(make(5), ready);
    check("stops at the first gap", ready.size() == 1 && ob.next_expected() == 1);

    ready.clear();
    ob.accept(make(1), ready);
    check("gap fill releases contiguous run only",
          ready.size() == 3 && ready.back().index == 3 && ob.pending() == 1);
    check("discard_pending drops the stragglers",
          ob.discard_pending() == 1 && ob.pending() == 0);
}

void test_protocol_violations() {
    OrderingBuffer ob(4);
    std::vector<Result> ready;
    ob.accept(make(0), ready);
    check("index below next expected rejected", !ob.accept(make(0), ready).empty());

    ob.accept(make(2), ready);
    check("duplicate pending index rejected", !ob.accept(make(2), ready).empty());
    check("index past the end rejected", !ob.accept(make(4), ready).empty());
    check("violations leave state untouched",
          ob.next_expected() == 1 && ob.pending() == 1);
}

void test_random_permutations() {
    std::mt19937 rng(4242);
    bool ok = true;
    for (int round = 0; round < 20; ++round) {
        const uint32_t n = 1 + rng() % 500;
        std::vector<uint32_t> order(n);
        std::iota(order.begin(), order.end(), 0u);
        std::shuffle(order.begin(), order.end(), rng);

        OrderingBuffer ob(n);
        std::vector<Result> ready;
        for (uint32_t idx : order)
            ok = ok && ob.accept(make(idx), ready).empty();
        ok = ok && ready.size() == n && ob.complete();
        for (uint32_t i = 0; ok && i < n; ++i) ok = ready[i].index == i;
    }
    check("any arrival order delivers 0..n-1", ok);
}

int main() {
    std::cout << "=== Ordering buffer tests ===\n\n";

    test_in_order_passthrough();
    test_reverse_arrival();
    test_gap_holds_successors();
    test_protocol_violations();
    test_random_permutations();

    std::cout << "\n" << pass_count << "/" << test_count << " tests passed.\n";
    return (pass_count == test_count) ? 0 : 1;
}
