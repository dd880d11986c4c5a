#pragma once

#include "renderer.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Turns out-of-order worker output back into ascending index order.
// Owned by a single thread; no locking.
class OrderingBuffer {
public:
    explicit OrderingBuffer(uint32_t total);

    // Takes one result and appends every result that became deliverable to
    // `ready`, in index order. Returns empty string on success, or a protocol
    // violation message (index already delivered, duplicate or out of range).
    std::string accept(Result&& res, std::vector<Result>& ready);

    uint32_t next_expected() const { return next; }
    uint32_t total() const         { return count; }
    bool     complete() const      { return next == count; }

    size_t pending() const      { return waiting.size(); }
    size_t peak_pending() const { return peak; }

    // Drops everything still waiting for a predecessor; returns how many.
    size_t discard_pending();

private:
    std::map<uint32_t, Result> waiting;
    uint32_t                   count;
    uint32_t                   next = 0;
    size_t                     peak = 0;
};
