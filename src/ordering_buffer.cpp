#include "ordering_buffer.hpp"

#include <algorithm>
#include <utility>

OrderingBuffer::OrderingBuffer(uint32_t total)
    : count(total)
{
}

std::string OrderingBuffer::accept(Result&& res, std::vector<Result>& ready)
{
    const uint32_t idx = res.index;
    if (idx >= count)
        return "protocol violation: index " + std::to_string(idx)
             + " outside 0.." + std::to_string(count);
    if (idx < next)
        return "protocol violation: index " + std::to_string(idx)
             + " arrived after " + std::to_string(next) + " was expected";

    if (idx > next) {
        if (!waiting.emplace(idx, std::move(res)).second)
            return "protocol violation: duplicate index " + std::to_string(idx);
        peak = std::max(peak, waiting.size());
        return {};
    }

    ready.push_back(std::move(res));
    ++next;

    // Release any successors that were already waiting
    auto it = waiting.begin();
    while (it != waiting.end() && it->first == next) {
        ready.push_back(std::move(it->second));
        it = waiting.erase(it);
        ++next;
    }
    return {};
}

size_t OrderingBuffer::discard_pending()
{
    const size_t n = waiting.size();
    waiting.clear();
    return n;
}
