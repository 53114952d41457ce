#pragma once
#include <algorithm>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

#include "util/constants.hpp"

namespace shard
{

inline std::size_t default_workers()
{
    std::size_t hw = std::thread::hardware_concurrency();
    if (hw == 0)
        hw = 1;
    return std::min(hw, constants::MAX_DEFAULT_WORKERS);
}

// 0 means "pick a default"; never more threads than units of work
inline std::size_t resolve_workers(std::size_t requested, std::size_t units)
{
    std::size_t w = requested == 0 ? default_workers() : requested;
    w             = std::min(w, units);
    return std::max<std::size_t>(w, 1);
}

// Run `fn(worker_id)` on `count` threads and join them all. Returning from
// here is the barrier after which every worker's result slot is final.
inline void run_workers(std::size_t count, const std::function<void(std::size_t)> &fn)
{
    std::vector<std::thread> threads;
    threads.reserve(count);
    for (std::size_t w = 0; w < count; ++w)
        threads.emplace_back(fn, w);
    for (auto &t : threads)
        t.join();
}

}  // namespace shard
