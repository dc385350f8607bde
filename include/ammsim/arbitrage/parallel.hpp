// AMMSim - Parallel Pair Evaluation
// Fan a task list out over std::async workers, one result buffer per worker

#pragma once

#include <algorithm>
#include <cstddef>
#include <future>
#include <iterator>
#include <type_traits>
#include <vector>

namespace ammsim::arbitrage {

/// Apply fn to every task. Results come back in task order regardless of
/// worker count; each worker owns a contiguous chunk and its own buffer.
template<typename Task, typename Fn>
auto parallel_map(const std::vector<Task>& tasks, unsigned workers, Fn fn)
    -> std::vector<std::invoke_result_t<Fn&, const Task&>> {
    using Out = std::invoke_result_t<Fn&, const Task&>;

    std::vector<Out> results;
    results.reserve(tasks.size());

    size_t worker_count = std::min<size_t>(std::max(workers, 1u), tasks.size());
    if (worker_count <= 1) {
        for (const auto& task : tasks) {
            results.push_back(fn(task));
        }
        return results;
    }

    size_t chunk = (tasks.size() + worker_count - 1) / worker_count;
    std::vector<std::future<std::vector<Out>>> futures;
    futures.reserve(worker_count);

    for (size_t begin = 0; begin < tasks.size(); begin += chunk) {
        size_t end = std::min(begin + chunk, tasks.size());
        futures.push_back(std::async(std::launch::async, [&tasks, &fn, begin, end]() {
            std::vector<Out> buffer;
            buffer.reserve(end - begin);
            for (size_t i = begin; i < end; ++i) {
                buffer.push_back(fn(tasks[i]));
            }
            return buffer;
        }));
    }

    for (auto& f : futures) {
        auto buffer = f.get();
        std::move(buffer.begin(), buffer.end(), std::back_inserter(results));
    }
    return results;
}

}  // namespace ammsim::arbitrage
