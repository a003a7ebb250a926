#pragma once

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <vector>

namespace astock {
namespace common {

// Runs job(i) for i in [0, n) over `workers` contiguous partitions and
// rethrows the first job failure after every worker has joined. If a
// worker cannot be started, the ones already running are joined before the
// std::system_error propagates.
template <typename Job, typename Thread = std::thread>
void parallelFor(size_t n, size_t workers, Job job) {
    if (workers <= 1 || n <= 1) {
        for (size_t i = 0; i < n; ++i) {
            job(i);
        }
        return;
    }

    std::vector<Thread> threads;
    threads.reserve(workers);
    std::vector<std::exception_ptr> errors(workers);
    const size_t chunk = (n + workers - 1) / workers;

    auto joinAll = [&threads]() {
        for (auto& t : threads) {
            if (t.joinable()) {
                t.join();
            }
        }
    };

    try {
        for (size_t w = 0; w < workers; ++w) {
            const size_t begin = w * chunk;
            const size_t end = std::min(n, begin + chunk);
            if (begin >= end) {
                break;
            }
            threads.emplace_back([&, w, begin, end]() {
                try {
                    for (size_t i = begin; i < end; ++i) {
                        job(i);
                    }
                } catch (...) {
                    errors[w] = std::current_exception();
                }
            });
        }
    } catch (const std::system_error&) {
        joinAll();
        throw;
    }

    joinAll();
    for (const auto& err : errors) {
        if (err) {
            std::rethrow_exception(err);
        }
    }
}

} // namespace common
} // namespace astock
