#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "corpusflux/progress.hpp"

namespace corpusflux
{

// 0 -> hardware concurrency, never less than 1.
std::size_t effective_threads(std::size_t configured);

// Files per selector wave: configured, or max(5, threads / 2).
std::size_t selector_wave_size(std::size_t threads, std::size_t configured = 0);

template <typename Result>
struct TaskOutcome
{
    bool ok = false;
    Result result{};
    std::string error;
};

// Runs fn(item, result, err) -> bool for every item with at most `concurrency`
// items in flight. A worker picks the next queued item as soon as its current
// one finishes. Failures (false or a thrown std::exception) are logged with the
// item and recorded in that item's outcome; they never stop the pool. Each
// outcome slot is written only by the worker that ran the item, so the caller
// can aggregate after this returns without locking.
template <typename Result, typename Fn>
std::vector<TaskOutcome<Result>> run_file_tasks(const std::vector<std::string> &items, std::size_t concurrency,
                                                const std::string &label, Fn &&fn,
                                                ProgressTracker *progress = nullptr)
{
    std::vector<TaskOutcome<Result>> outcomes(items.size());
    if (items.empty())
    {
        return outcomes;
    }

    std::atomic<std::size_t> next_idx{0};
    auto worker = [&]() {
        while (true)
        {
            std::size_t idx = next_idx.fetch_add(1);
            if (idx >= items.size())
            {
                break;
            }
            auto &outcome = outcomes[idx];
            try
            {
                outcome.ok = fn(items[idx], outcome.result, outcome.error);
                if (!outcome.ok && outcome.error.empty())
                {
                    outcome.error = "task failed";
                }
            }
            catch (const std::exception &e)
            {
                outcome.ok = false;
                outcome.error = e.what();
            }
            if (!outcome.ok)
            {
                print_line(std::cerr, "[" + label + "] failed: " + items[idx] + ": " + outcome.error);
            }
            if (progress)
            {
                progress->add(1);
            }
        }
    };

    const std::size_t thread_count = std::min(std::max<std::size_t>(1, concurrency), items.size());
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (std::size_t t = 0; t < thread_count; ++t)
    {
        threads.emplace_back(worker);
    }
    for (auto &t : threads)
    {
        t.join();
    }
    return outcomes;
}

} // namespace corpusflux
