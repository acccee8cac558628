/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powex/pow/parallel_searcher.hpp"

#include <atomic>
#include <chrono>
#include <system_error>
#include <utility>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "powex/pow/stripe.hpp"
#include "powex/pow/validation.hpp"

namespace powex {
namespace pow {

namespace {

// Result slot of one parallel call. Only the worker that wins the CAS on
// 'found' writes 'nonce'; the parent reads it after joining.
struct FoundSlot {
    std::atomic<bool> found{false};
    std::uint64_t nonce{0};

    bool claim(std::uint64_t candidate) {
        bool expected = false;
        if (!found.compare_exchange_strong(expected, true,
                                           std::memory_order_acq_rel,
                                           std::memory_order_acquire)) {
            return false;
        }
        nonce = candidate;
        return true;
    }
};

// Joins every started thread when it goes out of scope, including when a
// later std::thread constructor throws.
class WorkerGroup {
public:
    explicit WorkerGroup(std::size_t capacity) { threads_.reserve(capacity); }
    ~WorkerGroup() { join_all(); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    template <typename Fn>
    void spawn(Fn&& fn) { threads_.emplace_back(std::forward<Fn>(fn)); }

    void join_all() {
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        threads_.clear();
    }

    std::size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

} // namespace

ParallelSearcher::ParallelSearcher(logging::Logger& log, SearchLimits limits)
    : log_(log)
    , limits_(limits) {}

Result<std::uint64_t> ParallelSearcher::search(const crypto::Payload& payload,
                                               std::int64_t difficulty,
                                               std::int64_t thread_count) {
    stats_ = SearchStats{};
    if (auto err = check_parallel_params(difficulty, thread_count)) {
        return Result<std::uint64_t>::failure(*err);
    }

    const auto diff = static_cast<std::uint32_t>(difficulty);
    const auto workers = static_cast<std::uint32_t>(thread_count);
    const std::uint64_t ceiling = limits_.ceiling_for(diff);

    FoundSlot slot;
    bool aborted = false;
    std::vector<std::uint64_t> hashes(workers, 0);

    auto start_time = std::chrono::steady_clock::now();
    {
        WorkerGroup group(workers);
        try {
            for (std::uint32_t id = 0; id < workers; ++id) {
                group.spawn([&, id]() {
                    const Stripe stripe{id, workers, ceiling};
                    try {
                        crypto::PayloadHasher hasher(payload);
                        const StripeOutcome outcome = scan_stripe(hasher, diff, stripe, &slot.found);
                        hashes[id] = outcome.hashes;
                        if (outcome.nonce && slot.claim(*outcome.nonce) && log_.debug_enabled()) {
                            log_.debug(fmt::format("Worker {} claimed nonce {}", id, *outcome.nonce));
                        }
                    } catch (const std::exception& e) {
                        log_.error(fmt::format("Worker {} stopped: {}", id, e.what()));
                    }
                });
            }
        } catch (const std::system_error& e) {
            // Stop the workers already running; the group joins them on scope exit.
            // If one of them already claimed a nonce, that result stands.
            log_.error(fmt::format("Failed to start search worker {}: {}", group.size(), e.what()));
            bool expected = false;
            aborted = slot.found.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
        }
    }

    stats_.workers = workers;
    stats_.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time);
    for (auto h : hashes) stats_.hashes += h;

    if (aborted) {
        return Result<std::uint64_t>::failure(Error::Internal);
    }
    if (!slot.found.load(std::memory_order_acquire)) {
        log_.warn(fmt::format("Parallel search gave up at difficulty {} after {} hashes on {} workers",
                              diff, stats_.hashes, workers));
        return Result<std::uint64_t>::failure(Error::Exhausted);
    }
    return Result<std::uint64_t>::success(slot.nonce);
}

} // namespace pow
} // namespace powex
