/*
 * Copyright (C) Flamewing 2024 <flamewing.sonic@gmail.com>
 *
 * This program is free software: you can redistribute it and/or modify it
 * under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 * See the GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef POLYSUB_TRIAL_RUNNER_HH
#define POLYSUB_TRIAL_RUNNER_HH

#include <polysub/cipher_engine.hh>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace polysub {
    // Cooperative stop request, polled between trials. Setting it is
    // async-signal-safe.
    class cancellation {
    public:
        void request() noexcept {
            flag.store(true, std::memory_order_relaxed);
        }

        void reset() noexcept {
            flag.store(false, std::memory_order_relaxed);
        }

        [[nodiscard]] bool requested() const noexcept {
            return flag.load(std::memory_order_relaxed);
        }

    private:
        static_assert(std::atomic<bool>::is_always_lock_free);
        std::atomic<bool> flag{false};
    };

    struct run_options {
        constexpr static size_t const default_max_candidates = 1'000'000U;

        // Brute-force runs larger than this fail before doing any work.
        size_t max_candidates = default_max_candidates;
        // 0 means one per hardware thread; 1 runs everything on the caller.
        size_t workers = 1;
        // Optional; when set, checked before each trial.
        cancellation const* cancel = nullptr;
    };

    struct trial_batch {
        std::vector<transform_result> results;
        bool                          complete = true;
    };

    namespace detail {
        [[nodiscard]] inline size_t resolve_workers(
                size_t const requested, size_t const count) noexcept {
            size_t workers = requested;
            if (workers == 0) {
                workers = std::max(size_t{1}, size_t{std::thread::hardware_concurrency()});
            }
            return std::clamp(workers, size_t{1}, std::max(size_t{1}, count));
        }
    }    // namespace detail

    // Runs trial(0) ... trial(count - 1) and returns the results in index
    // order, however the work was scheduled. Each worker gets one contiguous
    // index range and writes only its own slots. On cancellation, the trials
    // that did finish are returned, still in index order, and the batch is
    // flagged incomplete. Every result carries its trial index, so gaps left
    // by a cancelled parallel run can be located.
    template <typename Trial>
    requires std::is_invocable_r_v<transform_result, Trial const&, size_t>
    [[nodiscard]] trial_batch run_trials(
            size_t const count, run_options const& options, Trial const& trial) {
        std::vector<std::optional<transform_result>> slots(count);

        auto const stop_requested = [&]() noexcept {
            return options.cancel != nullptr && options.cancel->requested();
        };
        auto const run_range = [&](size_t const first, size_t const last) {
            for (size_t index = first; index < last; index++) {
                if (stop_requested()) {
                    return;
                }
                slots[index].emplace(trial(index)).index = index;
            }
        };

        size_t const workers = detail::resolve_workers(options.workers, count);
        if (workers == 1) {
            run_range(0, count);
        } else {
            size_t const                    chunk = (count + workers - 1) / workers;
            std::vector<std::exception_ptr> failures(workers);
            boost::asio::thread_pool        pool(workers);
            for (size_t worker = 0; worker < workers; worker++) {
                size_t const first = worker * chunk;
                size_t const last  = std::min(count, first + chunk);
                if (first >= last) {
                    break;
                }
                boost::asio::post(pool, [&, worker, first, last]() {
                    try {
                        run_range(first, last);
                    } catch (...) {
                        failures[worker] = std::current_exception();
                    }
                });
            }
            pool.join();
            for (auto const& failure : failures) {
                if (failure) {
                    std::rethrow_exception(failure);
                }
            }
        }

        trial_batch batch;
        batch.results.reserve(count);
        for (auto& slot : slots) {
            if (slot) {
                batch.results.push_back(std::move(*slot));
            } else {
                batch.complete = false;
            }
        }
        return batch;
    }
}    // namespace polysub

#endif    // POLYSUB_TRIAL_RUNNER_HH
