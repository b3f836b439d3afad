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

#include "polysub/cipher_engine.hh"
#include "polysub/trial_runner.hh"

#include <gtest/gtest.h>

#include <cstddef>
#include <stdexcept>
#include <string>

using polysub::cancellation;
using polysub::run_options;
using polysub::run_trials;
using polysub::transform_result;

namespace {
    constexpr size_t const trial_count = 400;
    constexpr size_t const stop_after  = 5;

    auto const numbered = [](size_t const index) {
        return transform_result{.text = std::to_string(index), .success = true};
    };

    // Requests a stop while running trial stop_after.
    auto stopping_trial(cancellation& stop) {
        return [&stop](size_t const index) {
            if (index == stop_after) {
                stop.request();
            }
            return numbered(index);
        };
    }
}    // namespace

TEST(TrialRunner, InlineRunKeepsOrder) {
    auto const batch = run_trials(trial_count, run_options{}, numbered);
    EXPECT_TRUE(batch.complete);
    ASSERT_EQ(batch.results.size(), trial_count);
    for (size_t ii = 0; ii < trial_count; ii++) {
        EXPECT_EQ(batch.results[ii].index, ii);
        EXPECT_EQ(batch.results[ii].text, std::to_string(ii));
    }
}

TEST(TrialRunner, ParallelRunKeepsOrder) {
    run_options options;
    options.workers  = 4;
    auto const batch = run_trials(trial_count, options, numbered);
    EXPECT_TRUE(batch.complete);
    ASSERT_EQ(batch.results.size(), trial_count);
    for (size_t ii = 0; ii < trial_count; ii++) {
        EXPECT_EQ(batch.results[ii].index, ii);
        EXPECT_EQ(batch.results[ii].text, std::to_string(ii));
    }
}

TEST(TrialRunner, InlineStopKeepsFinishedPrefix) {
    cancellation stop;
    run_options  options;
    options.cancel   = &stop;
    auto const batch = run_trials(trial_count, options, stopping_trial(stop));
    EXPECT_FALSE(batch.complete);
    ASSERT_EQ(batch.results.size(), stop_after + 1);
    for (size_t ii = 0; ii <= stop_after; ii++) {
        EXPECT_EQ(batch.results[ii].index, ii);
        EXPECT_EQ(batch.results[ii].text, std::to_string(ii));
    }
}

TEST(TrialRunner, ParallelStopKeepsFinishedTrialsInOrder) {
    cancellation stop;
    run_options  options;
    options.workers  = 4;
    options.cancel   = &stop;
    auto const batch = run_trials(trial_count, options, stopping_trial(stop));
    EXPECT_FALSE(batch.complete);
    // The first worker owns 0..99 and never gets past stop_after.
    ASSERT_GT(batch.results.size(), stop_after);
    EXPECT_LE(batch.results.size(), trial_count - (trial_count / 4 - stop_after - 1));
    for (size_t ii = 0; ii <= stop_after; ii++) {
        EXPECT_EQ(batch.results[ii].index, ii);
    }
    for (size_t ii = 1; ii < batch.results.size(); ii++) {
        EXPECT_LT(batch.results[ii - 1].index, batch.results[ii].index);
        EXPECT_EQ(batch.results[ii].text, std::to_string(batch.results[ii].index));
    }
}

TEST(TrialRunner, WorkerExceptionIsRethrown) {
    run_options options;
    options.workers = 3;
    auto const failing = [](size_t const index) {
        if (index == 7) {
            throw std::logic_error("trial 7");
        }
        return numbered(index);
    };
    EXPECT_THROW(static_cast<void>(run_trials(trial_count, options, failing)), std::logic_error);
}

TEST(TrialRunner, EmptyRunIsComplete) {
    run_options options;
    options.workers  = 0;
    auto const batch = run_trials(0, options, numbered);
    EXPECT_TRUE(batch.complete);
    EXPECT_TRUE(batch.results.empty());
}
