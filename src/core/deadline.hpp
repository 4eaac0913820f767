/*
 * Copyright 2025 Bulwark Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Bulwark Deadline Runner
// Runs a unit of work under an explicit deadline with cooperative cancellation

#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

#include "errors.hpp"

namespace bulwark::core {

/// Result type of a unit of work, whether or not it takes a std::stop_token
template <typename Fn, bool = std::is_invocable_v<Fn&, std::stop_token>>
struct call_result {
    using type = std::invoke_result_t<Fn&, std::stop_token>;
};

template <typename Fn>
struct call_result<Fn, false> {
    using type = std::invoke_result_t<Fn&>;
};

template <typename Fn>
using call_result_t = typename call_result<std::decay_t<Fn>>::type;

/// Invoke a unit of work, passing the stop token when it accepts one
template <typename Fn>
decltype(auto) invoke_with_token(Fn& fn, std::stop_token token) {
    if constexpr (std::is_invocable_v<Fn&, std::stop_token>) {
        return fn(std::move(token));
    } else {
        return fn();
    }
}

/// Run fn with a deadline.
///
/// The work runs on a dedicated thread. When the deadline elapses a stop is
/// requested on the token handed to fn, the result is abandoned and
/// CallTimeoutError is thrown; the caller never waits past the deadline.
/// fn is moved into state shared with the worker thread, so it must own
/// everything it touches (capture by value or shared_ptr).
///
/// A non-positive timeout runs fn inline on the calling thread.
template <typename Fn>
call_result_t<Fn> run_with_deadline(Fn fn, std::chrono::milliseconds timeout,
                                    std::string_view dependency) {
    using Result = call_result_t<Fn>;

    if (timeout.count() <= 0) {
        return invoke_with_token(fn, std::stop_token{});
    }

    struct State {
        std::promise<Result> promise;
        std::stop_source stop;
        Fn fn;
    };

    auto state = std::make_shared<State>(State{std::promise<Result>{}, std::stop_source{},
                                               std::move(fn)});
    auto future = state->promise.get_future();

    std::thread worker([state]() {
        try {
            if constexpr (std::is_void_v<Result>) {
                invoke_with_token(state->fn, state->stop.get_token());
                state->promise.set_value();
            } else {
                state->promise.set_value(invoke_with_token(state->fn, state->stop.get_token()));
            }
        } catch (...) {
            state->promise.set_exception(std::current_exception());
        }
    });
    worker.detach();

    if (future.wait_for(timeout) == std::future_status::timeout) {
        state->stop.request_stop();
        throw CallTimeoutError(std::string(dependency), timeout);
    }

    return future.get();
}

}  // namespace bulwark::core
