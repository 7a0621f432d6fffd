#pragma once
#include "ff1/net/NetConfig.hpp"
#include "ff1/log/Log.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * Pattern:
 * - Start an async operation and an `asio::steady_timer` on the same executor.
 * - Whichever completes first cancels the other and signals a condition
 *   variable so this call can return synchronously with a timeout.
 *
 * Safety notes:
 * - Completion handlers capture a `shared_ptr<State>` so they cannot access
 *   destroyed synchronisation primitives even if they run after this function
 *   returns. Anything the operation itself touches must likewise be kept alive
 *   by the operation's handlers (see `HttpClient`), because on timeout this
 *   function returns before the cancelled operation has unwound.
 * - The `cancel()` functor must cancel the same socket or resolver that launched
 *   the operation; callers supply it so ownership decisions stay at the call site.
 *
 * Requirements:
 * - The associated `asio::io_context` must already be running while we block.
 *   Otherwise the wait would never complete.
 */
namespace ff1::net {

namespace detail {

struct CompletionState {
    std::mutex m;
    std::condition_variable cv;
    bool done = false;
    error_code ec = asio::error::would_block;
};

} // namespace detail

template<typename StartAsync, typename Cancel>
error_code with_deadline(
    asio::any_io_executor ex,
    milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    auto st = std::make_shared<detail::CompletionState>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    // Completion of the user async op
    auto op_handler = [st, timer](const error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return;           // another path already won
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();                // wake waiter first...
        timer->cancel();                    // ...then cancel timer (handler must be benign)
    };

    // Arm the deadline
    timer->expires_after(timeout);
    timer->async_wait([st, cancel, timer, timeout](const error_code& tec){
        if (tec == asio::error::operation_aborted) {
            // Cancelled because the operation finished first, so nothing to do.
            return;
        }
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) {
                return; // operation already completed; no need to cancel
            }
            st->ec = asio::error::timed_out;
            st->done = true;
        }
        logInfo("[with_deadline] timeout fired after ", timeout.count(), "ms\n");
        cancel();
        st->cv.notify_one();
    });

    // Kick off the async operation (it must call our op_handler). The timer is
    // armed first so a fast completion never races the timer setup.
    start_async(op_handler);

    // Wait until either branch completes
    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    return st->ec;
}

/**
 * @brief Same blocking bridge as `with_deadline` but without a timer.
 *
 * Used for long-lived reads (the status feed) that must wait for as long as
 * the peer keeps the connection open. Cancellation happens by closing the
 * socket from another thread.
 */
template<typename StartAsync>
error_code wait_for_completion(StartAsync start_async)
{
    auto st = std::make_shared<detail::CompletionState>();

    start_async([st](const error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return;
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    return st->ec;
}

} // namespace ff1::net
