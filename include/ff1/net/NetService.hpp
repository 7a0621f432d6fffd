#pragma once
#include "ff1/net/NetConfig.hpp"
#include <thread>
#include <memory>

namespace ff1::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * All socket, resolver and timer work is posted to one background loop. The
 * synchronous helpers in `Deadline.hpp` start an async operation on that loop
 * and block the calling thread until it (or its deadline) completes, so several
 * callers (e.g. concurrent liveness probes) can have operations in flight at
 * once without each owning a loop.
 *
 * Lifetime notes:
 * - Destroy network clients before `NetService` so their handlers complete while
 *   the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

/// The process-wide loop, started on first use.
asio::io_context& io_context();

} // namespace ff1::net
