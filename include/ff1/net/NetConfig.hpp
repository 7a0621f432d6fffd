#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>

namespace ff1::net {

/**
 * @brief Centralises networking aliases so higher-level code never names Boost directly.
 *
 * Exposes:
 * - `ff1::net::asio` as the Boost.Asio namespace.
 * - `ff1::net::beast`, `http` and `websocket` for the Beast protocol layers.
 * - `ff1::net::tcp` as the protocol alias and `error_code` as the error type
 *   every net-layer call returns.
 */
namespace asio = ::boost::asio;
namespace beast = ::boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

using tcp = asio::ip::tcp;
using error_code = ::boost::system::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace ff1::net
