#include "ff1/net/WebSocketClient.hpp"

#include "ff1/net/Deadline.hpp"
#include "ff1/net/HttpClient.hpp"
#include "ff1/net/NetService.hpp"
#include "ff1/log/Log.hpp"

#include <atomic>

namespace ff1::net {

struct WebSocketClient::Session {
    explicit Session(asio::io_context& io)
    : strand(asio::make_strand(io))
    , resolver(strand)
    , ws(strand)
    {}

    // Runs on the strand.
    void shutdown() {
        error_code ignored;
        resolver.cancel();
        auto& sock = ws.next_layer();
        sock.cancel(ignored);
        sock.shutdown(tcp::socket::shutdown_both, ignored);
        sock.close(ignored);
        open = false;
    }

    asio::strand<asio::io_context::executor_type> strand;
    tcp::resolver resolver;
    websocket::stream<tcp::socket> ws;
    beast::flat_buffer buffer;
    std::atomic<bool> open{false};
};

WebSocketClient::WebSocketClient()
: session_(std::make_shared<Session>(io_context()))
{}

WebSocketClient::~WebSocketClient() {
    close();
}

error_code WebSocketClient::connect(const std::string& host, unsigned short port,
                                    const std::string& target, milliseconds timeout) {
    auto s = session_;
    const std::string service = std::to_string(port);
    const std::string hostHeader = authority(host, port);

    auto ec = with_deadline(s->strand, timeout,
        [s, host, service, hostHeader, target](auto completion) {
            asio::post(s->strand, [s, host, service, hostHeader, target, completion] {
                s->resolver.async_resolve(host, service,
                    [s, hostHeader, target, completion](const error_code& rec,
                                                        tcp::resolver::results_type results) {
                        if (rec) { completion(rec); return; }
                        asio::async_connect(s->ws.next_layer(), results,
                            [s, hostHeader, target, completion](const error_code& cec, const tcp::endpoint&) {
                                if (cec) { completion(cec); return; }
                                s->ws.async_handshake(hostHeader, target,
                                    [completion](const error_code& hec) { completion(hec); });
                            });
                    });
            });
        },
        [s] { s->shutdown(); });

    if (ec) {
        logError("[WebSocketClient] connect ws://", hostHeader, target, " failed: ", ec.message(), "\n");
        return ec;
    }

    s->open = true;
    logInfo("[WebSocketClient] connected ws://", hostHeader, target, "\n");
    return {};
}

error_code WebSocketClient::read(std::string& message) {
    auto s = session_;
    if (!s->open) {
        return asio::error::not_connected;
    }
    auto ec = wait_for_completion(
        [s](auto completion) {
            asio::post(s->strand, [s, completion] {
                s->ws.async_read(s->buffer, [completion](const error_code& rec, std::size_t) {
                    completion(rec);
                });
            });
        });
    if (ec) {
        return ec;
    }
    message = beast::buffers_to_string(s->buffer.data());
    s->buffer.consume(s->buffer.size());
    return {};
}

error_code WebSocketClient::read(std::string& message, milliseconds idleTimeout) {
    auto s = session_;
    if (!s->open) {
        return asio::error::not_connected;
    }
    auto ec = with_deadline(s->strand, idleTimeout,
        [s](auto completion) {
            asio::post(s->strand, [s, completion] {
                s->ws.async_read(s->buffer, [completion](const error_code& rec, std::size_t) {
                    completion(rec);
                });
            });
        },
        [s] { s->shutdown(); });
    if (ec) {
        return ec;
    }
    message = beast::buffers_to_string(s->buffer.data());
    s->buffer.consume(s->buffer.size());
    return {};
}

void WebSocketClient::close() {
    auto s = session_;
    if (!s || !s->open.exchange(false)) {
        return;
    }
    asio::post(s->strand, [s] { s->shutdown(); });
}

} // namespace ff1::net
