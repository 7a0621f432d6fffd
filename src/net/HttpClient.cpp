#include "ff1/net/HttpClient.hpp"

#include "ff1/net/Deadline.hpp"
#include "ff1/net/NetService.hpp"
#include "ff1/log/Log.hpp"

#include <memory>
#include <string>

namespace ff1::net {

namespace {

constexpr const char* USER_AGENT = "ff1ctl";

// Everything the async chain touches lives here so late handlers (after a
// timeout) never reference the caller's stack.
struct Exchange {
    explicit Exchange(asio::io_context& io)
    : strand(asio::make_strand(io))
    , resolver(strand)
    , socket(strand)
    {}

    void abort() {
        error_code ignored;
        resolver.cancel();
        socket.cancel(ignored);
        socket.close(ignored);
    }

    asio::strand<asio::io_context::executor_type> strand;
    tcp::resolver resolver;
    tcp::socket socket;
    http::request<http::string_body> request;
    beast::flat_buffer buffer;
    http::response<http::string_body> response;
};

} // namespace

std::string authority(const std::string& host, unsigned short port) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

HttpClient::HttpClient(milliseconds timeout)
: timeout_(sanitize(timeout))
{}

error_code HttpClient::post(const HttpRequest& request, HttpResponse& out) const {
    auto ex = std::make_shared<Exchange>(io_context());

    ex->request.method(http::verb::post);
    ex->request.target(request.target);
    ex->request.version(11);
    ex->request.set(http::field::host, authority(request.host, request.port));
    ex->request.set(http::field::user_agent, USER_AGENT);
    ex->request.set(http::field::content_type, "application/json");
    ex->request.keep_alive(false);
    for (const auto& [name, value] : request.headers) {
        ex->request.set(name, value);
    }
    ex->request.body() = request.body;
    ex->request.prepare_payload();

    const std::string host = request.host;
    const std::string service = std::to_string(request.port);

    auto ec = with_deadline(ex->strand, timeout_,
        [ex, host, service](auto completion) {
            asio::post(ex->strand, [ex, host, service, completion] {
                ex->resolver.async_resolve(host, service,
                    [ex, completion](const error_code& rec, tcp::resolver::results_type results) {
                        if (rec) { completion(rec); return; }
                        asio::async_connect(ex->socket, results,
                            [ex, completion](const error_code& cec, const tcp::endpoint&) {
                                if (cec) { completion(cec); return; }
                                http::async_write(ex->socket, ex->request,
                                    [ex, completion](const error_code& wec, std::size_t) {
                                        if (wec) { completion(wec); return; }
                                        http::async_read(ex->socket, ex->buffer, ex->response,
                                            [ex, completion](const error_code& hec, std::size_t) {
                                                completion(hec);
                                            });
                                    });
                            });
                    });
            });
        },
        [ex] { ex->abort(); });

    if (ec) {
        logError("[HttpClient] POST ", authority(request.host, request.port), request.target,
                 " failed: ", ec.message(), "\n");
        return ec;
    }

    out.status = ex->response.result_int();
    out.body = std::move(ex->response.body());

    // Release the connection on the socket's own executor.
    asio::post(ex->strand, [ex] {
        error_code ignored;
        ex->socket.shutdown(tcp::socket::shutdown_both, ignored);
        ex->socket.close(ignored);
    });

    return {};
}

} // namespace ff1::net
