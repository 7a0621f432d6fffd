#pragma once
#include "ff1/net/NetConfig.hpp"

#include <string>
#include <utility>
#include <vector>

namespace ff1::net {

struct HttpRequest {
    std::string host;
    unsigned short port = 80;
    std::string target = "/";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    unsigned status = 0;
    std::string body;
};

/**
 * @brief One-shot HTTP/1.1 POST client with a single deadline per exchange.
 *
 * Each call resolves the host, connects, writes the request and reads the
 * response as one async chain on the shared `NetService` loop, all bounded by
 * the same timeout. On expiry the chain is cancelled and `post` returns
 * `asio::error::timed_out`; every other failure surfaces as the underlying
 * resolver / socket / Beast error. No connection is kept between calls.
 */
class HttpClient {
public:
    explicit HttpClient(milliseconds timeout);

    error_code post(const HttpRequest& request, HttpResponse& out) const;

private:
    static milliseconds sanitize(milliseconds timeout) {
        return timeout.count() < 0 ? milliseconds::zero() : timeout;
    }

    milliseconds timeout_;
};

/// Host header / URL authority form: brackets IPv6 literals.
std::string authority(const std::string& host, unsigned short port);

} // namespace ff1::net
