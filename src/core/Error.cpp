#include "ff1/core/Error.hpp"

#include <sstream>
#include <utility>

namespace ff1 {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigError:     return "config_error";
        case ErrorKind::NotFound:        return "not_found";
        case ErrorKind::Ambiguous:       return "ambiguous";
        case ErrorKind::Timeout:         return "timeout";
        case ErrorKind::TransportError:  return "transport_error";
        case ErrorKind::DecodeError:     return "decode_error";
        case ErrorKind::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

Error Error::config(std::string message) {
    Error e;
    e.kind = ErrorKind::ConfigError;
    e.message = std::move(message);
    return e;
}

Error Error::notFound(std::string message, std::vector<Candidate> candidates) {
    Error e;
    e.kind = ErrorKind::NotFound;
    e.message = std::move(message);
    e.candidates = std::move(candidates);
    return e;
}

Error Error::ambiguous(std::string message, std::vector<Candidate> candidates) {
    Error e;
    e.kind = ErrorKind::Ambiguous;
    e.message = std::move(message);
    e.candidates = std::move(candidates);
    return e;
}

Error Error::timedOut(std::string host, std::chrono::milliseconds timeout, std::string message) {
    Error e;
    e.kind = ErrorKind::Timeout;
    e.host = std::move(host);
    e.timeout = timeout;
    e.message = std::move(message);
    return e;
}

Error Error::transport(std::string host, std::string message, int httpStatus) {
    Error e;
    e.kind = ErrorKind::TransportError;
    e.host = std::move(host);
    e.message = std::move(message);
    e.httpStatus = httpStatus;
    return e;
}

Error Error::decode(std::string message) {
    Error e;
    e.kind = ErrorKind::DecodeError;
    e.message = std::move(message);
    return e;
}

Error Error::invalidArgument(std::string message) {
    Error e;
    e.kind = ErrorKind::InvalidArgument;
    e.message = std::move(message);
    return e;
}

std::string Error::describe() const {
    std::ostringstream os;
    os << toString(kind) << ": " << message;
    if (!host.empty()) {
        os << " (host " << host << ")";
    }
    if (timeout) {
        os << " after " << timeout->count() << "ms";
    }
    if (httpStatus != 0) {
        os << " [HTTP " << httpStatus << "]";
    }
    if (!candidates.empty()) {
        os << " candidates:";
        for (const auto& c : candidates) {
            os << ' ' << (c.name.empty() ? c.host : c.name) << '@' << c.host;
        }
    }
    return os.str();
}

} // namespace ff1
