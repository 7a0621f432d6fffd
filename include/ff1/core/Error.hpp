#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ff1 {

/**
 * @brief Failure categories surfaced by the resolver and the control client.
 *
 * The values are stable so an outer layer can map each one to a distinct exit
 * code or message.
 */
enum class ErrorKind {
    ConfigError,     ///< Malformed configuration file.
    NotFound,        ///< No device could be resolved.
    Ambiguous,       ///< More than one candidate; caller must pick one.
    Timeout,         ///< A bounded network operation exceeded its deadline.
    TransportError,  ///< Connection refused, reset, dropped, or non-2xx HTTP status.
    DecodeError,     ///< A response or status frame did not match the expected shape.
    InvalidArgument  ///< Caller supplied inconsistent input; no I/O was attempted.
};

const char* toString(ErrorKind kind);

/// One entry of a NotFound / Ambiguous candidate list.
struct Candidate {
    std::string name;
    std::string host;
};

/**
 * @brief Structured error value carried by `ff1::expected`.
 *
 * Only the fields relevant to `kind` are populated; the factories below fill
 * them consistently.
 */
struct Error {
    ErrorKind kind = ErrorKind::TransportError;
    std::string message;
    std::vector<Candidate> candidates;
    std::string host;
    std::optional<std::chrono::milliseconds> timeout;
    int httpStatus = 0;

    static Error config(std::string message);
    static Error notFound(std::string message, std::vector<Candidate> candidates = {});
    static Error ambiguous(std::string message, std::vector<Candidate> candidates);
    static Error timedOut(std::string host, std::chrono::milliseconds timeout, std::string message);
    static Error transport(std::string host, std::string message, int httpStatus = 0);
    static Error decode(std::string message);
    static Error invalidArgument(std::string message);

    /// Human-readable one-line summary including host / timeout when present.
    std::string describe() const;
};

} // namespace ff1
