#pragma once

#include "ff1/core/Expected.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ff1::client {

/**
 * @brief Outer wrapper for every command sent to `/api/cast`.
 *
 * `request` is the command-specific payload. It is treated as opaque except
 * that members holding `null` are pruned (recursively) when encoding, so a
 * field with no value is never sent as an explicit null. An envelope without
 * a payload has no `request` member at all on the wire.
 */
struct CommandEnvelope {
    std::string command;
    std::optional<nlohmann::json> request;
};

bool operator==(const CommandEnvelope& a, const CommandEnvelope& b);

nlohmann::json encodeEnvelope(const CommandEnvelope& envelope);
ff1::expected<CommandEnvelope> decodeEnvelope(const nlohmann::json& wire);

/// Returns a copy of @p value with every null object member removed, at any depth.
nlohmann::json pruneNulls(const nlohmann::json& value);

} // namespace ff1::client
