#include "ff1/client/CommandEnvelope.hpp"

#include "ff1/schema/json_schema.hpp"

namespace ff1::client {

namespace {

namespace fsch = ::ff1::schema;

const auto envelopeSchema = fsch::makeSchema<CommandEnvelope>(std::make_tuple(
    fsch::required<&CommandEnvelope::command>("command", fsch::Text{}),
    fsch::field<&CommandEnvelope::request   >("request", fsch::optionalOf(fsch::AnyObject{}))
));

} // namespace

bool operator==(const CommandEnvelope& a, const CommandEnvelope& b) {
    return a.command == b.command && a.request == b.request;
}

nlohmann::json pruneNulls(const nlohmann::json& value) {
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (it.value().is_null()) continue;
            out[it.key()] = pruneNulls(it.value());
        }
        return out;
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& element : value) {
            out.push_back(pruneNulls(element));
        }
        return out;
    }
    return value;
}

nlohmann::json encodeEnvelope(const CommandEnvelope& envelope) {
    CommandEnvelope pruned{envelope.command, std::nullopt};
    if (envelope.request && !envelope.request->is_null()) {
        pruned.request = pruneNulls(*envelope.request);
    }
    return fsch::encode(envelopeSchema, pruned);
}

ff1::expected<CommandEnvelope> decodeEnvelope(const nlohmann::json& wire) {
    auto envelope = fsch::decode(envelopeSchema, wire);
    if (!envelope) {
        return ff1::unexpected(Error::decode("envelope " + envelope.error().where + ": " + envelope.error().what));
    }
    return std::move(*envelope);
}

} // namespace ff1::client
