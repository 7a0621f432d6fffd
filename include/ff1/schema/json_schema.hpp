#pragma once
// json_schema.hpp (C++17, header-only)
// -----------------------------------------------------------------------------
// Tiny declarative toolkit that maps C++ records to JSON objects and back.
// Each record type gets one field table pairing a data member with its wire
// name and a codec. The table is the only place wire names appear, so the
// translation is explicit, bidirectional and applied at the boundary only.
//
// Usage sketch:
//   struct Volume { int percent = 0; bool muted = false; };
//   using namespace ff1::schema;
//   const auto volumeSchema = makeSchema<Volume>(std::make_tuple(
//       field<&Volume::percent>("percent", Integer<int>{}),
//       field<&Volume::muted  >("isMuted", Flag{})
//   ));
//   auto v    = decode(volumeSchema, json::parse(text));
//   auto wire = encode(volumeSchema, v.value());
//
// Decoding rules:
// - Missing optional fields keep the record's default member value.
// - Missing required fields, and fields of the wrong JSON type, fail with a
//   DecodeError naming the JSON path.
// - Unknown wire fields are ignored.
// Encoding rules:
// - Every field is written; `Optional<...>` fields holding no value are
//   omitted entirely (never written as null).
// -----------------------------------------------------------------------------

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace ff1::schema {

using json = nlohmann::json;

template<class T, class E>
using expected = tl::expected<T, E>;
template<class E>
using unexpected = tl::unexpected<E>;

// Error payload used by expected
struct DecodeError {
    std::string where;
    std::string what;
};

inline std::string childPath(const std::string& parent, const char* key) {
    return parent.empty() ? std::string(key) : parent + "." + key;
}

inline std::string indexPath(const std::string& parent, std::size_t index) {
    return parent + "[" + std::to_string(index) + "]";
}

// ============================================================================
// Codecs (value <-> json)
// Each codec names its C++ value_type, reads one JSON value and renders one
// back. Field writes go through write() so Optional can omit absent values.
// ============================================================================
struct Text {
    using value_type = std::string;

    expected<std::string, DecodeError>
    read(const json& j, const std::string& where) const {
        if (!j.is_string()) return unexpected<DecodeError>({where, "expected string"});
        return j.get<std::string>();
    }
    json toJson(const std::string& v) const { return v; }
    void write(const std::string& v, json& out, const char* key) const { out[key] = toJson(v); }
};

struct Flag {
    using value_type = bool;

    expected<bool, DecodeError>
    read(const json& j, const std::string& where) const {
        if (!j.is_boolean()) return unexpected<DecodeError>({where, "expected boolean"});
        return j.get<bool>();
    }
    json toJson(bool v) const { return v; }
    void write(bool v, json& out, const char* key) const { out[key] = toJson(v); }
};

template<class Int>
struct Integer {
    static_assert(std::is_integral<Int>::value, "Integer codec needs an integral type");
    using value_type = Int;

    expected<Int, DecodeError>
    read(const json& j, const std::string& where) const {
        if (!j.is_number_integer()) return unexpected<DecodeError>({where, "expected integer"});
        if (j.is_number_unsigned()) {
            const auto u = j.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<Int>::max()))
                return unexpected<DecodeError>({where, "integer out of range"});
            return static_cast<Int>(u);
        }
        const auto v = j.get<std::int64_t>();
        if (v < static_cast<std::int64_t>(std::numeric_limits<Int>::min()) ||
            (v > 0 && static_cast<std::uint64_t>(v) > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())))
            return unexpected<DecodeError>({where, "integer out of range"});
        return static_cast<Int>(v);
    }
    json toJson(Int v) const { return v; }
    void write(Int v, json& out, const char* key) const { out[key] = toJson(v); }
};

// Any JSON object, carried opaquely.
struct AnyObject {
    using value_type = json;

    expected<json, DecodeError>
    read(const json& j, const std::string& where) const {
        if (!j.is_object()) return unexpected<DecodeError>({where, "expected object"});
        return j;
    }
    json toJson(const json& v) const { return v; }
    void write(const json& v, json& out, const char* key) const { out[key] = v; }
};

// null on the wire <-> std::nullopt; nullopt is omitted when encoding.
template<class Inner>
struct Optional {
    using value_type = std::optional<typename Inner::value_type>;
    Inner inner{};

    expected<value_type, DecodeError>
    read(const json& j, const std::string& where) const {
        if (j.is_null()) return value_type{};
        auto v = inner.read(j, where);
        if (!v) return unexpected<DecodeError>(v.error());
        return value_type{std::move(*v)};
    }
    void write(const value_type& v, json& out, const char* key) const {
        if (v) inner.write(*v, out, key);
    }
};

template<class Inner>
Optional<Inner> optionalOf(Inner inner) { return Optional<Inner>{std::move(inner)}; }

// ============================================================================
// Field descriptor + helpers
// ============================================================================
template<auto MemberPtr, class Codec>
struct Field {
    // Expose the pointer-to-member so instances can use it.
    static constexpr auto memberPtr = MemberPtr;
    const char* name;
    Codec codec;
    bool required;
};

template<auto MemberPtr, class Codec>
Field<MemberPtr, Codec>
field(const char* name, Codec c) {
    return { name, c, false };
}

template<auto MemberPtr, class Codec>
Field<MemberPtr, Codec>
required(const char* name, Codec c) {
    return { name, c, true };
}

// ============================================================================
// Schema + makeSchema
// ============================================================================
template<class T, class FieldsTuple>
struct Schema {
    using value_type = T;
    FieldsTuple fields;
};

template<class T, class... FieldDescs>
Schema<T, std::tuple<FieldDescs...>>
makeSchema(std::tuple<FieldDescs...> fds) {
    return { std::move(fds) };
}

// ============================================================================
// decode / encode
// ============================================================================
template<class T, class FieldsTuple>
expected<T, DecodeError>
decode(const Schema<T, FieldsTuple>& sch, const json& j, const std::string& where = {}) {
    if (!j.is_object())
        return unexpected<DecodeError>({where.empty() ? "$" : where, "expected object"});

    T obj{};
    bool failed = false;
    DecodeError err;

    std::apply([&](auto const&... fd){
        ( ( [&](){
            if (failed) return;

            const auto path = childPath(where, fd.name);
            auto it = j.find(fd.name);
            if (it == j.end()) {
                if (fd.required) { failed = true; err = {path, "required field missing"}; }
                return;
            }

            auto raw = fd.codec.read(*it, path);
            if (!raw) { failed = true; err = raw.error(); return; }
            obj.*(fd.memberPtr) = std::move(*raw);
        }() ), ... );
    }, sch.fields);

    if (failed) return unexpected<DecodeError>(err);
    return obj;
}

template<class T, class FieldsTuple>
json encode(const Schema<T, FieldsTuple>& sch, const T& obj) {
    json out = json::object();
    std::apply([&](auto const&... fd){
        ( fd.codec.write(obj.*(fd.memberPtr), out, fd.name), ... );
    }, sch.fields);
    return out;
}

// ============================================================================
// Composite codecs (need decode/encode above)
// ============================================================================

// Nested record described by its own schema.
template<class SchemaT>
struct Record {
    using value_type = typename SchemaT::value_type;
    SchemaT schema;

    expected<value_type, DecodeError>
    read(const json& j, const std::string& where) const {
        return decode(schema, j, where);
    }
    json toJson(const value_type& v) const { return encode(schema, v); }
    void write(const value_type& v, json& out, const char* key) const { out[key] = toJson(v); }
};

template<class SchemaT>
Record<SchemaT> record(SchemaT schema) { return Record<SchemaT>{std::move(schema)}; }

// Homogeneous JSON array <-> std::vector.
template<class Inner>
struct ListOf {
    using value_type = std::vector<typename Inner::value_type>;
    Inner inner{};

    expected<value_type, DecodeError>
    read(const json& j, const std::string& where) const {
        if (!j.is_array()) return unexpected<DecodeError>({where, "expected array"});
        value_type out;
        out.reserve(j.size());
        for (std::size_t i = 0; i < j.size(); ++i) {
            auto v = inner.read(j[i], indexPath(where, i));
            if (!v) return unexpected<DecodeError>(v.error());
            out.push_back(std::move(*v));
        }
        return out;
    }
    json toJson(const value_type& values) const {
        json arr = json::array();
        for (const auto& v : values) arr.push_back(inner.toJson(v));
        return arr;
    }
    void write(const value_type& v, json& out, const char* key) const { out[key] = toJson(v); }
};

template<class Inner>
ListOf<Inner> listOf(Inner inner) { return ListOf<Inner>{std::move(inner)}; }

} // namespace ff1::schema
