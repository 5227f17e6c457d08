/**
 * @file Value.hpp
 * @brief Dynamic value model consumed by the decoder
 *
 * Uses nlohmann::ordered_json as the underlying value model to support:
 * - Nil
 * - Bool (true | false)
 * - Int64 / Uint64
 * - Float64 (double)
 * - String (std::string, UTF-8)
 * - Bytes (binary)
 * - Sequence ([Value, ...])
 * - Mapping ({String: Value, ...}, insertion ordered)
 */

#ifndef MORPH_VALUE_HPP
#define MORPH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace morph {

/**
 * @brief Dynamic value tree handed to the decoder
 *
 * An alias for nlohmann::ordered_json so that mapping keys keep the order
 * in which the parser produced them. Keys are unique strings.
 *
 * See nlohmann::json documentation for the complete API.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Closed set of source value variants
 */
enum class ValueKind {
    Nil,
    Bool,
    Int64,
    Uint64,
    Float64,
    String,
    Bytes,
    Sequence,
    Mapping,
    Opaque
};

/**
 * @brief Classify a Value into its variant
 */
inline ValueKind kind_of(const Value& val) noexcept {
    switch (val.type()) {
        case Value::value_t::null: return ValueKind::Nil;
        case Value::value_t::boolean: return ValueKind::Bool;
        case Value::value_t::number_integer: return ValueKind::Int64;
        case Value::value_t::number_unsigned: return ValueKind::Uint64;
        case Value::value_t::number_float: return ValueKind::Float64;
        case Value::value_t::string: return ValueKind::String;
        case Value::value_t::binary: return ValueKind::Bytes;
        case Value::value_t::array: return ValueKind::Sequence;
        case Value::value_t::object: return ValueKind::Mapping;
        default: return ValueKind::Opaque;
    }
}

/**
 * @brief Human-readable name of a value variant
 * @return e.g. "nil", "bool", "int64", "string", "mapping"
 */
inline const char* kind_name(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Nil: return "nil";
        case ValueKind::Bool: return "bool";
        case ValueKind::Int64: return "int64";
        case ValueKind::Uint64: return "uint64";
        case ValueKind::Float64: return "float64";
        case ValueKind::String: return "string";
        case ValueKind::Bytes: return "bytes";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Mapping: return "mapping";
        case ValueKind::Opaque: break;
    }
    return "opaque";
}

inline const char* kind_name(const Value& val) noexcept {
    return kind_name(kind_of(val));
}

/**
 * @brief Check if value is a container (sequence or mapping)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace morph

#endif // MORPH_VALUE_HPP
