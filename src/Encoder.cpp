/**
 * @file Encoder.cpp
 * @brief Implementation of struct to Value encoding
 */

#include "morph/Encoder.hpp"

#include <cstdint>
#include <vector>

namespace morph {

namespace {

std::string key_string(const void* key, const TypeInfo& type) {
    if (type.kind() == Kind::String) {
        return *static_cast<const std::string*>(key);
    }
    Value encoded = encode(key, type);
    return encoded.is_string() ? encoded.get<std::string>() : encoded.dump();
}

void encode_fields(Value& out, const void* obj, const StructType& type) {
    for (const auto& field : type.layout().fields) {
        if (field.spec.skip || !field.spec.exported) continue;

        const void* member = field.access_const(obj);

        if (promotes(field)) {
            if (field.type->kind() == Kind::Pointer) {
                member = static_cast<const PointerType&>(*field.type).get(member);
                if (member == nullptr) continue;
            }
            encode_fields(out, member, *squash_target(*field.type));
            continue;
        }

        if (field.spec.remain) {
            Value extra = encode(member, *field.type);
            for (auto it = extra.begin(); it != extra.end(); ++it) {
                if (!out.contains(it.key())) {
                    out[it.key()] = it.value();
                }
            }
            continue;
        }

        if (field.spec.omit_empty && field.type->is_empty(member)) continue;

        out[field.spec.name.value_or(field.name)] = encode(member, *field.type);
    }
}

} // namespace

Value encode(const void* obj, const TypeInfo& type) {
    switch (type.kind()) {
        case Kind::Bool:
            return static_cast<const BoolType&>(type).load(obj);
        case Kind::Int:
            return static_cast<const IntType&>(type).load(obj);
        case Kind::Uint:
            return static_cast<const UintType&>(type).load(obj);
        case Kind::Float:
            return static_cast<const FloatType&>(type).load(obj);
        case Kind::String:
            return *static_cast<const std::string*>(obj);

        case Kind::Struct: {
            Value out = Value::object();
            encode_fields(out, obj, static_cast<const StructType&>(type));
            return out;
        }

        case Kind::Sequence: {
            const auto& seq = static_cast<const SequenceType&>(type);
            const auto& elem = seq.element();
            const std::size_t n = seq.size(obj);

            if (elem.kind() == Kind::Uint && static_cast<const UintType&>(elem).bits() == 8) {
                std::vector<std::uint8_t> bytes(n);
                for (std::size_t i = 0; i < n; ++i) {
                    bytes[i] = static_cast<std::uint8_t>(static_cast<const UintType&>(elem).load(seq.at(obj, i)));
                }
                return Value::binary(std::move(bytes));
            }

            Value out = Value::array();
            for (std::size_t i = 0; i < n; ++i) {
                out.push_back(encode(seq.at(obj, i), elem));
            }
            return out;
        }

        case Kind::Array: {
            const auto& arr = static_cast<const ArrayType&>(type);
            Value out = Value::array();
            for (std::size_t i = 0; i < arr.length(); ++i) {
                out.push_back(encode(arr.at(obj, i), arr.element()));
            }
            return out;
        }

        case Kind::Mapping: {
            const auto& map = static_cast<const MapType&>(type);
            Value out = Value::object();
            map.for_each(obj, [&](const void* key, const void* value) {
                out[key_string(key, map.key())] = encode(value, map.value());
            });
            return out;
        }

        case Kind::Pointer: {
            const auto& ptr = static_cast<const PointerType&>(type);
            const void* pointee = ptr.get(obj);
            return pointee ? encode(pointee, ptr.pointee()) : Value();
        }

        case Kind::Interface: {
            const auto& any = *static_cast<const Any*>(obj);
            return any.empty() ? Value() : encode(any.data(), *any.type());
        }

        case Kind::Dynamic:
            return *static_cast<const Value*>(obj);
    }
    return Value();
}

} // namespace morph
