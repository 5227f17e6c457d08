/**
 * @file Decoder.cpp
 * @brief Recursive decode dispatcher and container decoders
 */

#include "morph/Decoder.hpp"
#include "morph/Coerce.hpp"
#include "morph/Log.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>
#include <vector>

namespace morph {

namespace {

std::string join(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

std::string index(const std::string& path, std::size_t i) {
    return path + "[" + std::to_string(i) + "]";
}

std::string subscript(const std::string& path, const std::string& key) {
    return path + "[" + key + "]";
}

std::string quote(const std::string& path) {
    return "'" + path + "'";
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string join_list(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

/**
 * @brief Position encoded by a weak sequence key ("0", "1", ...)
 */
bool parse_position(const std::string& key, std::size_t& out) {
    if (key.empty() || key.size() > 18) return false;
    if (key.size() > 1 && key[0] == '0') return false;
    out = 0;
    for (char c : key) {
        if (c < '0' || c > '9') return false;
        out = out * 10 + static_cast<std::size_t>(c - '0');
    }
    return true;
}

bool is_byte_sequence(const SequenceType& type) {
    const auto& elem = type.element();
    return elem.kind() == Kind::Uint && static_cast<const UintType&>(elem).bits() == 8;
}

/**
 * @brief State of one decode call
 */
class Session {
public:
    Session(const DecoderConfig& config, Metadata& meta)
        : config_(config)
        , meta_(meta)
    {}

    std::vector<FieldError>& errors() noexcept { return errors_; }

    void decode(const std::string& path, const Value& in, void* slot, const TypeInfo& type) {
        if (in.is_null()) {
            decode_nil(slot, type);
            return;
        }

        if (!config_.decode_hook) {
            dispatch(path, in, slot, type);
            return;
        }

        Value hooked;
        if (!run_hook(path, in, type, hooked)) return;

        if (hooked.is_null()) {
            decode_nil(slot, type);
            return;
        }
        dispatch(path, hooked, slot, type);
    }

private:
    const DecoderConfig& config_;
    Metadata& meta_;
    std::vector<FieldError> errors_;

    bool weak() const noexcept { return config_.weakly_typed_input; }

    void fail(const std::string& path, ErrorKind kind, std::string message) {
        errors_.push_back(FieldError{path, kind, std::move(message)});
    }

    /**
     * @brief Apply the decode hook; a throwing hook records HookFailed and returns false
     */
    bool run_hook(const std::string& path, const Value& in, const TypeInfo& type, Value& out) {
        try {
            out = config_.decode_hook(in, type);
        } catch (const std::exception& e) {
            fail(path, ErrorKind::HookFailed,
                 "error decoding " + quote(path) + ": decode hook failed: " + e.what());
            return false;
        }
        return true;
    }

    void unconvertible(const std::string& path, const coerce::Unconvertible& e) {
        fail(path, ErrorKind::Unconvertible, quote(path) + " " + e.what());
    }

    void decode_nil(void* slot, const TypeInfo& type) {
        if (config_.zero_fields) {
            type.reset(slot);
            return;
        }

        switch (type.kind()) {
            case Kind::Pointer:
                static_cast<const PointerType&>(type).clear(slot);
                break;
            case Kind::Interface:
                static_cast<Any*>(slot)->reset();
                break;
            case Kind::Dynamic:
                *static_cast<Value*>(slot) = nullptr;
                break;
            default:
                // Other targets keep their current value
                break;
        }
    }

    void dispatch(const std::string& path, const Value& in, void* slot, const TypeInfo& type) {
        switch (type.kind()) {
            case Kind::Bool:
            case Kind::Int:
            case Kind::Uint:
            case Kind::Float:
            case Kind::String:
                decode_scalar(path, in, slot, type, weak());
                break;
            case Kind::Struct:
                decode_struct(path, in, slot, static_cast<const StructType&>(type));
                break;
            case Kind::Sequence:
                decode_sequence(path, in, slot, static_cast<const SequenceType&>(type));
                break;
            case Kind::Array:
                decode_array(path, in, slot, static_cast<const ArrayType&>(type));
                break;
            case Kind::Mapping:
                decode_map(path, in, slot, static_cast<const MapType&>(type));
                break;
            case Kind::Pointer:
                decode_pointer(path, in, slot, static_cast<const PointerType&>(type));
                break;
            case Kind::Interface:
                decode_interface(path, in, *static_cast<Any*>(slot));
                break;
            case Kind::Dynamic:
                *static_cast<Value*>(slot) = in;
                break;
        }
    }

    void decode_scalar(const std::string& path, const Value& in, void* slot,
                       const TypeInfo& type, bool weak) {
        try {
            switch (type.kind()) {
                case Kind::Bool: {
                    const auto& t = static_cast<const BoolType&>(type);
                    t.store(slot, coerce::to_bool(in, t, weak));
                    break;
                }
                case Kind::Int: {
                    const auto& t = static_cast<const IntType&>(type);
                    t.store(slot, coerce::to_int(in, t, weak));
                    break;
                }
                case Kind::Uint: {
                    const auto& t = static_cast<const UintType&>(type);
                    t.store(slot, coerce::to_uint(in, t, weak));
                    break;
                }
                case Kind::Float: {
                    const auto& t = static_cast<const FloatType&>(type);
                    t.store(slot, coerce::to_float(in, t, weak));
                    break;
                }
                default:
                    *static_cast<std::string*>(slot) = coerce::to_string(in, type, weak);
                    break;
            }
        } catch (const coerce::Unconvertible& e) {
            unconvertible(path, e);
        }
    }

    // -- structs --------------------------------------------------------

    /**
     * @brief Walk @p route from @p slot, allocating empty embedded pointers
     */
    static void* locate(void* slot, const std::vector<const FieldInfo*>& route) {
        void* obj = slot;
        for (std::size_t i = 0; i + 1 < route.size(); ++i) {
            const FieldInfo& embedded = *route[i];
            obj = embedded.access(obj);
            if (embedded.type->kind() == Kind::Pointer) {
                const auto& ptr = static_cast<const PointerType&>(*embedded.type);
                void* pointee = ptr.get(obj);
                obj = pointee ? pointee : ptr.allocate(obj);
            }
        }
        return route.back()->access(obj);
    }

    void decode_struct(const std::string& path, const Value& in, void* slot, const StructType& type) {
        if (!in.is_object()) {
            fail(path, ErrorKind::Unconvertible,
                 quote(path) + " expected a mapping, got '" + kind_name(in) + "'");
            return;
        }

        const StructLayout& layout = type.layout();
        logger()->trace("decoding {} into {}", path.empty() ? "<root>" : path, type.name());

        // Case-insensitive lookup keeps the first key in source order
        std::map<std::string, std::string> folded;
        if (!config_.case_sensitive) {
            for (auto it = in.begin(); it != in.end(); ++it) {
                folded.emplace(lower(it.key()), it.key());
            }
        }

        std::set<std::string> used;
        std::vector<std::string> unset;

        for (std::size_t i = 0; i < layout.bindings.size(); ++i) {
            if (layout.remain && *layout.remain == i) continue;

            const FieldBinding& binding = layout.bindings[i];
            const std::string* key = match(in, folded, binding);
            if (key == nullptr) {
                if (!binding.alias) {
                    unset.push_back(binding.key);
                }
                continue;
            }

            used.insert(*key);
            const std::string field_path = join(path, binding.key);
            meta_.keys.insert(field_path);
            decode(field_path, in[*key], locate(slot, binding.route), *binding.field().type);
        }

        std::vector<std::string> unused;
        for (auto it = in.begin(); it != in.end(); ++it) {
            if (used.count(it.key()) == 0) {
                unused.push_back(it.key());
            }
        }
        std::sort(unused.begin(), unused.end());

        if (layout.remain) {
            if (!unused.empty()) {
                const FieldBinding& binding = layout.bindings[*layout.remain];
                collect_remainder(join(path, binding.key), in, unused,
                                  locate(slot, binding.route),
                                  static_cast<const MapType&>(*binding.field().type));
            }
        } else if (!unused.empty()) {
            for (const auto& key : unused) {
                meta_.unused.insert(join(path, key));
            }
            if (config_.error_unused) {
                fail(path, ErrorKind::UnusedKeys,
                     quote(path) + " has invalid keys: " + join_list(unused));
            }
        }

        if (!unset.empty()) {
            for (const auto& key : unset) {
                meta_.unset.insert(join(path, key));
            }
            if (config_.error_unset) {
                std::sort(unset.begin(), unset.end());
                fail(path, ErrorKind::UnsetFields,
                     quote(path) + " has unset fields: " + join_list(unset));
            }
        }
    }

    /**
     * @brief Source key bound to @p binding, or nullptr
     *
     * Exact matches on the declared then the member name win over
     * case-insensitive ones.
     */
    const std::string* match(const Value& in,
                             const std::map<std::string, std::string>& folded,
                             const FieldBinding& binding) const {
        const FieldInfo& field = binding.field();
        const std::string* names[2] = {&binding.key, binding.alias ? &binding.key : &field.name};

        for (const std::string* name : names) {
            auto it = in.find(*name);
            if (it != in.end()) return &it.key();
        }
        if (config_.case_sensitive) return nullptr;

        for (const std::string* name : names) {
            auto it = folded.find(lower(*name));
            if (it != folded.end()) return &it->second;
        }
        return nullptr;
    }

    void collect_remainder(const std::string& path, const Value& in,
                           const std::vector<std::string>& keys, void* slot, const MapType& type) {
        for (const auto& key : keys) {
            insert_entry(subscript(path, key), key, in[key], slot, type);
        }
    }

    // -- sequences and arrays --------------------------------------------

    /**
     * @brief Normalize @p in to a list of elements for a sequence-like target
     * @return false after reporting an error
     */
    bool elements(const std::string& path, const Value& in, const TypeInfo& type,
                  std::vector<const Value*>& out) {
        if (in.is_array()) {
            out.reserve(in.size());
            for (const auto& item : in) out.push_back(&item);
            return true;
        }

        if (!weak()) {
            fail(path, ErrorKind::Unconvertible,
                 quote(path) + ": source data must be a sequence for " + type.name() +
                 ", got " + kind_name(in));
            return false;
        }

        if (in.is_object()) {
            out.assign(in.size(), nullptr);
            for (auto it = in.begin(); it != in.end(); ++it) {
                std::size_t pos = 0;
                if (!parse_position(it.key(), pos) || pos >= out.size()) {
                    fail(path, ErrorKind::Unconvertible,
                         quote(path) + ": cannot decode mapping into " + type.name() +
                         ": key '" + it.key() + "' is not a sequence position");
                    return false;
                }
                out[pos] = &it.value();
            }
            return true;
        }

        logger()->debug("weak conversion of {} to single-element {}", kind_name(in), type.name());
        out.push_back(&in);
        return true;
    }

    void decode_sequence(const std::string& path, const Value& in, void* slot, const SequenceType& type) {
        if (is_byte_sequence(type) && (in.is_binary() || in.is_string())) {
            const auto bytes = coerce::to_bytes(in, type);
            type.resize(slot, 0);
            type.resize(slot, bytes.size());
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                static_cast<const UintType&>(type.element()).store(type.at(slot, i), bytes[i]);
            }
            return;
        }

        std::vector<const Value*> items;
        if (!elements(path, in, type, items)) return;

        if (config_.zero_fields) {
            type.resize(slot, 0);
        }
        type.resize(slot, items.size());
        for (std::size_t i = 0; i < items.size(); ++i) {
            decode(index(path, i), *items[i], type.at(slot, i), type.element());
        }
    }

    void decode_array(const std::string& path, const Value& in, void* slot, const ArrayType& type) {
        std::vector<const Value*> items;
        if (!elements(path, in, type, items)) return;

        if (items.size() > type.length()) {
            fail(path, ErrorKind::ArrayLengthMismatch,
                 quote(path) + ": expected source data to have length less or equal to " +
                 std::to_string(type.length()) + ", got " + std::to_string(items.size()));
            return;
        }

        if (config_.zero_fields) {
            type.reset(slot);
        }
        for (std::size_t i = 0; i < items.size(); ++i) {
            decode(index(path, i), *items[i], type.at(slot, i), type.element());
        }
    }

    // -- mappings ---------------------------------------------------------

    void decode_map(const std::string& path, const Value& in, void* slot, const MapType& type) {
        if (in.is_array() && weak()) {
            logger()->debug("weak conversion of sequence to {}", type.name());
            if (config_.zero_fields) type.clear(slot);
            for (std::size_t i = 0; i < in.size(); ++i) {
                const std::string key = std::to_string(i);
                insert_entry(subscript(path, key), key, in[i], slot, type);
            }
            return;
        }

        if (!in.is_object()) {
            fail(path, ErrorKind::Unconvertible,
                 quote(path) + " expected a mapping, got '" + kind_name(in) + "'");
            return;
        }

        if (config_.zero_fields) type.clear(slot);
        for (auto it = in.begin(); it != in.end(); ++it) {
            insert_entry(subscript(path, it.key()), it.key(), it.value(), slot, type);
        }
    }

    /**
     * @brief Decode one entry into fresh key/value storage and insert it if both decoded
     */
    void insert_entry(const std::string& path, const std::string& key, const Value& value,
                      void* slot, const MapType& type) {
        const std::size_t before = errors_.size();

        auto key_obj = type.key().create();
        decode_key(path, key, key_obj.get(), type.key());

        auto value_obj = type.value().create();
        decode(path, value, value_obj.get(), type.value());

        if (errors_.size() == before) {
            type.insert(slot, key_obj.get(), value_obj.get());
        }
    }

    /**
     * @brief Source keys are always strings: scalar keys pass the hook, then parse in weak mode
     */
    void decode_key(const std::string& path, const std::string& key, void* slot, const TypeInfo& type) {
        switch (type.kind()) {
            case Kind::Bool:
            case Kind::Int:
            case Kind::Uint:
            case Kind::Float:
            case Kind::String: {
                Value source(key);
                if (config_.decode_hook) {
                    Value hooked;
                    if (!run_hook(path, source, type, hooked)) return;
                    if (hooked.is_null()) {
                        decode_nil(slot, type);
                        return;
                    }
                    source = std::move(hooked);
                }
                decode_scalar(path, source, slot, type, true);
                break;
            }
            default:
                decode(path, Value(key), slot, type);
                break;
        }
    }

    // -- indirection ------------------------------------------------------

    void decode_pointer(const std::string& path, const Value& in, void* slot, const PointerType& type) {
        void* pointee = type.get(slot);
        if (pointee && !config_.zero_fields) {
            decode(path, in, pointee, type.pointee());
            return;
        }

        auto fresh = type.pointee().create();
        const std::size_t before = errors_.size();
        decode(path, in, fresh.get(), type.pointee());
        if (errors_.size() == before) {
            type.adopt(slot, fresh.get());
        }
    }

    void decode_interface(const std::string& path, const Value& in, Any& target) {
        switch (target.state()) {
            case Any::State::Empty:
                target = Any(in);
                break;

            case Any::State::Reference:
                decode(path, in, target.data(), *target.type());
                break;

            case Any::State::Holding: {
                const TypeInfo& held = *target.type();
                auto copy = held.create();
                held.assign(copy.get(), target.data());

                const std::size_t before = errors_.size();
                decode(path, in, copy.get(), held);
                if (errors_.size() == before) {
                    target = Any::adopt(held, std::move(copy));
                }
                break;
            }
        }
    }
};

} // namespace

Decoder::Decoder(DecoderConfig config)
    : config_(std::move(config))
{}

Metadata Decoder::decode(const Value& input, const Target& target) const {
    if (target.type == nullptr) {
        throw NotAddressable("target");
    }
    if (target.slot == nullptr) {
        throw NotAddressable(target.type->name());
    }

    Metadata meta;
    Session session(config_, meta);
    session.decode("", input, target.slot, *target.type);

    if (config_.metadata) {
        config_.metadata->keys.insert(meta.keys.begin(), meta.keys.end());
        config_.metadata->unused.insert(meta.unused.begin(), meta.unused.end());
        config_.metadata->unset.insert(meta.unset.begin(), meta.unset.end());
    }

    auto& errors = session.errors();
    if (!errors.empty()) {
        logger()->debug("decoding into {} failed with {} error(s)", target.type->name(), errors.size());
        throw DecodeError(std::move(errors));
    }
    return meta;
}

} // namespace morph
