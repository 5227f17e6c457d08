/**
 * @file Decoder.hpp
 * @brief Decoding of dynamic values into statically typed targets
 *
 * Usage:
 * ```cpp
 * Basic result;
 * result.Vuint = 100;
 * morph::decode(morph::Value::parse(R"({"vint": 42})"), &result);
 * // result.Vint == 42, result.Vuint == 100 (untouched fields are kept)
 * ```
 *
 * Field-level failures do not stop a decode call: every failing location is
 * reported at once through DecodeError. ConfigurationError and
 * NotAddressable abort the call immediately.
 */

#ifndef MORPH_DECODER_HPP
#define MORPH_DECODER_HPP

#include "morph/Any.hpp"
#include "morph/Errors.hpp"
#include "morph/Reflect.hpp"
#include "morph/Value.hpp"

#include <functional>
#include <set>
#include <string>

namespace morph {

/**
 * @brief Record of how source keys were consumed by one decode call
 *
 * Entries are dotted paths ("vfoo", "vbar.vstring"); keys captured by a
 * remain field appear in none of the sets.
 */
struct Metadata {
    /// Struct fields that received a source key
    std::set<std::string> keys;
    /// Source keys that no struct field consumed
    std::set<std::string> unused;
    /// Struct fields that received no source key
    std::set<std::string> unset;
};

/**
 * @brief Rewrites a non-nil source before it is decoded into @p target
 *
 * Throwing a std::exception reports a HookFailed error at that location.
 */
using DecodeHook = std::function<Value(const Value& source, const TypeInfo& target)>;

struct DecoderConfig {
    /// Enable the weak coercion rows (string<->number, scalar lifting, ...)
    bool weakly_typed_input = false;
    /// Match field names exactly only
    bool case_sensitive = false;
    /// Report source keys no field consumed as UnusedKeys errors
    bool error_unused = false;
    /// Report fields no source key reached as UnsetFields errors
    bool error_unset = false;
    /// Nil resets any target, and containers are rebuilt instead of merged
    bool zero_fields = false;
    DecodeHook decode_hook;
    /// Receives a copy of the metadata of every decode call, merged into it
    Metadata* metadata = nullptr;
};

/**
 * @brief Addressable storage slot plus its static type
 */
struct Target {
    void* slot = nullptr;
    const TypeInfo* type = nullptr;

    template <typename T>
    static Target of(T* ptr) {
        return Target{ptr, &type_of<T>()};
    }
};

class Decoder {
public:
    explicit Decoder(DecoderConfig config = {});

    const DecoderConfig& config() const noexcept { return config_; }

    /**
     * @brief Decode @p input into @p target, keeping target state the source does not cover
     *
     * @return Key consumption record
     * @throws NotAddressable if the target slot is null
     * @throws ConfigurationError if a struct type on the way has invalid annotations
     * @throws DecodeError with every field-level failure
     */
    Metadata decode(const Value& input, const Target& target) const;

    template <typename T>
    Metadata decode(const Value& input, T* result) const {
        return decode(input, Target::of(result));
    }

private:
    DecoderConfig config_;
};

/**
 * @brief Decode with @p config (strict, case-insensitive names by default)
 */
template <typename T>
Metadata decode(const Value& input, T* result, DecoderConfig config = {}) {
    return Decoder(std::move(config)).decode(input, Target::of(result));
}

/**
 * @brief Decode with weakly typed input enabled
 */
template <typename T>
Metadata weak_decode(const Value& input, T* result) {
    DecoderConfig config;
    config.weakly_typed_input = true;
    return Decoder(std::move(config)).decode(input, Target::of(result));
}

} // namespace morph

#endif // MORPH_DECODER_HPP
