/**
 * @file Encoder.hpp
 * @brief Conversion of statically typed values back into the Value model
 *
 * The inverse direction of the decoder, using the same field layout:
 * - Struct fields are emitted under their effective names
 * - squash fields and untagged embedded structs are inlined
 * - Entries of a remain mapping are spliced into the enclosing mapping
 * - omitempty fields are dropped when empty; skipped and hidden fields never appear
 * - std::vector<std::uint8_t> becomes Bytes
 * - Non-string mapping keys are stringified
 */

#ifndef MORPH_ENCODER_HPP
#define MORPH_ENCODER_HPP

#include "morph/Any.hpp"
#include "morph/Reflect.hpp"
#include "morph/Value.hpp"

namespace morph {

/**
 * @brief Encode the object at @p obj described by @p type
 * @throws ConfigurationError if a struct type on the way has invalid annotations
 */
Value encode(const void* obj, const TypeInfo& type);

template <typename T>
Value encode(const T& value) {
    return encode(static_cast<const void*>(&value), type_of<T>());
}

} // namespace morph

#endif // MORPH_ENCODER_HPP
