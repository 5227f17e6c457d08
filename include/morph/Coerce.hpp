/**
 * @file Coerce.hpp
 * @brief Scalar coercion between source values and static scalar kinds
 *
 * Conversion matrix (rows marked "weak" require weakly typed input):
 *
 * | source              | target       | rule                                    |
 * |---------------------|--------------|-----------------------------------------|
 * | Int64/Uint64        | Int/Uint     | range checked, wraps in weak mode       |
 * | Float64             | Int/Uint     | truncates toward zero, range checked    |
 * | Int64/Uint64        | Float        | always                                  |
 * | Bool                | Int/Uint/Float | weak: false->0, true->1               |
 * | String              | Int/Uint/Float | weak: parsed, "" is 0                 |
 * | Int/Uint/Float      | Bool         | weak: non-zero is true                  |
 * | String              | Bool         | weak: 1 t T TRUE true True / 0 f F ...  |
 * | Bool/Int/Uint/Float | String       | weak: textual form, bools as "1"/"0"    |
 * | Bytes               | String       | always, raw bytes                       |
 * | String              | Bytes        | always, raw bytes                       |
 */

#ifndef MORPH_COERCE_HPP
#define MORPH_COERCE_HPP

#include "morph/Types.hpp"
#include "morph/Value.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace morph {
namespace coerce {

/**
 * @brief No conversion rule applies, or a parse/range check failed
 *
 * The message is phrased to follow a quoted location path.
 */
class Unconvertible : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Render a source value for error messages
 */
std::string display(const Value& in);

/**
 * @brief Standard "expected type" failure for @p in against @p target
 */
Unconvertible mismatch(const Value& in, const TypeInfo& target);

bool to_bool(const Value& in, const BoolType& target, bool weak);
std::int64_t to_int(const Value& in, const IntType& target, bool weak);
std::uint64_t to_uint(const Value& in, const UintType& target, bool weak);
/**
 * @brief Finite values beyond the target width (float32) always fail
 */
double to_float(const Value& in, const FloatType& target, bool weak);
std::string to_string(const Value& in, const TypeInfo& target, bool weak);

/**
 * @brief Raw bytes of a Bytes or String source
 */
std::vector<std::uint8_t> to_bytes(const Value& in, const TypeInfo& target);

/**
 * @brief Parse a signed integer literal with an optional 0x, 0o, 0b or 0 prefix
 * @return false if @p text is not a literal or does not fit in 64 bits
 */
bool parse_int(const std::string& text, std::int64_t& out);

/**
 * @brief Unsigned counterpart of parse_int; a sign is rejected
 */
bool parse_uint(const std::string& text, std::uint64_t& out);

/**
 * @brief Parse one of the recognized boolean literals
 */
bool parse_bool(const std::string& text, bool& out);

} // namespace coerce
} // namespace morph

#endif // MORPH_COERCE_HPP
