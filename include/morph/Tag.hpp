/**
 * @file Tag.hpp
 * @brief Per-field annotation parsing
 *
 * Annotation syntax:  name[,option[,option...]]
 * - "-" as the whole annotation skips the field entirely
 * - an empty name keeps the declared field name
 * - recognized options: squash, remain, omitempty (others are ignored)
 *
 * Examples:
 * - ""                    → {}
 * - "vunique"             → {name: "vunique"}
 * - ",squash"             → {squash}
 * - "extra,remain"        → {name: "extra", remain}
 * - "bar,what,what"       → {name: "bar"}
 * - "-"                   → {skip}
 */

#ifndef MORPH_TAG_HPP
#define MORPH_TAG_HPP

#include <optional>
#include <string>

namespace morph {

/**
 * @brief Metadata derived from one field's annotation
 */
struct FieldSpec {
    /// Name declared in the annotation, if any
    std::optional<std::string> name;
    bool skip = false;
    bool squash = false;
    bool remain = false;
    bool omit_empty = false;
    /// Unexported fields are never matched, populated or encoded
    bool exported = true;
};

/**
 * @brief Parse an annotation string into a FieldSpec
 *
 * Parsing never fails: whitespace around segments is trimmed and unknown
 * options are ignored.
 */
FieldSpec parse_tag(const std::string& tag);

} // namespace morph

#endif // MORPH_TAG_HPP
