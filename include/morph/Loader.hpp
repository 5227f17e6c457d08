/**
 * @file Loader.hpp
 * @brief Source loading: JSON and TOML documents as Value trees
 *
 * Loaders produce the dynamic values the decoder consumes:
 * - JSON (using nlohmann::json), key order preserved
 * - TOML (using toml++), dates and times become strings
 */

#ifndef MORPH_LOADER_HPP
#define MORPH_LOADER_HPP

#include "morph/Value.hpp"

#include <string>

namespace morph {

/**
 * @brief Parse a JSON document held in memory
 *
 * @param text Document text
 * @param source Name reported in parse errors
 * @throws ParseError if the JSON syntax is invalid
 */
Value parse_json(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Parse a TOML document held in memory
 *
 * @throws ParseError if the TOML syntax is invalid
 */
Value parse_toml(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Load a JSON file
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file; tables become mappings
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a file, detecting the format by extension (.json or .toml)
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the file has syntax errors
 * @throws UnsupportedFormat for any other extension
 */
Value load_file(const std::string& path);

/**
 * @brief Lowercase extension including the dot (e.g. ".json"), empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace morph

#endif // MORPH_LOADER_HPP
