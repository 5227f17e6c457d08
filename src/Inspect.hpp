/**
 * @file Inspect.hpp
 * @brief morph-cli internals: the ServiceConfig schema and the inspect command
 *
 * Kept apart from cli_main.cpp so the tests can drive the command without
 * spawning the binary.
 */

#ifndef MORPH_INSPECT_HPP
#define MORPH_INSPECT_HPP

#include "morph/Decoder.hpp"

#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace morph {
namespace cli {

struct Listener {
    std::string host = "0.0.0.0";
    std::uint16_t port = 8080;
};

struct Tls {
    std::string cert;
    std::string key;
    bool verify_peer = true;
};

struct Limits {
    std::uint32_t max_connections = 1024;
    double timeout_seconds = 30.0;
};

struct Endpoint {
    std::string path;
    std::vector<std::string> methods;
    std::optional<std::int32_t> weight;
};

/**
 * @brief Schema decoded by morph-cli
 *
 * limits is squashed: its keys sit at the top level of the source. Keys
 * no field claims are kept in extra.
 */
struct ServiceConfig {
    std::string name;
    Listener listener;
    std::shared_ptr<Tls> tls;
    Limits limits;
    std::map<std::string, Endpoint> endpoints;
    std::vector<std::string> tags;
    std::map<std::string, Value> extra;
};

void describe(StructBuilder<Listener>& b);
void describe(StructBuilder<Tls>& b);
void describe(StructBuilder<Limits>& b);
void describe(StructBuilder<Endpoint>& b);
void describe(StructBuilder<ServiceConfig>& b);

/**
 * @brief Decode the source file at @p path into a ServiceConfig and report it
 *
 * Writes the re-encoded result and the key metadata to @p out, and failures
 * to @p err.
 *
 * @return 0 on success, 1 on decode errors, 2 on loading or configuration errors
 */
int inspect(const std::string& path, const DecoderConfig& config, std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace morph

#endif // MORPH_INSPECT_HPP
