/**
 * @file Inspect.cpp
 * @brief ServiceConfig registration and the inspect command
 */

#include "Inspect.hpp"

#include "morph/Encoder.hpp"
#include "morph/Loader.hpp"
#include "morph/Log.hpp"

#include <ostream>

namespace morph {
namespace cli {

void describe(StructBuilder<Listener>& b) {
    b.field("Host", &Listener::host, "host");
    b.field("Port", &Listener::port, "port");
}

void describe(StructBuilder<Tls>& b) {
    b.field("Cert", &Tls::cert, "cert");
    b.field("Key", &Tls::key, "key");
    b.field("VerifyPeer", &Tls::verify_peer, "verify_peer");
}

void describe(StructBuilder<Limits>& b) {
    b.field("MaxConnections", &Limits::max_connections, "max_connections");
    b.field("TimeoutSeconds", &Limits::timeout_seconds, "timeout_seconds");
}

void describe(StructBuilder<Endpoint>& b) {
    b.field("Path", &Endpoint::path, "path");
    b.field("Methods", &Endpoint::methods, "methods,omitempty");
    b.field("Weight", &Endpoint::weight, "weight,omitempty");
}

void describe(StructBuilder<ServiceConfig>& b) {
    b.field("Name", &ServiceConfig::name, "name");
    b.field("Listener", &ServiceConfig::listener, "listener");
    b.field("Tls", &ServiceConfig::tls, "tls,omitempty");
    b.embed("Limits", &ServiceConfig::limits, ",squash");
    b.field("Endpoints", &ServiceConfig::endpoints, "endpoints,omitempty");
    b.field("Tags", &ServiceConfig::tags, "tags,omitempty");
    b.field("Extra", &ServiceConfig::extra, ",remain");
}

namespace {
    void print_set(std::ostream& out, const char* label, const std::set<std::string>& items) {
        out << label << ":";
        for (const auto& item : items) {
            out << " " << item;
        }
        out << "\n";
    }
}

int inspect(const std::string& path, const DecoderConfig& config, std::ostream& out, std::ostream& err) {
    Value source;
    try {
        source = load_file(path);
    } catch (const Error& e) {
        err << "Error: " << e.what() << "\n";
        return 2;
    }

    ServiceConfig result;
    Metadata meta;
    try {
        meta = Decoder(config).decode(source, &result);
    } catch (const DecodeError& e) {
        err << e.what() << "\n";
        return 1;
    } catch (const ConfigurationError& e) {
        err << "Error: " << e.what() << "\n";
        return 2;
    }

    logger()->info("decoded {} into {}", path, type_of<ServiceConfig>().name());
    out << encode(result).dump(2) << "\n";
    print_set(out, "matched", meta.keys);
    print_set(out, "unused", meta.unused);
    print_set(out, "unset", meta.unset);
    return 0;
}

} // namespace cli
} // namespace morph
