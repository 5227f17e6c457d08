#include <cxxopts.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

#include "Inspect.hpp"
#include "morph/Log.hpp"

using namespace morph;

int main(int argc, char** argv) {
    // Log lines go to stderr; stdout carries the decoded document
    spdlog::set_default_logger(spdlog::stderr_color_mt("morph-cli"));

    DecoderConfig config;
    std::string file;

    try {
        cxxopts::Options options("morph-cli", "Decode a JSON/TOML file into the ServiceConfig schema");
        options.positional_help("FILE");

        options.add_options()
            ("weak", "Enable weakly typed input", cxxopts::value<bool>()->default_value("false"))
            ("case-sensitive", "Match field names exactly", cxxopts::value<bool>()->default_value("false"))
            ("error-unused", "Fail on source keys no field consumes", cxxopts::value<bool>()->default_value("false"))
            ("error-unset", "Fail on fields no source key reaches", cxxopts::value<bool>()->default_value("false"))
            ("log-level", "trace, debug, info, warn, error, critical or off",
             cxxopts::value<std::string>()->default_value("warn"))
            ("file", "Source file (.json or .toml)", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.parse_positional({"file"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }
        if (!result.count("file")) {
            std::cerr << "Error: missing FILE\n" << options.help() << "\n";
            return 2;
        }

        file = result["file"].as<std::string>();
        config.weakly_typed_input = result["weak"].as<bool>();
        config.case_sensitive = result["case-sensitive"].as<bool>();
        config.error_unused = result["error-unused"].as<bool>();
        config.error_unset = result["error-unset"].as<bool>();

        const auto level = spdlog::level::from_str(result["log-level"].as<std::string>());
        spdlog::set_level(level);
        logger()->set_level(level);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 2;
    }

    return cli::inspect(file, config, std::cout, std::cerr);
}
