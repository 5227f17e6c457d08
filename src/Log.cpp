/**
 * @file Log.cpp
 * @brief Library logger registration
 */

#include "morph/Log.hpp"

namespace morph {

namespace {
    constexpr const char* logger_name = "morph";

    LoggerPtr make_logger() {
        if (auto existing = spdlog::get(logger_name)) {
            return existing;
        }

        auto created = spdlog::default_logger()->clone(logger_name);
        try {
            spdlog::register_logger(created);
        } catch (const spdlog::spdlog_ex&) {
            // Registered concurrently by someone else: use theirs
            if (auto existing = spdlog::get(logger_name)) {
                return existing;
            }
        }
        return created;
    }
}

LoggerPtr logger() {
    static const LoggerPtr instance = make_logger();
    return instance;
}

} // namespace morph
