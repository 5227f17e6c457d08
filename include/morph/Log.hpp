/**
 * @file Log.hpp
 * @brief Library logger
 *
 * morph logs through an spdlog logger named "morph". If the application
 * registered a logger under that name it is used as-is; otherwise a clone of
 * the default logger (same sinks) is registered on first use. Levels follow
 * the usual spdlog controls (spdlog::set_level, or SPDLOG_LEVEL=morph=debug
 * once the application calls spdlog::cfg::load_env_levels()).
 */

#ifndef MORPH_LOG_HPP
#define MORPH_LOG_HPP

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace morph {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/**
 * @brief Get the "morph" logger, registering it on first use
 */
LoggerPtr logger();

} // namespace morph

#endif // MORPH_LOG_HPP
