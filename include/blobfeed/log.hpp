#pragma once

/** \file log.hpp
 *  \brief Library logger (spdlog). One named logger, "blobfeed", shared by all components.
 *
 * Level comes from BLOBFEED_LOG_LEVEL (trace|debug|info|warn|error|off), default info.
 * Applications that install their own sink call set_logger() before constructing components.
 */

#include <memory>

#include <spdlog/spdlog.h>

namespace blobfeed::log {

/** \brief Returns the library logger, creating a stderr logger on first use. */
auto get() -> std::shared_ptr<spdlog::logger>;

/** \brief Replaces the library logger (e.g., to route into an application sink). */
void set_logger(std::shared_ptr<spdlog::logger> logger);

} // namespace blobfeed::log

#define BLOBFEED_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::blobfeed::log::get(), __VA_ARGS__)
#define BLOBFEED_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::blobfeed::log::get(), __VA_ARGS__)
#define BLOBFEED_LOG_INFO(...) SPDLOG_LOGGER_INFO(::blobfeed::log::get(), __VA_ARGS__)
#define BLOBFEED_LOG_WARN(...) SPDLOG_LOGGER_WARN(::blobfeed::log::get(), __VA_ARGS__)
#define BLOBFEED_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::blobfeed::log::get(), __VA_ARGS__)
