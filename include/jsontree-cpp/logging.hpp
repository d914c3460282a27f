/// @file logging.hpp
/// @brief The library's spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace jsontree_cpp {

/// Name under which the library logger is registered with spdlog.
inline constexpr auto logger_name = "jsontree";

/// The library logger.
///
/// If a logger named logger_name is already registered (for example one an
/// application set up with its own sinks) it is used as is. Otherwise one
/// is created on first use, writing to stderr at warn level.
auto logger() -> std::shared_ptr<spdlog::logger>;

/// Change the level of the library logger.
void set_log_level(spdlog::level::level_enum level);

}  // namespace jsontree_cpp
