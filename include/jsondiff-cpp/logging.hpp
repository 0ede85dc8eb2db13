/// @file logging.hpp
/// @brief Access to the library's spdlog logger.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace jsondiff_cpp {

/// Name under which the logger is registered with spdlog.
inline constexpr std::string_view logger_name = "jsondiff";

/// The library logger.
///
/// Reuses a logger already registered under `logger_name`; otherwise
/// creates a stderr logger at level `warn`, so the library stays silent
/// until a caller lowers the level:
///
/// @code
/// jsondiff_cpp::set_log_level(spdlog::level::debug);
/// @endcode
auto logger() -> std::shared_ptr<spdlog::logger>;

/// Set the level of the library logger.
void set_log_level(spdlog::level::level_enum level);

}  // namespace jsondiff_cpp
