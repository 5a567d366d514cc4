/// @file log.hpp
/// @brief Control of the library's spdlog logger.

#pragma once

#include <spdlog/common.h>

#include <string_view>

namespace collab_text {

/// Name under which the library logger is registered with spdlog.
inline constexpr std::string_view logger_name = "collab_text";

/// Set the level of the library logger (default: warn).
void set_log_level(spdlog::level::level_enum level);

/// Current level of the library logger.
auto log_level() -> spdlog::level::level_enum;

}  // namespace collab_text
