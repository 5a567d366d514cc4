#pragma once

// Library logger. Registered with spdlog as "collab_text" on first use,
// writing to stderr at level warn unless the host changes it.
// Internal header — not installed.

#include <spdlog/spdlog.h>

namespace collab_text::detail {

auto logger() -> spdlog::logger&;

}  // namespace collab_text::detail
