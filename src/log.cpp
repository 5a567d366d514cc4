#include <collab-text/log.hpp>

#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>

namespace collab_text {

namespace detail {

auto logger() -> spdlog::logger& {
    static const auto instance = [] {
        const auto name = std::string{logger_name};
        // The host may have registered its own logger under our name.
        if (auto existing = spdlog::get(name)) return existing;
        auto created = spdlog::stderr_color_mt(name);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return *instance;
}

}  // namespace detail

void set_log_level(spdlog::level::level_enum level) {
    detail::logger().set_level(level);
}

auto log_level() -> spdlog::level::level_enum {
    return detail::logger().level();
}

}  // namespace collab_text
