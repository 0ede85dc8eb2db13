#include <jsondiff-cpp/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace jsondiff_cpp {

auto logger() -> std::shared_ptr<spdlog::logger> {
    static auto instance = [] {
        auto name = std::string{logger_name};
        if (auto existing = spdlog::get(name)) return existing;
        auto created = spdlog::stderr_color_mt(name);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

}  // namespace jsondiff_cpp
