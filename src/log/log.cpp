//
// Created by usatiynyan.
//

#include "sl/rx/log/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstdlib>
#include <memory>
#include <string_view>

namespace sl::rx::log {
namespace {

constexpr const char* logger_name = "sl.rx";
constexpr const char* level_env = "SL_RX_LOG_LEVEL";
constexpr spdlog::level::level_enum default_level = spdlog::level::warn;

std::shared_ptr<spdlog::logger> make_default_logger() {
    return std::make_shared<spdlog::logger>(logger_name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
}

std::shared_ptr<spdlog::logger> make_initial_logger() {
    auto a_logger = make_default_logger();
    a_logger->set_level(config::from_env().map([](const config& env) { return env.level; }).value_or(default_level));
    return a_logger;
}

std::atomic<std::shared_ptr<spdlog::logger>>& current_logger() {
    static std::atomic<std::shared_ptr<spdlog::logger>> instance{ make_initial_logger() };
    return instance;
}

} // namespace

meta::maybe<config> config::from_env() {
    const char* const value = std::getenv(level_env);
    if (value == nullptr) {
        return tl::nullopt;
    }
    const spdlog::level::level_enum level = spdlog::level::from_str(value);
    if (level == spdlog::level::off && std::string_view{ value } != "off") {
        return tl::nullopt;
    }
    return config{ .logger = nullptr, .level = level };
}

config config::with_level(spdlog::level::level_enum level) {
    return config{ .logger = nullptr, .level = level };
}

std::shared_ptr<spdlog::logger> logger() { return current_logger().load(std::memory_order::acquire); }

void configure(config a_config) {
    std::shared_ptr<spdlog::logger> a_logger =
        a_config.logger != nullptr ? std::move(a_config.logger) : make_default_logger();
    a_logger->set_level(a_config.level);
    current_logger().store(std::move(a_logger), std::memory_order::release);
}

} // namespace sl::rx::log
