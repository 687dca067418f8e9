//
// Created by usatiynyan.
//

#pragma once

#include <sl/meta/monad/maybe.hpp>

#include <spdlog/spdlog.h>

#include <memory>

namespace sl::rx::log {

struct config {
    std::shared_ptr<spdlog::logger> logger; // nullptr means default stderr logger named "sl.rx"
    spdlog::level::level_enum level;

    // SL_RX_LOG_LEVEL, accepts spdlog level names
    static meta::maybe<config> from_env();
    static config with_level(spdlog::level::level_enum level);
};

std::shared_ptr<spdlog::logger> logger();

void configure(config a_config);

} // namespace sl::rx::log
