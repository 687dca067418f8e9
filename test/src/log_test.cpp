//
// Created by usatiynyan.
//

#include "test_support.hpp"

#include "sl/rx/log/log.hpp"
#include "sl/rx/observer/weak.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>

namespace sl::rx::log {

TEST(log, fromEnvParsesLevel) {
    ASSERT_EQ(::setenv("SL_RX_LOG_LEVEL", "debug", 1), 0);
    const meta::maybe<config> maybe_config = config::from_env();
    ASSERT_TRUE(maybe_config.has_value());
    ASSERT_EQ(maybe_config->level, spdlog::level::debug);
    ASSERT_EQ(maybe_config->logger, nullptr);
    ASSERT_EQ(::unsetenv("SL_RX_LOG_LEVEL"), 0);
}

TEST(log, fromEnvAcceptsOff) {
    ASSERT_EQ(::setenv("SL_RX_LOG_LEVEL", "off", 1), 0);
    const meta::maybe<config> maybe_config = config::from_env();
    ASSERT_TRUE(maybe_config.has_value());
    ASSERT_EQ(maybe_config->level, spdlog::level::off);
    ASSERT_EQ(::unsetenv("SL_RX_LOG_LEVEL"), 0);
}

TEST(log, fromEnvRejectsUnknownLevel) {
    ASSERT_EQ(::setenv("SL_RX_LOG_LEVEL", "loud", 1), 0);
    ASSERT_FALSE(config::from_env().has_value());
    ASSERT_EQ(::unsetenv("SL_RX_LOG_LEVEL"), 0);
}

TEST(log, fromEnvMissing) {
    ASSERT_EQ(::unsetenv("SL_RX_LOG_LEVEL"), 0);
    ASSERT_FALSE(config::from_env().has_value());
}

TEST(log, withLevelUsesDefaultLogger) {
    configure(config::with_level(spdlog::level::err));
    ASSERT_EQ(logger()->name(), "sl.rx");
    ASSERT_EQ(logger()->level(), spdlog::level::err);
    configure(config::with_level(spdlog::level::warn));
}

TEST(log, configuredLoggerReceivesEvents) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    configure(config{ .logger = std::make_shared<spdlog::logger>("test", sink), .level = spdlog::level::debug });

    auto target = std::make_shared<test::recorder>();
    const auto an_observer = make_weak_observer<int>(target, [](test::recorder&, int&&) {});
    target.reset();
    an_observer->on_next(1);
    logger()->flush();

    ASSERT_NE(out.str().find("target expired"), std::string::npos);
    configure(config::with_level(spdlog::level::warn));
}

} // namespace sl::rx::log
