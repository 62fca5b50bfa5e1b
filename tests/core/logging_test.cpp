#include <gtest/gtest.h>
#include "logging.hpp"

#include <atomic>
#include <thread>
#include <vector>

TEST(Logging_LevelFromString, KnownAndUnknownNames) {
    EXPECT_EQ(core::logging::level_from_string("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(core::logging::level_from_string("warning"), spdlog::level::warn);
    EXPECT_EQ(core::logging::level_from_string("off"), spdlog::level::off);
    EXPECT_EQ(core::logging::level_from_string("loud"), spdlog::level::info);
}

TEST(Logging_GetLogger, HeldCopySurvivesReinitialize) {
    auto held = core::logging::getLogger();
    ASSERT_NE(held, nullptr);

    core::logging::initialize("logging_test", spdlog::level::off, spdlog::level::off);
    auto current = core::logging::getLogger();
    ASSERT_NE(current, nullptr);
    EXPECT_NE(held, current);
    EXPECT_EQ(current, core::logging::getLogger());
    held->debug("still usable after replacement");
}

TEST(Logging_GetLogger, ConcurrentWithInitialize) {
    std::atomic<bool> stop{false};
    std::atomic<int> null_loggers{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                auto logger = core::logging::getLogger();
                if (!logger) {
                    ++null_loggers;
                    continue;
                }
                logger->trace("reader tick");
            }
        });
    }
    for (int i = 0; i < 5; ++i) {
        core::logging::initialize("logging_test", spdlog::level::off, spdlog::level::off);
    }
    stop.store(true);
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_EQ(null_loggers.load(), 0);
}
