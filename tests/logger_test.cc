#include "support/test_util.h"
#include <core/util/logger.h>
#include <gtest/gtest.h>
#include <stdexcept>

using streamfetch::Logger;
using streamfetch::test::ReadFile;
using streamfetch::test::TempDir;

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::ParseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::ParseLevel("info"), spdlog::level::info);
    EXPECT_EQ(Logger::ParseLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(Logger::ParseLevel("err"), spdlog::level::err);
    EXPECT_EQ(Logger::ParseLevel("off"), spdlog::level::off);
}

TEST(LoggerTest, RejectsUnknownLevel) {
    EXPECT_THROW(Logger::ParseLevel("verbose"), std::invalid_argument);
    EXPECT_THROW(Logger::ParseLevel(""), std::invalid_argument);
    EXPECT_THROW(Logger::ParseLevel("INFO"), std::invalid_argument);
}

TEST(LoggerTest, WritesToDirectoryAndRestoresDefault) {
    TempDir dir;
    auto log_dir = dir / "logs";
    auto previous = spdlog::default_logger();

    {
        Logger logger(Logger::Level::info, log_dir, false);
        EXPECT_NE(spdlog::default_logger(), previous);
        EXPECT_EQ(logger.level(), spdlog::level::info);
        spdlog::info("download finished: {} bytes", 42);
        spdlog::debug("hidden below info");
    }

    EXPECT_EQ(spdlog::default_logger(), previous);
    EXPECT_EQ(spdlog::get(Logger::kName), nullptr);

    std::string contents;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        EXPECT_EQ(entry.path().filename().string().rfind(Logger::kName, 0), 0u);
        contents += ReadFile(entry.path());
    }
    EXPECT_NE(contents.find("download finished: 42 bytes"), std::string::npos);
    EXPECT_EQ(contents.find("hidden below info"), std::string::npos);
}
