//===== test_base.hpp =====
#pragma once

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include "histshard/core/logger.hpp"

namespace histshard {
namespace testing {

/**
 * @brief Fixture base with a quiet console logger and a private scratch directory
 */
class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.destination = LogDestination::CONSOLE;
        config.min_level = LogLevel::WARNING;
        Logger::instance().initialize(config);

        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        scratch_dir_ = std::filesystem::temp_directory_path() /
                       ("histshard_test_" + std::to_string(stamp) + "_" +
                        std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(scratch_dir_);
    }

    void TearDown() override {
        Logger::reset_for_tests();
        std::error_code ec;
        std::filesystem::remove_all(scratch_dir_, ec);
    }

    const std::filesystem::path& scratch_dir() const {
        return scratch_dir_;
    }

private:
    std::filesystem::path scratch_dir_;
};

}  // namespace testing
}  // namespace histshard
