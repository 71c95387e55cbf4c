/**
 * @file test_node_config.cpp
 * @brief Unit tests for node configuration and utilities
 *
 * Tests configuration including:
 * - Default limits and constants
 * - Validation of every field
 * - Environment overrides and fallback to defaults
 * - Log level and number parsing helpers
 */

#include <gtest/gtest.h>
#include "meshdir/channel.hpp"
#include "meshdir/node_config.hpp"
#include "meshdir/utilities.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <string>
#include <thread>

using namespace meshdir;
using namespace std::chrono_literals;

// Test fixture for configuration tests
class NodeConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear_environment();
    }

    void TearDown() override {
        clear_environment();
    }

    static void clear_environment() {
        for (const char* name : {config::ENV_FRAGMENT_SIZE, config::ENV_MAX_PENDING_SESSIONS,
                                 config::ENV_SESSION_TIMEOUT_MS, config::ENV_SWEEP_INTERVAL_MS,
                                 config::ENV_CHANNEL_CAPACITY, config::ENV_LOG_LEVEL}) {
            unsetenv(name);
        }
    }
};

// ============================================================================
// Constants Tests
// ============================================================================

TEST_F(NodeConfigTest, DefaultsAreReasonable) {
    EXPECT_EQ(config::DEFAULT_FRAGMENT_SIZE, 128);
    EXPECT_EQ(config::DEFAULT_MAX_PENDING_SESSIONS, 256);
    EXPECT_EQ(config::DEFAULT_SESSION_IDLE_TIMEOUT, std::chrono::seconds(30));
    EXPECT_EQ(config::DEFAULT_SWEEP_INTERVAL, std::chrono::seconds(5));
    EXPECT_EQ(config::MAX_JSON_SIZE, 1024 * 1024);
    EXPECT_EQ(config::MAX_TITLE_LENGTH, 255);
}

TEST_F(NodeConfigTest, DefaultConfigIsValid) {
    NodeConfig cfg;
    std::string error;
    EXPECT_TRUE(cfg.validate(&error));
    EXPECT_TRUE(error.empty());
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_F(NodeConfigTest, ValidateFragmentSize) {
    NodeConfig cfg;
    std::string error;

    cfg.max_fragment_size = 0;
    EXPECT_FALSE(cfg.validate(&error));
    EXPECT_NE(error.find("max_fragment_size"), std::string::npos);

    cfg.max_fragment_size = config::MAX_FRAGMENT_SIZE + 1;
    EXPECT_FALSE(cfg.validate());

    cfg.max_fragment_size = config::MAX_FRAGMENT_SIZE;
    EXPECT_TRUE(cfg.validate());
}

TEST_F(NodeConfigTest, ValidateLimitsAndTimers) {
    NodeConfig cfg;
    cfg.max_pending_sessions = 0;
    EXPECT_FALSE(cfg.validate());

    cfg = NodeConfig();
    cfg.session_idle_timeout = std::chrono::milliseconds(0);
    EXPECT_FALSE(cfg.validate());

    cfg = NodeConfig();
    cfg.sweep_interval = std::chrono::milliseconds(0);
    EXPECT_FALSE(cfg.validate());

    cfg = NodeConfig();
    cfg.channel_capacity = 0;
    EXPECT_FALSE(cfg.validate());
}

// ============================================================================
// Environment Tests
// ============================================================================

TEST_F(NodeConfigTest, EnvironmentUnsetKeepsDefaults) {
    NodeConfig cfg = NodeConfig::from_environment();
    EXPECT_EQ(cfg.max_fragment_size, config::DEFAULT_FRAGMENT_SIZE);
    EXPECT_EQ(cfg.channel_capacity, config::DEFAULT_CHANNEL_CAPACITY);
}

TEST_F(NodeConfigTest, EnvironmentOverrides) {
    setenv(config::ENV_FRAGMENT_SIZE, "512", 1);
    setenv(config::ENV_SESSION_TIMEOUT_MS, "2500", 1);
    setenv(config::ENV_CHANNEL_CAPACITY, "32", 1);
    setenv(config::ENV_LOG_LEVEL, "debug", 1);

    NodeConfig cfg = NodeConfig::from_environment();
    EXPECT_EQ(cfg.max_fragment_size, 512);
    EXPECT_EQ(cfg.session_idle_timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(cfg.channel_capacity, 32);
    EXPECT_EQ(cfg.log_level, utilities::LogLevel::DEBUG);
}

TEST_F(NodeConfigTest, EnvironmentNonNumericIgnored) {
    setenv(config::ENV_FRAGMENT_SIZE, "big", 1);
    setenv(config::ENV_MAX_PENDING_SESSIONS, "64", 1);

    NodeConfig cfg = NodeConfig::from_environment();
    EXPECT_EQ(cfg.max_fragment_size, config::DEFAULT_FRAGMENT_SIZE);
    EXPECT_EQ(cfg.max_pending_sessions, 64);
}

TEST_F(NodeConfigTest, EnvironmentOutOfRangeFallsBackToDefaults) {
    setenv(config::ENV_FRAGMENT_SIZE, "0", 1);
    setenv(config::ENV_CHANNEL_CAPACITY, "32", 1);

    NodeConfig cfg = NodeConfig::from_environment();
    EXPECT_TRUE(cfg.validate());
    EXPECT_EQ(cfg.max_fragment_size, config::DEFAULT_FRAGMENT_SIZE);
    EXPECT_EQ(cfg.channel_capacity, config::DEFAULT_CHANNEL_CAPACITY);
}

// ============================================================================
// Utility Tests
// ============================================================================

TEST_F(NodeConfigTest, ParseLogLevel) {
    EXPECT_EQ(utilities::parse_log_level("WARN"), utilities::LogLevel::WARN);
    EXPECT_EQ(utilities::parse_log_level(" error "), utilities::LogLevel::ERROR);
    EXPECT_FALSE(utilities::parse_log_level("loud").has_value());
}

TEST_F(NodeConfigTest, SetLogLevelAppliesToActiveLogger) {
    utilities::initialize_logging();
    utilities::set_log_level(utilities::LogLevel::WARN);

    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
    for (const auto& sink : spdlog::default_logger()->sinks()) {
        EXPECT_EQ(sink->level(), spdlog::level::warn);
    }

    utilities::set_log_level(utilities::LogLevel::INFO);
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::info);
}

TEST_F(NodeConfigTest, ParseUnsigned) {
    EXPECT_EQ(utilities::parse_unsigned("42"), std::optional<uint64_t>(42));
    EXPECT_FALSE(utilities::parse_unsigned("-1").has_value());
    EXPECT_FALSE(utilities::parse_unsigned("12abc").has_value());
    EXPECT_FALSE(utilities::parse_unsigned("").has_value());
}

TEST_F(NodeConfigTest, FormatByteSize) {
    EXPECT_EQ(utilities::format_byte_size(512), "512 B");
    EXPECT_EQ(utilities::format_byte_size(2048), "2.0 KB");
}

// ============================================================================
// Channel Tests
// ============================================================================

TEST_F(NodeConfigTest, ChannelHonorsCapacityAndClose) {
    Channel<int> channel(2);
    int notified = 0;
    channel.set_listener([&notified]() { ++notified; });

    EXPECT_EQ(channel.try_send(1), SendStatus::OK);
    EXPECT_EQ(channel.try_send(2), SendStatus::OK);
    EXPECT_EQ(channel.try_send(3), SendStatus::FULL);
    EXPECT_EQ(notified, 2);

    channel.close();
    EXPECT_EQ(channel.try_send(4), SendStatus::CLOSED);

    // Queued values survive close
    EXPECT_EQ(channel.try_receive(), std::optional<int>(1));
    EXPECT_EQ(channel.receive_for(std::chrono::milliseconds(10)), std::optional<int>(2));
    EXPECT_FALSE(channel.receive_for(std::chrono::milliseconds(10)).has_value());
}

TEST_F(NodeConfigTest, ClearingListenerWaitsForRunningCallback) {
    Channel<int> channel(4);
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> callback_done{false};

    channel.set_listener([&entered, released, &callback_done]() {
        entered.set_value();
        released.wait();
        callback_done = true;
    });

    std::thread producer([&channel]() {
        EXPECT_EQ(channel.try_send(1), SendStatus::OK);
    });
    entered.get_future().wait();

    std::atomic<bool> cleared{false};
    std::thread clearer([&channel, &cleared]() {
        channel.set_listener(nullptr);
        cleared = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(cleared);

    release.set_value();
    clearer.join();
    producer.join();

    EXPECT_TRUE(cleared);
    EXPECT_TRUE(callback_done);

    // Listener gone: later sends do not call it
    EXPECT_EQ(channel.try_send(2), SendStatus::OK);
    EXPECT_EQ(channel.size(), 2);
}
