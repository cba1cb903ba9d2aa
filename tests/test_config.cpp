/**
 * @file test_config.cpp
 * @brief Unit tests for the YAML configuration store and engine config mapping
 */

#include <gtest/gtest.h>
#include <masterhand/core/config.h>
#include <masterhand/core/exception.h>
#include <masterhand/gesture/GestureStateMachine.hpp>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace masterhand;
using core::Config;
using core::ResultCode;
namespace keys = core::config_keys;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::getInstance().clear();
        Config::getInstance().initializeDefaults();
        path_ = "/tmp/masterhand_config_test_" + std::to_string(getpid()) + ".yaml";
    }

    void TearDown() override {
        std::remove(path_.c_str());
        Config::getInstance().clear();
        Config::getInstance().initializeDefaults();
    }

    void writeFile(const std::string& text) {
        std::ofstream file(path_);
        file << text;
    }

    std::string path_;
};

TEST_F(ConfigTest, DefaultsArePresent) {
    Config& config = Config::getInstance();

    EXPECT_EQ(config.getValue<std::string>(keys::SYSTEM_LOG_LEVEL), "info");
    EXPECT_TRUE(config.getValue<bool>(keys::GESTURE_CLASSIFY, false));
    EXPECT_TRUE(config.getValue<bool>(keys::SNAP_ENABLED, false));
    EXPECT_EQ(config.getValue<std::string>(keys::SNAP_POLICY), "velocity_gated");
    EXPECT_DOUBLE_EQ(config.getDouble(keys::SNAP_VELOCITY_THRESHOLD), 0.04);
    EXPECT_EQ(config.getValue<std::string>(keys::SINK_HOST), "127.0.0.1");
    EXPECT_EQ(config.getInt(keys::SINK_PORT), 5005);
    EXPECT_FALSE(config.hasKey(keys::SNAP_PINCH_THRESHOLD_SQ));
}

TEST_F(ConfigTest, NestedYamlIsFlattened) {
    Config& config = Config::getInstance();

    ASSERT_EQ(config.loadFromString(
        "snap:\n"
        "  policy: edge_triggered\n"
        "  pinch_threshold_sq: 0.003\n"
        "sink:\n"
        "  host: 10.0.0.7\n"
        "  port: 6000\n"
        "gesture:\n"
        "  classify: false\n"), ResultCode::SUCCESS);

    EXPECT_EQ(config.getValue<std::string>(keys::SNAP_POLICY), "edge_triggered");
    EXPECT_DOUBLE_EQ(config.getDouble(keys::SNAP_PINCH_THRESHOLD_SQ), 0.003);
    EXPECT_EQ(config.getValue<std::string>(keys::SINK_HOST), "10.0.0.7");
    EXPECT_EQ(config.getInt(keys::SINK_PORT), 6000);
    EXPECT_FALSE(config.getValue<bool>(keys::GESTURE_CLASSIFY, true));

    // Keys absent from the document keep their defaults
    EXPECT_DOUBLE_EQ(config.getDouble(keys::SNAP_VELOCITY_THRESHOLD), 0.04);
}

TEST_F(ConfigTest, YamlBooleanSpellingsAreBooleans) {
    Config& config = Config::getInstance();
    ASSERT_EQ(config.loadFromString(
        "gesture:\n"
        "  classify: False\n"
        "snap:\n"
        "  enabled: off\n"), ResultCode::SUCCESS);

    EXPECT_TRUE(config.holdsType<bool>(keys::GESTURE_CLASSIFY));
    EXPECT_FALSE(config.getValue<bool>(keys::GESTURE_CLASSIFY, true));
    EXPECT_FALSE(config.getValue<bool>(keys::SNAP_ENABLED, true));

    ASSERT_EQ(config.loadFromString("snap: {enabled: Yes}\n"), ResultCode::SUCCESS);
    EXPECT_TRUE(config.getValue<bool>(keys::SNAP_ENABLED, false));

    gesture::EngineConfig engine = gesture::make_engine_config(config);
    EXPECT_FALSE(engine.classify_gestures);
    EXPECT_TRUE(engine.detect_snaps);
}

TEST_F(ConfigTest, QuotedScalarsStayStrings) {
    Config& config = Config::getInstance();
    ASSERT_EQ(config.loadFromString(
        "gesture: {classify: \"off\"}\n"
        "sink: {host: '5005'}\n"), ResultCode::SUCCESS);

    EXPECT_TRUE(config.holdsType<std::string>(keys::GESTURE_CLASSIFY));
    EXPECT_EQ(config.getValue<std::string>(keys::SINK_HOST), "5005");
}

TEST_F(ConfigTest, TypeMismatchReturnsDefault) {
    Config& config = Config::getInstance();
    EXPECT_EQ(config.getValue<std::string>(keys::SINK_PORT, "none"), "none");
    EXPECT_EQ(config.getInt(keys::SINK_HOST, -1), -1);
}

TEST_F(ConfigTest, MissingFileReported) {
    EXPECT_EQ(Config::getInstance().loadFromFile("/nonexistent/masterhand.yaml"),
              ResultCode::ERROR_FILE_NOT_FOUND);
}

TEST_F(ConfigTest, MalformedYamlRejected) {
    Config& config = Config::getInstance();
    EXPECT_EQ(config.loadFromString("snap: [unterminated"), ResultCode::ERROR_INVALID_CONFIG);
    EXPECT_EQ(config.loadFromString("- just\n- a list\n"), ResultCode::ERROR_INVALID_CONFIG);
    EXPECT_EQ(config.loadFromString("snap:\n  policy:\n    - edge\n"), ResultCode::ERROR_INVALID_CONFIG);

    // Nothing from a rejected document is applied
    EXPECT_EQ(config.getValue<std::string>(keys::SNAP_POLICY), "velocity_gated");
}

TEST_F(ConfigTest, SaveAndReload) {
    Config& config = Config::getInstance();
    config.setValue(keys::SNAP_POLICY, std::string("edge_triggered"));
    config.setValue(keys::SNAP_PINCH_THRESHOLD_SQ, 0.0025);
    config.setValue(keys::SINK_PORT, 7001u);
    config.setValue(keys::SNAP_ENABLED, false);

    ASSERT_EQ(config.saveToFile(path_), ResultCode::SUCCESS);

    config.clear();
    ASSERT_EQ(config.loadFromFile(path_), ResultCode::SUCCESS);

    EXPECT_EQ(config.getValue<std::string>(keys::SNAP_POLICY), "edge_triggered");
    EXPECT_DOUBLE_EQ(config.getDouble(keys::SNAP_PINCH_THRESHOLD_SQ), 0.0025);
    EXPECT_EQ(config.getInt(keys::SINK_PORT), 7001);
    EXPECT_FALSE(config.getValue<bool>(keys::SNAP_ENABLED, true));
    EXPECT_EQ(config.getValue<std::string>(keys::SINK_HOST), "127.0.0.1");
}

TEST_F(ConfigTest, LoadFromFile) {
    writeFile("# comment\nsystem:\n  log_level: debug\nsnap:\n  velocity_threshold: 0.05\n");

    Config& config = Config::getInstance();
    ASSERT_EQ(config.loadFromFile(path_), ResultCode::SUCCESS);
    EXPECT_EQ(config.getValue<std::string>(keys::SYSTEM_LOG_LEVEL), "debug");
    EXPECT_DOUBLE_EQ(config.getDouble(keys::SNAP_VELOCITY_THRESHOLD), 0.05);
}

TEST_F(ConfigTest, RemoveAndListKeys) {
    Config& config = Config::getInstance();
    config.removeKey(keys::SINK_HOST);
    EXPECT_FALSE(config.hasKey(keys::SINK_HOST));

    std::vector<std::string> all = config.getAllKeys();
    EXPECT_EQ(std::count(all.begin(), all.end(), std::string(keys::SINK_HOST)), 0);
    EXPECT_EQ(std::count(all.begin(), all.end(), std::string(keys::SNAP_POLICY)), 1);
}

TEST_F(ConfigTest, EngineConfigDefaultsToVelocityGated) {
    gesture::EngineConfig engine = gesture::make_engine_config(Config::getInstance());

    EXPECT_TRUE(engine.classify_gestures);
    EXPECT_TRUE(engine.detect_snaps);
    EXPECT_EQ(engine.snap.policy, gesture::SnapPolicy::VELOCITY_GATED);
    EXPECT_FLOAT_EQ(engine.snap.pinch_threshold_sq, 0.004f);
    EXPECT_FLOAT_EQ(engine.snap.velocity_threshold, 0.04f);
}

TEST_F(ConfigTest, EngineConfigEdgePolicyTakesItsThreshold) {
    Config& config = Config::getInstance();
    config.setValue(keys::SNAP_POLICY, std::string("edge"));

    gesture::EngineConfig engine = gesture::make_engine_config(config);
    EXPECT_EQ(engine.snap.policy, gesture::SnapPolicy::EDGE_TRIGGERED);
    EXPECT_FLOAT_EQ(engine.snap.pinch_threshold_sq, 0.002f);
}

TEST_F(ConfigTest, EngineConfigHonoursOverrides) {
    Config& config = Config::getInstance();
    ASSERT_EQ(config.loadFromString(
        "gesture: {classify: false}\n"
        "snap: {enabled: false, pinch_threshold_sq: 0.001, velocity_threshold: 0.1}\n"),
        ResultCode::SUCCESS);

    gesture::EngineConfig engine = gesture::make_engine_config(config);
    EXPECT_FALSE(engine.classify_gestures);
    EXPECT_FALSE(engine.detect_snaps);
    EXPECT_FLOAT_EQ(engine.snap.pinch_threshold_sq, 0.001f);
    EXPECT_FLOAT_EQ(engine.snap.velocity_threshold, 0.1f);
}

TEST_F(ConfigTest, EngineConfigRejectsWrongTypes) {
    Config& config = Config::getInstance();

    ASSERT_EQ(config.loadFromString("snap: {velocity_threshold: fast}\n"), ResultCode::SUCCESS);
    EXPECT_THROW(gesture::make_engine_config(config), core::ConfigException);

    config.clear();
    config.initializeDefaults();
    ASSERT_EQ(config.loadFromString("gesture: {classify: sometimes}\n"), ResultCode::SUCCESS);
    EXPECT_THROW(gesture::make_engine_config(config), core::ConfigException);

    config.clear();
    config.initializeDefaults();
    ASSERT_EQ(config.loadFromString("snap: {pinch_threshold_sq: true}\n"), ResultCode::SUCCESS);
    EXPECT_THROW(gesture::make_engine_config(config), core::ConfigException);

    config.clear();
    config.initializeDefaults();
    config.setValue(keys::SNAP_POLICY, 3u);
    EXPECT_THROW(gesture::make_engine_config(config), core::ConfigException);
}

TEST_F(ConfigTest, EngineConfigRejectsBadValues) {
    Config& config = Config::getInstance();

    config.setValue(keys::SNAP_POLICY, std::string("whenever"));
    EXPECT_THROW(gesture::make_engine_config(config), core::ConfigException);

    config.setValue(keys::SNAP_POLICY, std::string("velocity_gated"));
    config.setValue(keys::SNAP_PINCH_THRESHOLD_SQ, -0.5);
    EXPECT_THROW(gesture::make_engine_config(config), core::ConfigException);
}
