#include <gtest/gtest.h>
#include "curio/config/engine_config.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

using namespace curio;

// ==========================================
// JSON Loading Tests
// ==========================================

TEST(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;
    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;

    GraphBuildOptions options = config.build_options();
    EXPECT_DOUBLE_EQ(options.concept_threshold, 0.7);
    EXPECT_DOUBLE_EQ(options.activity_threshold, 0.75);
    EXPECT_TRUE(options.build_topics);
    EXPECT_FALSE(options.build_temporal);
    EXPECT_EQ(options.limit, 100u);
    EXPECT_EQ(options.min_cluster_size, 3u);
    EXPECT_EQ(options.topic_id_scheme, TopicIdScheme::Sequential);
    EXPECT_EQ(config.graph_update_interval_ms, 1800000);
}

TEST(EngineConfigTest, FromJsonOverridesOnlyPresentKeys) {
    auto config = EngineConfig::from_json({
        {"concept_threshold", 0.8},
        {"limit", 250},
        {"build_temporal", true},
        {"topic_id_scheme", "content_hash"},
        {"chroma_url", "http://localhost:8000"}
    });

    EXPECT_DOUBLE_EQ(config.concept_threshold, 0.8);
    EXPECT_EQ(config.limit, 250);
    EXPECT_TRUE(config.build_temporal);
    EXPECT_EQ(config.chroma_url, "http://localhost:8000");
    EXPECT_DOUBLE_EQ(config.activity_threshold, 0.75);
    EXPECT_EQ(config.chroma_collection, "knowledge_base");
    EXPECT_EQ(config.build_options().topic_id_scheme, TopicIdScheme::ContentHash);
}

TEST(EngineConfigTest, AcceptsDesktopIntervalKey) {
    auto config = EngineConfig::from_json({{"graphUpdateInterval", 60000}});
    EXPECT_EQ(config.graph_update_interval_ms, 60000);

    // The explicit key wins
    config = EngineConfig::from_json({{"graphUpdateInterval", 60000}, {"graph_update_interval_ms", 5000}});
    EXPECT_EQ(config.graph_update_interval_ms, 5000);
}

TEST(EngineConfigTest, FileRoundTrip) {
    EngineConfig config;
    config.cluster_threshold = 0.5;
    config.visualization_limit = 75;
    config.log_level = "debug";

    std::string path = ::testing::TempDir() + "curio_config_test.json";
    config.to_json_file(path);
    EngineConfig loaded = EngineConfig::from_json_file(path);
    std::remove(path.c_str());

    EXPECT_EQ(loaded.to_json(), config.to_json());
    EXPECT_EQ(loaded.visualization_options().limit, 75u);
}

TEST(EngineConfigTest, MissingFileThrows) {
    EXPECT_THROW(EngineConfig::from_json_file("/nonexistent/curio.json"), std::runtime_error);
}

TEST(EngineConfigTest, MalformedFileThrows) {
    std::string path = ::testing::TempDir() + "curio_bad_config.json";
    {
        std::ofstream file(path);
        file << "{\"limit\": ";
    }
    EXPECT_THROW(EngineConfig::from_json_file(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(EngineConfigTest, WrongValueTypeThrows) {
    std::string path = ::testing::TempDir() + "curio_typed_config.json";
    {
        std::ofstream file(path);
        file << "{\"limit\": \"lots\"}";
    }
    EXPECT_THROW(EngineConfig::from_json_file(path), std::runtime_error);
    std::remove(path.c_str());
}

// ==========================================
// Validation Tests
// ==========================================

TEST(EngineConfigValidationTest, LimitUpperBound) {
    EngineConfig config;
    std::string error;

    config.limit = kMaxEmbeddingLimit;
    EXPECT_TRUE(config.validate(error));

    config.limit = kMaxEmbeddingLimit + 1;
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("limit"), std::string::npos);
}

TEST(EngineConfigValidationTest, ThresholdOutOfRange) {
    EngineConfig config;
    std::string error;
    config.concept_threshold = 1.5;
    EXPECT_FALSE(config.validate(error));
    EXPECT_NE(error.find("threshold"), std::string::npos);
}

TEST(EngineConfigValidationTest, UnknownTopicScheme) {
    EngineConfig config;
    std::string error;
    config.topic_id_scheme = "uuid";
    EXPECT_FALSE(config.validate(error));
    EXPECT_EQ(error, "Invalid topic id scheme: uuid");
}

TEST(EngineConfigValidationTest, NonPositiveInterval) {
    EngineConfig config;
    std::string error;
    config.graph_update_interval_ms = 0;
    EXPECT_FALSE(config.validate(error));
}

TEST(EngineConfigValidationTest, NeedsAnEmbeddingSource) {
    EngineConfig config;
    std::string error;
    config.embeddings_path.clear();
    EXPECT_FALSE(config.validate(error));

    config.chroma_url = "http://localhost:8000";
    EXPECT_TRUE(config.validate(error)) << error;
}

TEST(EngineConfigValidationTest, UnknownLogLevel) {
    EngineConfig config;
    std::string error;
    config.log_level = "chatty";
    EXPECT_FALSE(config.validate(error));

    config.log_level = "off";
    EXPECT_TRUE(config.validate(error)) << error;
}

// ==========================================
// Environment Tests
// ==========================================

class EngineConfigEnvironmentTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("CURIO_GRAPH_PATH");
        unsetenv("CURIO_CHROMA_URL");
        unsetenv("CURIO_LOG_LEVEL");
        unsetenv("CURIO_GRAPH_INTERVAL_MS");
    }
};

TEST_F(EngineConfigEnvironmentTest, OverridesFields) {
    setenv("CURIO_GRAPH_PATH", "/tmp/graph.json", 1);
    setenv("CURIO_CHROMA_URL", "http://chroma:8000", 1);
    setenv("CURIO_LOG_LEVEL", "debug", 1);
    setenv("CURIO_GRAPH_INTERVAL_MS", "120000", 1);

    EngineConfig config = EngineConfig::from_environment();
    EXPECT_EQ(config.graph_path, "/tmp/graph.json");
    EXPECT_EQ(config.chroma_url, "http://chroma:8000");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.graph_update_interval_ms, 120000);
    EXPECT_EQ(config.chroma_config().base_url, "http://chroma:8000");
}

TEST_F(EngineConfigEnvironmentTest, BadIntervalThrows) {
    setenv("CURIO_GRAPH_INTERVAL_MS", "soon", 1);
    EXPECT_THROW(EngineConfig::from_environment(), std::invalid_argument);
}

TEST_F(EngineConfigEnvironmentTest, EnvironmentAppliesOverExplicitFile) {
    EngineConfig file_config;
    file_config.graph_path = "from_file.json";
    std::string path = ::testing::TempDir() + "curio_fallback_config.json";
    file_config.to_json_file(path);

    setenv("CURIO_GRAPH_PATH", "from_env.json", 1);
    EngineConfig config = load_config_with_fallback(path);
    std::remove(path.c_str());

    EXPECT_EQ(config.graph_path, "from_env.json");
}

TEST(ConfigureLoggingTest, UnknownLevelThrows) {
    EXPECT_THROW(configure_logging("chatty"), std::invalid_argument);
    EXPECT_NO_THROW(configure_logging("warn"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    configure_logging("info");
}
