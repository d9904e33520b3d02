#pragma once

#include "curio/builder/knowledge_graph_builder.hpp"
#include "curio/query/visualization_service.hpp"
#include "curio/scheduler/graph_scheduler.hpp"
#include "curio/vector/chroma_vector_store.hpp"
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace curio {

// ============================================================================
// Engine Configuration
// ============================================================================

/**
 * @brief Configuration for builds, scheduling, stores and logging
 */
struct EngineConfig {
    // Build Configuration
    double concept_threshold = 0.7;             ///< RELATED_TO threshold
    double activity_threshold = 0.75;           ///< CONNECTS threshold
    bool build_topics = true;                   ///< Cluster concepts into topics
    bool build_temporal = false;                ///< Chain session activities
    int limit = 100;                            ///< Embeddings per stage (quadratic cost)
    int min_cluster_size = 3;                   ///< Smallest topic kept
    double cluster_threshold = 0.65;            ///< Similarity to the cluster seed
    std::string topic_id_scheme = "sequential"; ///< "sequential" or "content_hash"

    // Scheduler Configuration
    int64_t graph_update_interval_ms = kDefaultGraphUpdateIntervalMs;

    // Storage Configuration
    std::string graph_path = "curio_graph.json";     ///< Graph store JSON file
    std::string embeddings_path = "embeddings.json"; ///< Used when chroma_url is empty
    std::string chroma_url;                          ///< ChromaDB server, empty to disable
    std::string chroma_collection = "knowledge_base";
    int http_timeout_seconds = 30;

    // Visualization Configuration
    int visualization_limit = 200;
    bool include_activities = true;
    bool include_topics = true;
    int min_node_degree = 1;

    // Logging
    std::string log_level = "info";             ///< spdlog level name

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @brief Missing keys keep their defaults
     */
    static EngineConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by CURIO_* environment variables
     */
    static EngineConfig from_environment();

    /**
     * @brief Override fields from CURIO_GRAPH_PATH, CURIO_EMBEDDINGS_PATH,
     *        CURIO_CHROMA_URL, CURIO_LOG_LEVEL and CURIO_GRAPH_INTERVAL_MS
     * @throws std::invalid_argument if CURIO_GRAPH_INTERVAL_MS is not a number
     */
    void apply_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    GraphBuildOptions build_options() const;
    VisualizationOptions visualization_options() const;
    ChromaConfig chroma_config() const;
};

constexpr int kMaxEmbeddingLimit = 5000;

/**
 * @brief Load the given file, else curio.json or .curio.json if present,
 *        else defaults; environment overrides are applied last
 * @throws std::runtime_error if an explicitly named file cannot be loaded
 */
EngineConfig load_config_with_fallback(const std::string& config_path);

/**
 * @brief Set the global spdlog level ("trace", "debug", "info", "warn", ...)
 * @throws std::invalid_argument for an unknown level name
 */
void configure_logging(const std::string& level);

} // namespace curio
