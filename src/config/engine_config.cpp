#include "curio/config/engine_config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <vector>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace curio {

namespace {

template <typename T>
void read_field(const json& j, const char* key, T& field) {
    if (j.contains(key) && !j[key].is_null()) {
        field = j[key].get<T>();
    }
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool in_similarity_range(double value) {
    return value >= -1.0 && value <= 1.0;
}

} // anonymous namespace

// ============================================================================
// EngineConfig
// ============================================================================

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    try {
        return from_json(j);
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;

    // Build config
    read_field(j, "concept_threshold", config.concept_threshold);
    read_field(j, "activity_threshold", config.activity_threshold);
    read_field(j, "build_topics", config.build_topics);
    read_field(j, "build_temporal", config.build_temporal);
    read_field(j, "limit", config.limit);
    read_field(j, "min_cluster_size", config.min_cluster_size);
    read_field(j, "cluster_threshold", config.cluster_threshold);
    read_field(j, "topic_id_scheme", config.topic_id_scheme);

    // Scheduler config; the desktop app calls it graphUpdateInterval
    if (j.contains("graph_update_interval_ms")) {
        config.graph_update_interval_ms = j["graph_update_interval_ms"].get<int64_t>();
    } else if (j.contains("graphUpdateInterval")) {
        config.graph_update_interval_ms = j["graphUpdateInterval"].get<int64_t>();
    }

    // Storage config
    read_field(j, "graph_path", config.graph_path);
    read_field(j, "embeddings_path", config.embeddings_path);
    read_field(j, "chroma_url", config.chroma_url);
    read_field(j, "chroma_collection", config.chroma_collection);
    read_field(j, "http_timeout_seconds", config.http_timeout_seconds);

    // Visualization config
    read_field(j, "visualization_limit", config.visualization_limit);
    read_field(j, "include_activities", config.include_activities);
    read_field(j, "include_topics", config.include_topics);
    read_field(j, "min_node_degree", config.min_node_degree);

    read_field(j, "log_level", config.log_level);

    return config;
}

json EngineConfig::to_json() const {
    json j;

    j["concept_threshold"] = concept_threshold;
    j["activity_threshold"] = activity_threshold;
    j["build_topics"] = build_topics;
    j["build_temporal"] = build_temporal;
    j["limit"] = limit;
    j["min_cluster_size"] = min_cluster_size;
    j["cluster_threshold"] = cluster_threshold;
    j["topic_id_scheme"] = topic_id_scheme;

    j["graph_update_interval_ms"] = graph_update_interval_ms;

    j["graph_path"] = graph_path;
    j["embeddings_path"] = embeddings_path;
    j["chroma_url"] = chroma_url;
    j["chroma_collection"] = chroma_collection;
    j["http_timeout_seconds"] = http_timeout_seconds;

    j["visualization_limit"] = visualization_limit;
    j["include_activities"] = include_activities;
    j["include_topics"] = include_topics;
    j["min_node_degree"] = min_node_degree;

    j["log_level"] = log_level;
    return j;
}

void EngineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << to_json().dump(2);
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;
    config.apply_environment();
    return config;
}

void EngineConfig::apply_environment() {
    const char* graph = std::getenv("CURIO_GRAPH_PATH");
    if (graph) graph_path = graph;

    const char* embeddings = std::getenv("CURIO_EMBEDDINGS_PATH");
    if (embeddings) embeddings_path = embeddings;

    const char* chroma = std::getenv("CURIO_CHROMA_URL");
    if (chroma) chroma_url = chroma;

    const char* level = std::getenv("CURIO_LOG_LEVEL");
    if (level) log_level = level;

    const char* interval = std::getenv("CURIO_GRAPH_INTERVAL_MS");
    if (interval) {
        try {
            graph_update_interval_ms = std::stoll(interval);
        } catch (const std::logic_error&) {
            throw std::invalid_argument(std::string("CURIO_GRAPH_INTERVAL_MS is not a number: ") + interval);
        }
    }
}

bool EngineConfig::validate(std::string& error_message) const {
    if (!in_similarity_range(concept_threshold) ||
        !in_similarity_range(activity_threshold) ||
        !in_similarity_range(cluster_threshold)) {
        error_message = "Similarity thresholds must be between -1.0 and 1.0";
        return false;
    }

    if (limit < 0 || limit > kMaxEmbeddingLimit) {
        error_message = "limit must be between 0 and " + std::to_string(kMaxEmbeddingLimit) +
                        " (pairwise stages are quadratic in limit)";
        return false;
    }

    if (min_cluster_size < 1) {
        error_message = "min_cluster_size must be at least 1";
        return false;
    }

    if (topic_id_scheme != "sequential" && topic_id_scheme != "content_hash") {
        error_message = "Invalid topic id scheme: " + topic_id_scheme;
        return false;
    }

    if (graph_update_interval_ms <= 0) {
        error_message = "graph_update_interval_ms must be positive";
        return false;
    }

    if (graph_path.empty()) {
        error_message = "graph_path is required";
        return false;
    }

    if (chroma_url.empty() && embeddings_path.empty()) {
        error_message = "Either chroma_url or embeddings_path is required";
        return false;
    }

    if (http_timeout_seconds <= 0) {
        error_message = "http_timeout_seconds must be positive";
        return false;
    }

    if (visualization_limit < 0 || min_node_degree < 0) {
        error_message = "Visualization limits must not be negative";
        return false;
    }

    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        error_message = "Unknown log level: " + log_level;
        return false;
    }

    return true;
}

GraphBuildOptions EngineConfig::build_options() const {
    GraphBuildOptions options;
    options.concept_threshold = concept_threshold;
    options.activity_threshold = activity_threshold;
    options.build_topics = build_topics;
    options.build_temporal = build_temporal;
    options.limit = static_cast<size_t>(limit);
    options.min_cluster_size = static_cast<size_t>(min_cluster_size);
    options.cluster_threshold = cluster_threshold;
    options.topic_id_scheme = topic_id_scheme_from_string(topic_id_scheme);
    return options;
}

VisualizationOptions EngineConfig::visualization_options() const {
    VisualizationOptions options;
    options.limit = static_cast<size_t>(visualization_limit);
    options.include_activities = include_activities;
    options.include_topics = include_topics;
    options.min_node_degree = static_cast<size_t>(min_node_degree);
    return options;
}

ChromaConfig EngineConfig::chroma_config() const {
    ChromaConfig config;
    config.base_url = chroma_url;
    config.collection = chroma_collection;
    config.timeout_seconds = http_timeout_seconds;
    return config;
}

// ============================================================================
// Helpers
// ============================================================================

EngineConfig load_config_with_fallback(const std::string& config_path) {
    EngineConfig config;

    if (!config_path.empty()) {
        config = EngineConfig::from_json_file(config_path);
    } else {
        const std::vector<std::string> paths_to_try = {"curio.json", ".curio.json"};
        for (const auto& path : paths_to_try) {
            if (file_exists(path)) {
                spdlog::debug("Using config file {}", path);
                config = EngineConfig::from_json_file(path);
                break;
            }
        }
    }

    config.apply_environment();
    return config;
}

void configure_logging(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("Unknown log level: " + level);
    }
    spdlog::set_level(parsed);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace curio
