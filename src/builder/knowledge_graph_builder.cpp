#include "curio/builder/knowledge_graph_builder.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace curio {

nlohmann::json GraphBuildOptions::to_json() const {
    nlohmann::json j;
    j["concept_threshold"] = concept_threshold;
    j["activity_threshold"] = activity_threshold;
    j["build_topics"] = build_topics;
    j["build_temporal"] = build_temporal;
    j["limit"] = limit;
    j["min_cluster_size"] = min_cluster_size;
    j["cluster_threshold"] = cluster_threshold;
    j["topic_id_scheme"] = to_string(topic_id_scheme);
    return j;
}

nlohmann::json GraphBuildSummary::to_json() const {
    nlohmann::json j;
    j["conceptRelationships"] = concept_relationships.to_json();
    j["activityRelationships"] = activity_relationships.to_json();
    j["topicClusters"] = topic_clusters ? topic_clusters->to_json() : nlohmann::json(nullptr);
    j["temporalRelationships"] = temporal_relationships
        ? temporal_relationships->to_json() : nlohmann::json(nullptr);
    j["elapsedSeconds"] = elapsed_seconds;
    return j;
}

KnowledgeGraphBuilder::KnowledgeGraphBuilder(VectorStore& vectors, GraphStore& graph)
    : vectors_(vectors), graph_(graph), relationships_(vectors, graph) {}

GraphBuildSummary KnowledgeGraphBuilder::build(const GraphBuildOptions& options) {
    auto start = std::chrono::steady_clock::now();
    spdlog::info("Starting knowledge graph build from {} vector store", vectors_.get_store_name());

    GraphBuildSummary summary;

    summary.concept_relationships = relationships_.build_concept_relationships(
        options.concept_threshold, options.limit);

    summary.activity_relationships = relationships_.build_activity_relationships(
        options.activity_threshold, options.limit);

    if (options.build_topics) {
        TopicClusterer clusterer(vectors_, graph_, options.topic_id_scheme);
        summary.topic_clusters = clusterer.build_topic_clusters(
            options.min_cluster_size, options.cluster_threshold);
    }

    if (options.build_temporal) {
        summary.temporal_relationships = relationships_.build_temporal_relationships(options.limit);
    }

    summary.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    spdlog::info("Knowledge graph build complete in {:.2f}s: {} concept, {} activity relationships",
                 summary.elapsed_seconds,
                 summary.concept_relationships.relationships_created,
                 summary.activity_relationships.relationships_created);
    return summary;
}

} // namespace curio
