#pragma once

#include "curio/builder/relationship_builder.hpp"
#include "curio/builder/topic_clusterer.hpp"
#include "curio/graph/graph_store.hpp"
#include "curio/vector/vector_store.hpp"
#include <cstddef>
#include <optional>
#include <nlohmann/json.hpp>

namespace curio {

// ============================================================================
// Build Options
// ============================================================================

/**
 * @brief Parameters of a full knowledge graph build
 */
struct GraphBuildOptions {
    double concept_threshold = 0.7;         ///< RELATED_TO threshold
    double activity_threshold = 0.75;       ///< CONNECTS threshold
    bool build_topics = true;               ///< Run topic clustering
    bool build_temporal = false;            ///< Chain session activities with BEFORE
    size_t limit = 100;                     ///< Embeddings fetched per stage
    size_t min_cluster_size = 3;            ///< Smallest topic kept
    double cluster_threshold = 0.65;        ///< Similarity to the cluster seed
    TopicIdScheme topic_id_scheme = TopicIdScheme::Sequential;

    nlohmann::json to_json() const;
};

/**
 * @brief Per-stage results of a full build
 */
struct GraphBuildSummary {
    RelationshipBuildResult concept_relationships;
    RelationshipBuildResult activity_relationships;
    std::optional<TopicClusterResult> topic_clusters;            ///< Unset when topics are off
    std::optional<RelationshipBuildResult> temporal_relationships;
    double elapsed_seconds = 0.0;

    /**
     * @brief {conceptRelationships, activityRelationships, topicClusters,
     *         temporalRelationships, elapsedSeconds}
     */
    nlohmann::json to_json() const;
};

// ============================================================================
// Knowledge Graph Builder
// ============================================================================

/**
 * @brief Runs the build stages in order: concepts, activities, topics, temporal
 *
 * Any exception thrown by a stage propagates and the later stages do not
 * run. Edges written by earlier stages stay in the graph.
 */
class KnowledgeGraphBuilder {
public:
    KnowledgeGraphBuilder(VectorStore& vectors, GraphStore& graph);

    GraphBuildSummary build(const GraphBuildOptions& options = GraphBuildOptions());

    RelationshipBuilder& relationships() { return relationships_; }

private:
    VectorStore& vectors_;
    GraphStore& graph_;
    RelationshipBuilder relationships_;
};

} // namespace curio
