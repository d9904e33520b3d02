#ifndef CURIO_VISUALIZATION_SERVICE_HPP
#define CURIO_VISUALIZATION_SERVICE_HPP

#include "curio/graph/graph_store.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace curio {

// ============================================================================
// Payload types
// ============================================================================

struct VisualizationOptions {
    size_t limit = 200;                 ///< Relationships read from the store
    bool include_activities = true;     ///< Keep relationships touching an Activity
    bool include_topics = true;         ///< Attach the topic listing
    size_t min_node_degree = 1;         ///< Drop nodes with fewer incident edges

    /// Throws std::invalid_argument for a negative or non-integer count
    static VisualizationOptions from_json(const nlohmann::json& j);
};

struct VisNode {
    std::string id;
    std::string label;                  ///< name, else title, else id
    NodeLabel type = NodeLabel::Concept;
    nlohmann::json properties = nlohmann::json::object();
    size_t degree = 0;

    static VisNode from_graph_node(const GraphNode& node);

    nlohmann::json to_json(bool with_degree = true) const;
};

struct VisEdge {
    std::string source;
    std::string target;
    RelationType type = RelationType::RelatedTo;
    nlohmann::json properties = nlohmann::json::object();

    static VisEdge from_graph_edge(const GraphEdge& edge);

    nlohmann::json to_json() const;
};

struct TopicSummary {
    std::string id;
    std::string name;
    std::vector<std::string> concepts;  ///< Member concept names

    nlohmann::json to_json() const;
};

/**
 * @brief Nodes with degrees and edges, in first-seen order
 */
struct GraphSnapshot {
    std::vector<VisNode> nodes;
    std::vector<VisEdge> edges;
};

struct VisualizationData {
    std::vector<VisNode> nodes;
    std::vector<VisEdge> edges;
    std::vector<TopicSummary> topics;

    /**
     * @brief {nodes, edges, topics, stats: {nodeCount, edgeCount, topicCount}}
     */
    nlohmann::json to_json() const;
};

struct RelatedConcept {
    std::string name;
    std::string relationship_type;
    double similarity = 0.0;
};

struct ConceptActivity {
    std::string id;
    std::string title;
    std::string source_type;
    std::string timestamp;
};

struct ConceptDetails {
    std::string id;
    std::string name;
    nlohmann::json label;               ///< Category assigned at extraction; may be null
    nlohmann::json confidence;          ///< May be null
    std::vector<RelatedConcept> related;
    std::vector<ConceptActivity> activities;

    /**
     * @brief {concept: {id, name, label, confidence}, related: [...], activities: [...]}
     */
    nlohmann::json to_json() const;
};

struct Subgraph {
    std::vector<VisNode> nodes;
    std::vector<VisEdge> edges;

    nlohmann::json to_json() const;
};

// ============================================================================
// Snapshot fold
// ============================================================================

/**
 * @brief Fold relationship rows into nodes with degrees
 *
 * The first occurrence of a node decides its label and properties. Each
 * row adds one to the degree of both endpoints. With include_activities
 * false, rows touching an Activity are dropped before counting.
 */
GraphSnapshot accumulate_degrees(const std::vector<QueryRow>& rows, bool include_activities);

/**
 * @brief Keep nodes with degree >= min_degree and edges between kept nodes
 */
GraphSnapshot filter_snapshot(const GraphSnapshot& snapshot, size_t min_degree);

// ============================================================================
// Visualization Service
// ============================================================================

/**
 * @brief Read-only views of the graph for the UI layer
 *
 * May run while a build is writing; it sees whatever the store has at the
 * time of each read. Store failures are logged and turned into empty
 * results.
 */
class VisualizationService {
public:
    explicit VisualizationService(const GraphStore& graph);

    VisualizationData get_visualization_data(
        const VisualizationOptions& options = VisualizationOptions()) const;

    std::vector<TopicSummary> get_topic_data() const;

    /**
     * @brief Concept with its RELATED_TO neighbours and source activities
     * @return nullopt if no such concept exists or the store fails
     */
    std::optional<ConceptDetails> get_concept_details(
        const std::string& concept_name,
        size_t limit = 10
    ) const;

    /**
     * @brief Breadth-first neighbourhood of a node
     *
     * Expands up to `depth` hops and stops once `limit` edges are collected.
     * An unknown node yields an empty subgraph.
     */
    Subgraph get_node_subgraph(
        const std::string& node_id,
        size_t depth = 2,
        size_t limit = 50
    ) const;

private:
    const GraphStore& graph_;
};

} // namespace curio

#endif // CURIO_VISUALIZATION_SERVICE_HPP
