#ifndef CURIO_GRAPH_TYPES_HPP
#define CURIO_GRAPH_TYPES_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace curio {

/**
 * @brief Label of a node in the knowledge graph
 */
enum class NodeLabel {
    Activity,
    Concept,
    Topic
};

/**
 * @brief Relationship types written or read by the engine
 *
 * RELATED_TO and CONNECTS are similarity edges, CONTAINS links a topic to
 * its member concepts, LEARNED_FROM links a concept to the activity that
 * produced it, BEFORE orders activities inside a session.
 */
enum class RelationType {
    RelatedTo,
    Connects,
    Contains,
    LearnedFrom,
    Before
};

std::string to_string(NodeLabel label);
std::string to_string(RelationType type);

/**
 * @brief Parse a node label ("Activity", "Concept", "Topic")
 * @throws std::invalid_argument on an unknown label
 */
NodeLabel node_label_from_string(const std::string& text);

/**
 * @brief Parse a relationship type ("RELATED_TO", "CONNECTS", ...)
 * @throws std::invalid_argument on an unknown type
 */
RelationType relation_type_from_string(const std::string& text);

/**
 * @brief A node of the knowledge graph
 *
 * Properties are a JSON object. The id is duplicated into properties["id"]
 * when the node is serialized, matching what the visualization layer reads.
 */
struct GraphNode {
    std::string id;
    NodeLabel label = NodeLabel::Concept;
    nlohmann::json properties = nlohmann::json::object();

    /**
     * @brief Human-readable label: name, else title, else id
     */
    std::string display_name() const;

    nlohmann::json to_json() const;
    static GraphNode from_json(const nlohmann::json& j);
};

/**
 * @brief A directed relationship record between two nodes
 */
struct GraphEdge {
    std::string from_id;
    std::string to_id;
    RelationType type = RelationType::RelatedTo;
    nlohmann::json properties = nlohmann::json::object();

    /**
     * @brief Key identifying the record in a store: from|TYPE|to
     */
    std::string key() const;

    nlohmann::json to_json() const;
    static GraphEdge from_json(const nlohmann::json& j);
};

// ==========================================
// Identifier conventions
// ==========================================

/// "activity_<activity_id>"
std::string activity_node_id(const std::string& activity_id);

/// Inverse of activity_node_id(); returns the input unchanged if it has no prefix
std::string activity_id_from_node_id(const std::string& node_id);

/// "embedding_<activity_id>"
std::string embedding_id_for_activity(const std::string& activity_id);

/**
 * @brief Deterministic concept id: "concept_" + lower-cased name with
 * whitespace runs replaced by '_'
 */
std::string concept_id_from_name(const std::string& name);

/**
 * @brief Unordered pair key, identical for (a, b) and (b, a)
 */
std::string unordered_pair_key(const std::string& a, const std::string& b);

/**
 * @brief Current UTC time as ISO-8601 ("2026-01-31T12:00:00Z")
 */
std::string current_timestamp_iso();

} // namespace curio

#endif // CURIO_GRAPH_TYPES_HPP
