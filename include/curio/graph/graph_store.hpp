#pragma once

#include "curio/graph/graph_types.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace curio {

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Failure reported by a graph store (missing endpoint, I/O, ...)
 */
class GraphStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A relationship with the same (from, type, to) already exists
 *
 * Builders treat this as a named, non-fatal outcome of an edge write.
 */
class EdgeAlreadyExists : public GraphStoreError {
public:
    explicit EdgeAlreadyExists(const GraphEdge& edge);

    const std::string& edge_key() const { return edge_key_; }

private:
    std::string edge_key_;
};

// ============================================================================
// Typed queries
// ============================================================================

/**
 * @brief Closed set of read queries a graph store answers
 *
 * The enumerator order matches the alternative order of GraphQuery.
 */
enum class QueryKind {
    ActivityConcepts,
    ActivitiesForConcept,
    Concepts,
    AllRelationships,
    TopicsWithConcepts,
    SessionActivities
};

/// Concepts linked to an activity through LEARNED_FROM
struct ActivityConceptsQuery {
    std::string activity_id;   ///< Activity node id ("activity_<n>")
};

/// Activity nodes linked to a concept through LEARNED_FROM
struct ActivitiesForConceptQuery {
    std::string concept_id;
};

/// Every Concept node, in insertion order
struct ConceptsQuery {};

/// The first `limit` relationships as (a, r, b) rows
struct AllRelationshipsQuery {
    size_t limit = 200;
};

/// Every Topic node with the names of its CONTAINS members
struct TopicsWithConceptsQuery {};

/// Activity nodes of one session, ordered by timestamp
struct SessionActivitiesQuery {
    std::string session_id;
};

using GraphQuery = std::variant<
    ActivityConceptsQuery,
    ActivitiesForConceptQuery,
    ConceptsQuery,
    AllRelationshipsQuery,
    TopicsWithConceptsQuery,
    SessionActivitiesQuery
>;

constexpr size_t kQueryKindCount = std::variant_size_v<GraphQuery>;

QueryKind query_kind(const GraphQuery& query);
const char* query_kind_name(QueryKind kind);

/**
 * @brief One result row
 *
 * - ActivityConcepts, ActivitiesForConcept: node = neighbour, edge = link
 * - Concepts, SessionActivities: node only
 * - AllRelationships: node = a, edge = r, other = b
 * - TopicsWithConcepts: node = topic, members = concept names
 */
struct QueryRow {
    GraphNode node;
    std::optional<GraphEdge> edge;
    std::optional<GraphNode> other;
    std::vector<std::string> members;
};

/**
 * @brief Neighbour returned by GraphStore::get_related_nodes()
 */
struct RelatedNode {
    GraphNode node;
    GraphEdge relationship;
};

/**
 * @brief Node and relationship counts
 */
struct GraphStats {
    std::map<std::string, size_t> nodes_by_label;
    std::map<std::string, size_t> relationships_by_type;

    size_t total_nodes() const;
    size_t total_relationships() const;

    nlohmann::json to_json() const;
};

// ============================================================================
// Graph Store Interface
// ============================================================================

/**
 * @brief Key/relationship store holding Activities, Concepts and Topics
 *
 * Implementations must allow reads concurrently with a writer.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    /**
     * @brief Create a node
     * @return The stored node; an existing node with the same id is
     *         returned unchanged
     * @throws GraphStoreError if the id is empty
     */
    virtual GraphNode create_node(const GraphNode& node) = 0;

    /**
     * @brief Create a directed relationship
     * @throws EdgeAlreadyExists if (from, type, to) is already stored
     * @throws GraphStoreError if an endpoint does not exist
     */
    virtual void create_relationship(const GraphEdge& edge) = 0;

    /**
     * @brief Look up a node, optionally requiring a label
     */
    virtual std::optional<GraphNode> get_node(
        const std::string& id,
        std::optional<NodeLabel> label = std::nullopt
    ) const = 0;

    /**
     * @brief Neighbours of a node over incident edges in either direction
     */
    virtual std::vector<RelatedNode> get_related_nodes(
        const std::string& id,
        std::optional<NodeLabel> label = std::nullopt,
        std::optional<RelationType> type = std::nullopt,
        size_t limit = 10
    ) const = 0;

    /**
     * @brief Run one of the typed read queries
     */
    virtual std::vector<QueryRow> query(const GraphQuery& query) const = 0;

    /**
     * @brief Node and relationship counts
     */
    virtual GraphStats stats() const = 0;
};

} // namespace curio
