#ifndef CURIO_MEMORY_GRAPH_STORE_HPP
#define CURIO_MEMORY_GRAPH_STORE_HPP

#include "curio/graph/graph_store.hpp"
#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace curio {

/**
 * @brief In-memory graph store with JSON persistence
 *
 * Nodes and edges keep their insertion order, which is the order queries
 * enumerate them in. Edges are directed records; neighbour lookups follow
 * them in both directions. A shared mutex lets visualization reads run
 * while a build is writing.
 */
class InMemoryGraphStore : public GraphStore {
public:
    InMemoryGraphStore() = default;

    InMemoryGraphStore(const InMemoryGraphStore&) = delete;
    InMemoryGraphStore& operator=(const InMemoryGraphStore&) = delete;

    // ==========================================
    // GraphStore
    // ==========================================

    GraphNode create_node(const GraphNode& node) override;

    void create_relationship(const GraphEdge& edge) override;

    std::optional<GraphNode> get_node(
        const std::string& id,
        std::optional<NodeLabel> label = std::nullopt
    ) const override;

    std::vector<RelatedNode> get_related_nodes(
        const std::string& id,
        std::optional<NodeLabel> label = std::nullopt,
        std::optional<RelationType> type = std::nullopt,
        size_t limit = 10
    ) const override;

    std::vector<QueryRow> query(const GraphQuery& query) const override;

    GraphStats stats() const override;

    // ==========================================
    // Inspection
    // ==========================================

    bool has_node(const std::string& id) const;

    bool has_relationship(
        const std::string& from_id,
        const std::string& to_id,
        RelationType type
    ) const;

    /**
     * @brief All edges in insertion order
     */
    std::vector<GraphEdge> get_all_edges() const;

    /**
     * @brief Edges touching a node, in either direction
     */
    std::vector<GraphEdge> get_incident_edges(const std::string& id) const;

    size_t num_nodes() const;
    size_t num_edges() const;

    void clear();

    // ==========================================
    // Import/Export
    // ==========================================

    /**
     * @brief {"nodes": [...], "edges": [...]}
     */
    nlohmann::json to_json() const;

    /**
     * @brief Replace the contents with a document produced by to_json()
     *
     * Edges whose endpoints are missing are skipped.
     */
    void load_json(const nlohmann::json& j);

    void save_to_json(const std::string& filename) const;
    void load_from_json(const std::string& filename);

private:
    mutable std::shared_mutex mutex_;

    std::map<std::string, GraphNode> nodes_;                 // node_id -> node
    std::vector<std::string> node_order_;                    // insertion order
    std::vector<GraphEdge> edges_;                           // insertion order
    std::set<std::string> edge_keys_;                        // GraphEdge::key()
    std::map<std::string, std::vector<size_t>> node_to_edges_;  // node_id -> indices into edges_

    // Callers hold mutex_
    void add_edge_locked(const GraphEdge& edge);
    const GraphNode* find_node_locked(const std::string& id) const;
    std::vector<RelatedNode> neighbours_locked(
        const std::string& id,
        std::optional<NodeLabel> label,
        std::optional<RelationType> type,
        size_t limit
    ) const;

    std::vector<QueryRow> run_query(const ActivityConceptsQuery& q) const;
    std::vector<QueryRow> run_query(const ActivitiesForConceptQuery& q) const;
    std::vector<QueryRow> run_query(const ConceptsQuery& q) const;
    std::vector<QueryRow> run_query(const AllRelationshipsQuery& q) const;
    std::vector<QueryRow> run_query(const TopicsWithConceptsQuery& q) const;
    std::vector<QueryRow> run_query(const SessionActivitiesQuery& q) const;
};

} // namespace curio

#endif // CURIO_MEMORY_GRAPH_STORE_HPP
