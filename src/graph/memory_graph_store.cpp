#include "curio/graph/memory_graph_store.hpp"
#include <algorithm>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace curio {

namespace {

std::string string_property(const GraphNode& node, const char* key) {
    auto it = node.properties.find(key);
    if (it == node.properties.end() || it->is_null()) return "";
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

const std::string& other_endpoint(const GraphEdge& edge, const std::string& id) {
    return edge.from_id == id ? edge.to_id : edge.from_id;
}

} // anonymous namespace

// ==========================================
// Node and Edge Management
// ==========================================

GraphNode InMemoryGraphStore::create_node(const GraphNode& node) {
    if (node.id.empty()) {
        throw GraphStoreError("Node must have an id");
    }

    std::unique_lock lock(mutex_);

    auto it = nodes_.find(node.id);
    if (it != nodes_.end()) {
        spdlog::debug("Node already exists: {}, skipping creation", node.id);
        return it->second;
    }

    GraphNode stored = node;
    if (!stored.properties.is_object()) {
        stored.properties = nlohmann::json::object();
    }
    stored.properties["id"] = stored.id;

    nodes_[stored.id] = stored;
    node_order_.push_back(stored.id);

    spdlog::debug("Node created: {} - {}", to_string(stored.label), stored.display_name());
    return stored;
}

void InMemoryGraphStore::create_relationship(const GraphEdge& edge) {
    std::unique_lock lock(mutex_);

    if (!find_node_locked(edge.from_id) || !find_node_locked(edge.to_id)) {
        throw GraphStoreError("Nodes " + edge.from_id + " or " + edge.to_id + " do not exist");
    }
    if (edge_keys_.count(edge.key()) > 0) {
        throw EdgeAlreadyExists(edge);
    }

    add_edge_locked(edge);
    spdlog::debug("Relationship created: {} -[{}]-> {}",
                  edge.from_id, to_string(edge.type), edge.to_id);
}

std::optional<GraphNode> InMemoryGraphStore::get_node(
    const std::string& id,
    std::optional<NodeLabel> label
) const {
    std::shared_lock lock(mutex_);

    const GraphNode* node = find_node_locked(id);
    if (!node) return std::nullopt;
    if (label && node->label != *label) return std::nullopt;
    return *node;
}

std::vector<RelatedNode> InMemoryGraphStore::get_related_nodes(
    const std::string& id,
    std::optional<NodeLabel> label,
    std::optional<RelationType> type,
    size_t limit
) const {
    std::shared_lock lock(mutex_);
    return neighbours_locked(id, label, type, limit);
}

std::vector<QueryRow> InMemoryGraphStore::query(const GraphQuery& query) const {
    std::shared_lock lock(mutex_);
    return std::visit([this](const auto& q) { return run_query(q); }, query);
}

GraphStats InMemoryGraphStore::stats() const {
    std::shared_lock lock(mutex_);

    GraphStats result;
    for (const auto& [id, node] : nodes_) {
        result.nodes_by_label[to_string(node.label)]++;
    }
    for (const auto& edge : edges_) {
        result.relationships_by_type[to_string(edge.type)]++;
    }
    return result;
}

// ==========================================
// Inspection
// ==========================================

bool InMemoryGraphStore::has_node(const std::string& id) const {
    std::shared_lock lock(mutex_);
    return nodes_.find(id) != nodes_.end();
}

bool InMemoryGraphStore::has_relationship(
    const std::string& from_id,
    const std::string& to_id,
    RelationType type
) const {
    GraphEdge lookup;
    lookup.from_id = from_id;
    lookup.to_id = to_id;
    lookup.type = type;

    std::shared_lock lock(mutex_);
    return edge_keys_.count(lookup.key()) > 0;
}

std::vector<GraphEdge> InMemoryGraphStore::get_all_edges() const {
    std::shared_lock lock(mutex_);
    return edges_;
}

std::vector<GraphEdge> InMemoryGraphStore::get_incident_edges(const std::string& id) const {
    std::shared_lock lock(mutex_);

    std::vector<GraphEdge> result;
    auto it = node_to_edges_.find(id);
    if (it != node_to_edges_.end()) {
        for (size_t index : it->second) {
            result.push_back(edges_[index]);
        }
    }
    return result;
}

size_t InMemoryGraphStore::num_nodes() const {
    std::shared_lock lock(mutex_);
    return nodes_.size();
}

size_t InMemoryGraphStore::num_edges() const {
    std::shared_lock lock(mutex_);
    return edges_.size();
}

void InMemoryGraphStore::clear() {
    std::unique_lock lock(mutex_);
    nodes_.clear();
    node_order_.clear();
    edges_.clear();
    edge_keys_.clear();
    node_to_edges_.clear();
}

// ==========================================
// Import/Export
// ==========================================

nlohmann::json InMemoryGraphStore::to_json() const {
    std::shared_lock lock(mutex_);

    nlohmann::json j;
    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto& id : node_order_) {
        nodes_json.push_back(nodes_.at(id).to_json());
    }
    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& edge : edges_) {
        edges_json.push_back(edge.to_json());
    }
    j["nodes"] = nodes_json;
    j["edges"] = edges_json;
    return j;
}

void InMemoryGraphStore::load_json(const nlohmann::json& j) {
    std::unique_lock lock(mutex_);

    nodes_.clear();
    node_order_.clear();
    edges_.clear();
    edge_keys_.clear();
    node_to_edges_.clear();

    if (j.contains("nodes")) {
        for (const auto& node_json : j["nodes"]) {
            GraphNode node = GraphNode::from_json(node_json);
            if (nodes_.find(node.id) != nodes_.end()) continue;
            nodes_[node.id] = node;
            node_order_.push_back(node.id);
        }
    }

    size_t skipped = 0;
    if (j.contains("edges")) {
        for (const auto& edge_json : j["edges"]) {
            GraphEdge edge = GraphEdge::from_json(edge_json);
            if (!find_node_locked(edge.from_id) || !find_node_locked(edge.to_id) ||
                edge_keys_.count(edge.key()) > 0) {
                skipped++;
                continue;
            }
            add_edge_locked(edge);
        }
    }

    if (skipped > 0) {
        spdlog::warn("Skipped {} dangling or duplicate edges while loading graph", skipped);
    }
    spdlog::info("Graph loaded with {} nodes and {} edges", nodes_.size(), edges_.size());
}

void InMemoryGraphStore::save_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw GraphStoreError("Failed to open file for writing: " + filename);
    }

    file << to_json().dump(2);
    file.close();
}

void InMemoryGraphStore::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw GraphStoreError("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw GraphStoreError("Malformed graph file " + filename + ": " + e.what());
    }
    load_json(j);
}

// ==========================================
// Helper Methods
// ==========================================

void InMemoryGraphStore::add_edge_locked(const GraphEdge& edge) {
    size_t index = edges_.size();
    edges_.push_back(edge);
    edge_keys_.insert(edge.key());

    node_to_edges_[edge.from_id].push_back(index);
    if (edge.to_id != edge.from_id) {
        node_to_edges_[edge.to_id].push_back(index);
    }
}

const GraphNode* InMemoryGraphStore::find_node_locked(const std::string& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

std::vector<RelatedNode> InMemoryGraphStore::neighbours_locked(
    const std::string& id,
    std::optional<NodeLabel> label,
    std::optional<RelationType> type,
    size_t limit
) const {
    std::vector<RelatedNode> result;

    auto it = node_to_edges_.find(id);
    if (it == node_to_edges_.end()) {
        return result;
    }

    std::set<std::string> seen;
    for (size_t index : it->second) {
        if (result.size() >= limit) break;

        const GraphEdge& edge = edges_[index];
        if (type && edge.type != *type) continue;

        const std::string& neighbour_id = other_endpoint(edge, id);
        const GraphNode* neighbour = find_node_locked(neighbour_id);
        if (!neighbour) continue;
        if (label && neighbour->label != *label) continue;
        if (!seen.insert(neighbour_id).second) continue;

        result.push_back({*neighbour, edge});
    }

    return result;
}

// ==========================================
// Queries
// ==========================================

std::vector<QueryRow> InMemoryGraphStore::run_query(const ActivityConceptsQuery& q) const {
    std::vector<QueryRow> rows;
    for (auto& related : neighbours_locked(q.activity_id, NodeLabel::Concept,
                                           RelationType::LearnedFrom, edges_.size())) {
        QueryRow row;
        row.node = std::move(related.node);
        row.edge = std::move(related.relationship);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<QueryRow> InMemoryGraphStore::run_query(const ActivitiesForConceptQuery& q) const {
    std::vector<QueryRow> rows;
    for (auto& related : neighbours_locked(q.concept_id, NodeLabel::Activity,
                                           RelationType::LearnedFrom, edges_.size())) {
        QueryRow row;
        row.node = std::move(related.node);
        row.edge = std::move(related.relationship);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<QueryRow> InMemoryGraphStore::run_query(const ConceptsQuery&) const {
    std::vector<QueryRow> rows;
    for (const auto& id : node_order_) {
        const GraphNode& node = nodes_.at(id);
        if (node.label == NodeLabel::Concept) {
            QueryRow row;
            row.node = node;
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

std::vector<QueryRow> InMemoryGraphStore::run_query(const AllRelationshipsQuery& q) const {
    std::vector<QueryRow> rows;
    for (const auto& edge : edges_) {
        if (rows.size() >= q.limit) break;

        QueryRow row;
        row.node = nodes_.at(edge.from_id);
        row.edge = edge;
        row.other = nodes_.at(edge.to_id);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<QueryRow> InMemoryGraphStore::run_query(const TopicsWithConceptsQuery&) const {
    std::vector<QueryRow> rows;
    for (const auto& id : node_order_) {
        const GraphNode& topic = nodes_.at(id);
        if (topic.label != NodeLabel::Topic) continue;

        QueryRow row;
        row.node = topic;
        for (const auto& related : neighbours_locked(id, std::nullopt,
                                                     RelationType::Contains, edges_.size())) {
            std::string name = string_property(related.node, "name");
            if (!name.empty()) {
                row.members.push_back(name);
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<QueryRow> InMemoryGraphStore::run_query(const SessionActivitiesQuery& q) const {
    std::vector<QueryRow> rows;
    for (const auto& id : node_order_) {
        const GraphNode& node = nodes_.at(id);
        if (node.label != NodeLabel::Activity) continue;
        if (string_property(node, "session_id") != q.session_id) continue;

        QueryRow row;
        row.node = node;
        rows.push_back(std::move(row));
    }

    std::stable_sort(rows.begin(), rows.end(), [](const QueryRow& a, const QueryRow& b) {
        return string_property(a.node, "timestamp") < string_property(b.node, "timestamp");
    });
    return rows;
}

} // namespace curio
