#include "curio/query/visualization_service.hpp"
#include <cstdint>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace curio {

namespace {

json property_or_null(const GraphNode& node, const char* key) {
    auto it = node.properties.find(key);
    return it == node.properties.end() ? json(nullptr) : *it;
}

size_t non_negative_count(const json& j, const char* key) {
    if (!j.is_number_integer()) {
        throw std::invalid_argument(std::string(key) + " must be an integer");
    }
    int64_t value = j.get<int64_t>();
    if (value < 0) {
        throw std::invalid_argument(std::string(key) + " must not be negative, got " +
                                    std::to_string(value));
    }
    return static_cast<size_t>(value);
}

std::string string_property(const GraphNode& node, const char* key) {
    auto it = node.properties.find(key);
    if (it == node.properties.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // anonymous namespace

// ==========================================
// Payload types
// ==========================================

VisualizationOptions VisualizationOptions::from_json(const json& j) {
    VisualizationOptions options;
    if (j.contains("limit")) options.limit = non_negative_count(j["limit"], "limit");
    if (j.contains("includeActivities")) options.include_activities = j["includeActivities"].get<bool>();
    if (j.contains("includeTopics")) options.include_topics = j["includeTopics"].get<bool>();
    if (j.contains("minNodeDegree")) options.min_node_degree = non_negative_count(j["minNodeDegree"], "minNodeDegree");
    return options;
}

VisNode VisNode::from_graph_node(const GraphNode& node) {
    VisNode vis;
    vis.id = node.id;
    vis.label = node.display_name();
    vis.type = node.label;
    vis.properties = node.properties;
    vis.properties["id"] = node.id;
    return vis;
}

json VisNode::to_json(bool with_degree) const {
    json j;
    j["id"] = id;
    j["label"] = label;
    j["type"] = to_string(type);
    j["properties"] = properties;
    if (with_degree) j["degree"] = degree;
    return j;
}

VisEdge VisEdge::from_graph_edge(const GraphEdge& edge) {
    return VisEdge{edge.from_id, edge.to_id, edge.type, edge.properties};
}

json VisEdge::to_json() const {
    return {
        {"source", source},
        {"target", target},
        {"type", to_string(type)},
        {"properties", properties}
    };
}

json TopicSummary::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"concepts", concepts},
        {"conceptCount", concepts.size()}
    };
}

json VisualizationData::to_json() const {
    json j;
    j["nodes"] = json::array();
    for (const auto& node : nodes) j["nodes"].push_back(node.to_json());
    j["edges"] = json::array();
    for (const auto& edge : edges) j["edges"].push_back(edge.to_json());
    j["topics"] = json::array();
    for (const auto& topic : topics) j["topics"].push_back(topic.to_json());
    j["stats"] = {
        {"nodeCount", nodes.size()},
        {"edgeCount", edges.size()},
        {"topicCount", topics.size()}
    };
    return j;
}

json ConceptDetails::to_json() const {
    json j;
    j["concept"] = {
        {"id", id},
        {"name", name},
        {"label", label},
        {"confidence", confidence}
    };

    j["related"] = json::array();
    for (const auto& r : related) {
        j["related"].push_back({
            {"name", r.name},
            {"relationshipType", r.relationship_type},
            {"similarity", r.similarity}
        });
    }

    j["activities"] = json::array();
    for (const auto& a : activities) {
        j["activities"].push_back({
            {"id", a.id},
            {"title", a.title},
            {"source_type", a.source_type},
            {"timestamp", a.timestamp}
        });
    }
    return j;
}

json Subgraph::to_json() const {
    json j;
    j["nodes"] = json::array();
    for (const auto& node : nodes) j["nodes"].push_back(node.to_json(false));
    j["edges"] = json::array();
    for (const auto& edge : edges) j["edges"].push_back(edge.to_json());
    return j;
}

// ==========================================
// Snapshot fold
// ==========================================

GraphSnapshot accumulate_degrees(const std::vector<QueryRow>& rows, bool include_activities) {
    GraphSnapshot snapshot;
    std::map<std::string, size_t> position;     // node id -> index in snapshot.nodes

    auto touch = [&](const GraphNode& node) {
        auto it = position.find(node.id);
        if (it == position.end()) {
            it = position.emplace(node.id, snapshot.nodes.size()).first;
            snapshot.nodes.push_back(VisNode::from_graph_node(node));
        }
        snapshot.nodes[it->second].degree++;
    };

    for (const auto& row : rows) {
        if (!row.edge || !row.other) continue;

        const GraphNode& a = row.node;
        const GraphNode& b = *row.other;
        if (!include_activities &&
            (a.label == NodeLabel::Activity || b.label == NodeLabel::Activity)) {
            continue;
        }

        touch(a);
        touch(b);
        snapshot.edges.push_back(VisEdge::from_graph_edge(*row.edge));
    }

    return snapshot;
}

GraphSnapshot filter_snapshot(const GraphSnapshot& snapshot, size_t min_degree) {
    GraphSnapshot filtered;
    std::set<std::string> kept;

    for (const auto& node : snapshot.nodes) {
        if (node.degree >= min_degree) {
            kept.insert(node.id);
            filtered.nodes.push_back(node);
        }
    }

    for (const auto& edge : snapshot.edges) {
        if (kept.count(edge.source) > 0 && kept.count(edge.target) > 0) {
            filtered.edges.push_back(edge);
        }
    }

    return filtered;
}

// ==========================================
// VisualizationService
// ==========================================

VisualizationService::VisualizationService(const GraphStore& graph)
    : graph_(graph) {}

VisualizationData VisualizationService::get_visualization_data(const VisualizationOptions& options) const {
    VisualizationData data;
    try {
        auto rows = graph_.query(AllRelationshipsQuery{options.limit});
        GraphSnapshot snapshot = filter_snapshot(
            accumulate_degrees(rows, options.include_activities),
            options.min_node_degree);

        data.nodes = std::move(snapshot.nodes);
        data.edges = std::move(snapshot.edges);
        if (options.include_topics) {
            data.topics = get_topic_data();
        }
    } catch (const std::exception& e) {
        spdlog::error("Error getting visualization data: {}", e.what());
        return VisualizationData();
    }

    spdlog::debug("Visualization payload: {} nodes, {} edges, {} topics",
                  data.nodes.size(), data.edges.size(), data.topics.size());
    return data;
}

std::vector<TopicSummary> VisualizationService::get_topic_data() const {
    std::vector<TopicSummary> topics;
    try {
        for (const auto& row : graph_.query(TopicsWithConceptsQuery{})) {
            topics.push_back({row.node.id, row.node.display_name(), row.members});
        }
    } catch (const std::exception& e) {
        spdlog::error("Error getting topic data: {}", e.what());
        return {};
    }
    return topics;
}

std::optional<ConceptDetails> VisualizationService::get_concept_details(
    const std::string& concept_name,
    size_t limit
) const {
    try {
        std::string concept_id = concept_id_from_name(concept_name);

        auto concept_node = graph_.get_node(concept_id, NodeLabel::Concept);
        if (!concept_node) {
            return std::nullopt;
        }

        ConceptDetails details;
        details.id = concept_node->id;
        details.name = string_property(*concept_node, "name");
        details.label = property_or_null(*concept_node, "label");
        details.confidence = property_or_null(*concept_node, "confidence");

        for (const auto& related : graph_.get_related_nodes(
                 concept_id, NodeLabel::Concept, RelationType::RelatedTo, limit)) {
            RelatedConcept r;
            r.name = related.node.display_name();
            r.relationship_type = to_string(related.relationship.type);
            auto similarity = related.relationship.properties.find("similarity");
            if (similarity != related.relationship.properties.end() && similarity->is_number()) {
                r.similarity = similarity->get<double>();
            }
            details.related.push_back(r);
        }

        for (const auto& row : graph_.query(ActivitiesForConceptQuery{concept_id})) {
            details.activities.push_back({
                row.node.id,
                string_property(row.node, "title"),
                string_property(row.node, "source_type"),
                string_property(row.node, "timestamp")
            });
        }

        return details;
    } catch (const std::exception& e) {
        spdlog::error("Error getting concept details for '{}': {}", concept_name, e.what());
        return std::nullopt;
    }
}

Subgraph VisualizationService::get_node_subgraph(
    const std::string& node_id,
    size_t depth,
    size_t limit
) const {
    Subgraph subgraph;
    try {
        auto start = graph_.get_node(node_id);
        if (!start) {
            return subgraph;
        }

        std::set<std::string> visited = {start->id};
        std::set<std::string> edge_keys;
        subgraph.nodes.push_back(VisNode::from_graph_node(*start));

        std::vector<std::string> frontier = {start->id};
        for (size_t hop = 0; hop < depth && !frontier.empty(); ++hop) {
            std::vector<std::string> next;

            for (const auto& id : frontier) {
                auto neighbours = graph_.get_related_nodes(
                    id, std::nullopt, std::nullopt, std::numeric_limits<size_t>::max());

                for (const auto& related : neighbours) {
                    if (subgraph.edges.size() >= limit) break;

                    if (edge_keys.insert(related.relationship.key()).second) {
                        subgraph.edges.push_back(VisEdge::from_graph_edge(related.relationship));
                    }
                    if (visited.insert(related.node.id).second) {
                        subgraph.nodes.push_back(VisNode::from_graph_node(related.node));
                        next.push_back(related.node.id);
                    }
                }
            }

            frontier = std::move(next);
        }
    } catch (const std::exception& e) {
        spdlog::error("Error getting subgraph for node {}: {}", node_id, e.what());
        return Subgraph();
    }
    return subgraph;
}

} // namespace curio
