#include "curio/graph/graph_types.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace curio {

namespace {

const std::string kActivityPrefix = "activity_";
const std::string kEmbeddingPrefix = "embedding_";
const std::string kConceptPrefix = "concept_";

} // anonymous namespace

// ==========================================
// Label / type names
// ==========================================

std::string to_string(NodeLabel label) {
    switch (label) {
        case NodeLabel::Activity: return "Activity";
        case NodeLabel::Concept: return "Concept";
        case NodeLabel::Topic: return "Topic";
    }
    return "Concept";
}

std::string to_string(RelationType type) {
    switch (type) {
        case RelationType::RelatedTo: return "RELATED_TO";
        case RelationType::Connects: return "CONNECTS";
        case RelationType::Contains: return "CONTAINS";
        case RelationType::LearnedFrom: return "LEARNED_FROM";
        case RelationType::Before: return "BEFORE";
    }
    return "RELATED_TO";
}

NodeLabel node_label_from_string(const std::string& text) {
    if (text == "Activity") return NodeLabel::Activity;
    if (text == "Concept") return NodeLabel::Concept;
    if (text == "Topic") return NodeLabel::Topic;
    throw std::invalid_argument("Unknown node label: " + text);
}

RelationType relation_type_from_string(const std::string& text) {
    if (text == "RELATED_TO") return RelationType::RelatedTo;
    if (text == "CONNECTS") return RelationType::Connects;
    if (text == "CONTAINS") return RelationType::Contains;
    if (text == "LEARNED_FROM") return RelationType::LearnedFrom;
    if (text == "BEFORE") return RelationType::Before;
    throw std::invalid_argument("Unknown relationship type: " + text);
}

// ==========================================
// GraphNode
// ==========================================

std::string GraphNode::display_name() const {
    for (const char* key : {"name", "title"}) {
        auto it = properties.find(key);
        if (it != properties.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return id;
}

nlohmann::json GraphNode::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["label"] = to_string(label);
    nlohmann::json props = properties.is_object() ? properties : nlohmann::json::object();
    props["id"] = id;
    j["properties"] = props;
    return j;
}

GraphNode GraphNode::from_json(const nlohmann::json& j) {
    GraphNode node;
    node.id = j.at("id").get<std::string>();
    node.label = node_label_from_string(j.at("label").get<std::string>());
    if (j.contains("properties") && j["properties"].is_object()) {
        node.properties = j["properties"];
    }
    return node;
}

// ==========================================
// GraphEdge
// ==========================================

std::string GraphEdge::key() const {
    return from_id + "|" + to_string(type) + "|" + to_id;
}

nlohmann::json GraphEdge::to_json() const {
    nlohmann::json j;
    j["from"] = from_id;
    j["to"] = to_id;
    j["type"] = to_string(type);
    j["properties"] = properties.is_object() ? properties : nlohmann::json::object();
    return j;
}

GraphEdge GraphEdge::from_json(const nlohmann::json& j) {
    GraphEdge edge;
    edge.from_id = j.at("from").get<std::string>();
    edge.to_id = j.at("to").get<std::string>();
    edge.type = relation_type_from_string(j.at("type").get<std::string>());
    if (j.contains("properties") && j["properties"].is_object()) {
        edge.properties = j["properties"];
    }
    return edge;
}

// ==========================================
// Identifier conventions
// ==========================================

std::string activity_node_id(const std::string& activity_id) {
    return kActivityPrefix + activity_id;
}

std::string activity_id_from_node_id(const std::string& node_id) {
    if (node_id.compare(0, kActivityPrefix.size(), kActivityPrefix) == 0) {
        return node_id.substr(kActivityPrefix.size());
    }
    return node_id;
}

std::string embedding_id_for_activity(const std::string& activity_id) {
    return kEmbeddingPrefix + activity_id;
}

std::string concept_id_from_name(const std::string& name) {
    std::string result = kConceptPrefix;
    result.reserve(kConceptPrefix.size() + name.size());

    bool in_space = false;
    for (unsigned char c : name) {
        if (std::isspace(c)) {
            if (!in_space) result += '_';
            in_space = true;
        } else {
            result += static_cast<char>(std::tolower(c));
            in_space = false;
        }
    }
    return result;
}

std::string unordered_pair_key(const std::string& a, const std::string& b) {
    return a < b ? a + "\x1f" + b : b + "\x1f" + a;
}

std::string current_timestamp_iso() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace curio
