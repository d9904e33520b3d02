#include "curio/graph/graph_store.hpp"
#include <array>

namespace curio {

namespace {

constexpr std::array<const char*, kQueryKindCount> kQueryKindNames = {
    "ActivityConcepts",
    "ActivitiesForConcept",
    "Concepts",
    "AllRelationships",
    "TopicsWithConcepts",
    "SessionActivities",
};

static_assert(static_cast<size_t>(QueryKind::SessionActivities) + 1 == kQueryKindCount,
              "QueryKind and GraphQuery must list the same kinds");

} // anonymous namespace

EdgeAlreadyExists::EdgeAlreadyExists(const GraphEdge& edge)
    : GraphStoreError("Relationship already exists: " + edge.from_id + " -[" +
                      to_string(edge.type) + "]-> " + edge.to_id),
      edge_key_(edge.key()) {}

QueryKind query_kind(const GraphQuery& query) {
    return static_cast<QueryKind>(query.index());
}

const char* query_kind_name(QueryKind kind) {
    return kQueryKindNames[static_cast<size_t>(kind)];
}

size_t GraphStats::total_nodes() const {
    size_t total = 0;
    for (const auto& [label, count] : nodes_by_label) {
        total += count;
    }
    return total;
}

size_t GraphStats::total_relationships() const {
    size_t total = 0;
    for (const auto& [type, count] : relationships_by_type) {
        total += count;
    }
    return total;
}

nlohmann::json GraphStats::to_json() const {
    nlohmann::json j;
    j["nodes"] = total_nodes();
    j["relationships"] = total_relationships();
    j["nodeBreakdown"] = nodes_by_label;
    j["relationshipBreakdown"] = relationships_by_type;
    return j;
}

} // namespace curio
