#include "curio/builder/relationship_builder.hpp"
#include "curio/graph/similarity.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <set>
#include <sstream>
#include <spdlog/spdlog.h>

namespace curio {

namespace {

constexpr const char* kSimilaritySource = "embedding_similarity";

// Days from 1970-01-01 to a proleptic Gregorian date (month 1-12)
long long days_from_civil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

// Seconds since the epoch for "YYYY-MM-DDTHH:MM:SS[...]", read as UTC
std::optional<long long> parse_timestamp(const std::string& text) {
    if (text.empty()) return std::nullopt;

    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    using namespace std::chrono;
    const long long days = days_from_civil(tm.tm_year + 1900LL,
                                           static_cast<unsigned>(tm.tm_mon + 1),
                                           static_cast<unsigned>(tm.tm_mday));
    const seconds since_epoch = hours(24 * days) + hours(tm.tm_hour) +
                                minutes(tm.tm_min) + seconds(tm.tm_sec);
    return static_cast<long long>(since_epoch.count());
}

std::string node_property(const GraphNode& node, const char* key) {
    auto it = node.properties.find(key);
    if (it == node.properties.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // anonymous namespace

const char* to_string(EdgeWriteOutcome outcome) {
    switch (outcome) {
        case EdgeWriteOutcome::Created: return "created";
        case EdgeWriteOutcome::AlreadyExists: return "already_exists";
        case EdgeWriteOutcome::Failed: return "failed";
    }
    return "failed";
}

// ==========================================
// RelationshipBuildResult
// ==========================================

void RelationshipBuildResult::record(EdgeWriteOutcome outcome) {
    switch (outcome) {
        case EdgeWriteOutcome::Created: relationships_created++; break;
        case EdgeWriteOutcome::AlreadyExists: already_existing++; break;
        case EdgeWriteOutcome::Failed: failed++; break;
    }
}

nlohmann::json RelationshipBuildResult::to_json() const {
    nlohmann::json j;
    j["relationshipsCreated"] = relationships_created;
    j["alreadyExisting"] = already_existing;
    j["failed"] = failed;
    j["pairsCompared"] = pairs_compared;
    j["pairsAboveThreshold"] = pairs_above_threshold;
    return j;
}

// ==========================================
// RelationshipBuilder
// ==========================================

RelationshipBuilder::RelationshipBuilder(VectorStore& vectors, GraphStore& graph)
    : vectors_(vectors), graph_(graph) {}

RelationshipBuildResult RelationshipBuilder::build_concept_relationships(double threshold, size_t limit) {
    spdlog::info("Building concept relationships (threshold={}, limit={})...", threshold, limit);

    RelationshipBuildResult result;
    EmbeddingBatch batch = fetch_embeddings(limit, "concept");

    if (batch.size() < 2) {
        spdlog::info("Not enough embeddings to build relationships");
        return result;
    }

    // Pass 1: similar embedding pairs owned by different activities
    std::vector<SimilarPair> pairs;
    std::set<std::string> processed;

    for (size_t i = 0; i < batch.size(); ++i) {
        for (size_t j = i + 1; j < batch.size(); ++j) {
            if (batch.metadatas[i].activity_id == batch.metadatas[j].activity_id) {
                continue;
            }

            auto similarity = compare(batch, i, j, result);
            if (!similarity || *similarity < threshold) {
                continue;
            }

            if (!processed.insert(unordered_pair_key(batch.ids[i], batch.ids[j])).second) {
                continue;
            }
            pairs.push_back({i, j, *similarity});
        }
    }

    result.pairs_above_threshold = static_cast<int>(pairs.size());
    spdlog::info("Found {} potential relationships", pairs.size());

    // Pass 2: cross product of the two activities' concepts
    std::map<std::string, std::vector<std::string>> concept_cache;
    std::set<std::string> written;

    for (const auto& pair : pairs) {
        auto concepts_a = concepts_for_activity(batch.metadatas[pair.first].activity_id, concept_cache);
        auto concepts_b = concepts_for_activity(batch.metadatas[pair.second].activity_id, concept_cache);

        for (const auto& concept_a : concepts_a) {
            for (const auto& concept_b : concepts_b) {
                if (concept_a == concept_b) continue;
                if (!written.insert(unordered_pair_key(concept_a, concept_b)).second) continue;

                result.record(write_edge(similarity_edge(
                    concept_a, concept_b, RelationType::RelatedTo, pair.similarity)));
            }
        }
    }

    spdlog::info("Created {} concept relationships ({} already existed, {} failed)",
                 result.relationships_created, result.already_existing, result.failed);
    return result;
}

RelationshipBuildResult RelationshipBuilder::build_activity_relationships(double threshold, size_t limit) {
    spdlog::info("Building activity relationships (threshold={}, limit={})...", threshold, limit);

    RelationshipBuildResult result;
    EmbeddingBatch batch = fetch_embeddings(limit, "activity");

    if (batch.size() < 2) {
        spdlog::info("Not enough activities to build relationships");
        return result;
    }

    std::vector<SimilarPair> pairs;
    std::set<std::string> processed;

    for (size_t i = 0; i < batch.size(); ++i) {
        const std::string& activity_a = batch.metadatas[i].activity_id;

        for (size_t j = i + 1; j < batch.size(); ++j) {
            const std::string& activity_b = batch.metadatas[j].activity_id;
            if (activity_a == activity_b) continue;

            std::string key = unordered_pair_key(activity_a, activity_b);
            if (processed.count(key) > 0) continue;

            auto similarity = compare(batch, i, j, result);
            if (!similarity || *similarity < threshold) {
                continue;
            }

            processed.insert(key);
            pairs.push_back({i, j, *similarity});
        }
    }

    result.pairs_above_threshold = static_cast<int>(pairs.size());
    spdlog::info("Found {} similar activity pairs", pairs.size());

    for (const auto& pair : pairs) {
        result.record(write_edge(similarity_edge(
            activity_node_id(batch.metadatas[pair.first].activity_id),
            activity_node_id(batch.metadatas[pair.second].activity_id),
            RelationType::Connects,
            pair.similarity)));
    }

    spdlog::info("Created {} activity relationships ({} already existed, {} failed)",
                 result.relationships_created, result.already_existing, result.failed);
    return result;
}

RelationshipBuildResult RelationshipBuilder::build_temporal_relationships(size_t limit) {
    spdlog::info("Building temporal relationships (limit={})...", limit);

    RelationshipBuildResult result;
    EmbeddingBatch batch = fetch_embeddings(limit, "temporal");

    std::vector<std::string> sessions;
    std::set<std::string> seen;
    for (const auto& metadata : batch.metadatas) {
        if (metadata.session_id.empty()) continue;
        if (seen.insert(metadata.session_id).second) {
            sessions.push_back(metadata.session_id);
        }
    }

    for (const auto& session_id : sessions) {
        std::vector<QueryRow> rows;
        try {
            rows = graph_.query(SessionActivitiesQuery{session_id});
        } catch (const std::exception& e) {
            spdlog::error("Error getting activities for session {}: {}", session_id, e.what());
            continue;
        }

        for (size_t k = 1; k < rows.size(); ++k) {
            const GraphNode& previous = rows[k - 1].node;
            const GraphNode& current = rows[k].node;

            GraphEdge edge;
            edge.from_id = previous.id;
            edge.to_id = current.id;
            edge.type = RelationType::Before;
            edge.properties["same_session"] = true;
            edge.properties["created_at"] = current_timestamp_iso();

            auto previous_time = parse_timestamp(node_property(previous, "timestamp"));
            auto current_time = parse_timestamp(node_property(current, "timestamp"));
            if (previous_time && current_time) {
                edge.properties["time_gap_seconds"] = *current_time - *previous_time;
            }

            result.pairs_above_threshold++;
            result.record(write_edge(edge));
        }
    }

    spdlog::info("Created {} temporal relationships across {} sessions",
                 result.relationships_created, sessions.size());
    return result;
}

EdgeWriteOutcome RelationshipBuilder::write_edge(const GraphEdge& edge) {
    try {
        graph_.create_relationship(edge);
        return EdgeWriteOutcome::Created;
    } catch (const EdgeAlreadyExists& e) {
        spdlog::debug("Relationship already exists: {}", e.edge_key());
        return EdgeWriteOutcome::AlreadyExists;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to create relationship {} -[{}]-> {}: {}",
                     edge.from_id, to_string(edge.type), edge.to_id, e.what());
        return EdgeWriteOutcome::Failed;
    }
}

// ==========================================
// Helper Methods
// ==========================================

EmbeddingBatch RelationshipBuilder::fetch_embeddings(size_t limit, const char* stage) {
    try {
        return vectors_.get_all_embeddings(limit);
    } catch (const std::exception& e) {
        spdlog::error("Error fetching embeddings for {} relationships from {}: {}",
                      stage, vectors_.get_store_name(), e.what());
        throw;
    }
}

std::vector<std::string> RelationshipBuilder::concepts_for_activity(
    const std::string& activity_id,
    std::map<std::string, std::vector<std::string>>& cache
) {
    auto cached = cache.find(activity_id);
    if (cached != cache.end()) {
        return cached->second;
    }

    std::vector<std::string> concept_ids;
    try {
        for (const auto& row : graph_.query(ActivityConceptsQuery{activity_node_id(activity_id)})) {
            concept_ids.push_back(row.node.id);
        }
    } catch (const std::exception& e) {
        spdlog::error("Error getting concepts for activity {}: {}", activity_id, e.what());
        concept_ids.clear();
    }

    cache[activity_id] = concept_ids;
    return concept_ids;
}

std::optional<double> RelationshipBuilder::compare(
    const EmbeddingBatch& batch,
    size_t i,
    size_t j,
    RelationshipBuildResult& result
) const {
    result.pairs_compared++;
    try {
        return cosine_similarity(batch.vectors[i], batch.vectors[j]);
    } catch (const DimensionMismatch& e) {
        spdlog::warn("Cannot compare {} and {}: {}", batch.ids[i], batch.ids[j], e.what());
        return std::nullopt;
    }
}

GraphEdge RelationshipBuilder::similarity_edge(
    const std::string& from_id,
    const std::string& to_id,
    RelationType type,
    double similarity
) {
    GraphEdge edge;
    edge.from_id = from_id;
    edge.to_id = to_id;
    edge.type = type;
    edge.properties["similarity"] = similarity;
    edge.properties["source"] = kSimilaritySource;
    edge.properties["created_at"] = current_timestamp_iso();
    return edge;
}

} // namespace curio
