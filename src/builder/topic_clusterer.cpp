#include "curio/builder/topic_clusterer.hpp"
#include "curio/graph/similarity.hpp"
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace curio {

std::string to_string(TopicIdScheme scheme) {
    switch (scheme) {
        case TopicIdScheme::Sequential: return "sequential";
        case TopicIdScheme::ContentHash: return "content_hash";
    }
    return "sequential";
}

TopicIdScheme topic_id_scheme_from_string(const std::string& text) {
    if (text == "sequential") return TopicIdScheme::Sequential;
    if (text == "content_hash") return TopicIdScheme::ContentHash;
    throw std::invalid_argument("Unknown topic id scheme: " + text);
}

// ==========================================
// Clustering
// ==========================================

std::vector<std::vector<std::string>> greedy_cluster(
    const std::vector<ClusterItem>& items,
    double similarity_threshold,
    size_t min_cluster_size
) {
    std::vector<std::vector<std::string>> clusters;
    std::vector<bool> assigned(items.size(), false);

    for (size_t seed = 0; seed < items.size(); ++seed) {
        if (assigned[seed]) continue;

        std::vector<std::string> cluster = {items[seed].id};
        assigned[seed] = true;

        for (size_t other = 0; other < items.size(); ++other) {
            if (assigned[other]) continue;

            double similarity = 0.0;
            try {
                similarity = cosine_similarity(items[seed].vector, items[other].vector);
            } catch (const DimensionMismatch& e) {
                spdlog::debug("Cannot compare {} and {}: {}", items[seed].id, items[other].id, e.what());
                continue;
            }

            if (similarity >= similarity_threshold) {
                cluster.push_back(items[other].id);
                assigned[other] = true;
            }
        }

        if (cluster.size() >= min_cluster_size) {
            clusters.push_back(std::move(cluster));
        }
    }

    return clusters;
}

std::string content_topic_id(std::vector<std::string> member_ids) {
    std::sort(member_ids.begin(), member_ids.end());

    // FNV-1a, 64 bit
    uint64_t hash = 14695981039346656037ULL;
    for (const auto& id : member_ids) {
        for (unsigned char c : id) {
            hash ^= c;
            hash *= 1099511628211ULL;
        }
        hash ^= 0x1f;
        hash *= 1099511628211ULL;
    }

    std::stringstream ss;
    ss << "topic_" << std::hex << std::setw(16) << std::setfill('0') << hash;
    return ss.str();
}

nlohmann::json TopicClusterResult::to_json() const {
    nlohmann::json j;
    j["clustersCreated"] = clusters_created;
    j["clustersFound"] = clusters_found;
    j["conceptsConsidered"] = concepts_considered;
    j["conceptsWithEmbeddings"] = concepts_with_embeddings;
    j["topicIds"] = topic_ids;
    return j;
}

// ==========================================
// TopicClusterer
// ==========================================

TopicClusterer::TopicClusterer(VectorStore& vectors, GraphStore& graph, TopicIdScheme id_scheme)
    : vectors_(vectors), graph_(graph), id_scheme_(id_scheme) {}

TopicClusterResult TopicClusterer::build_topic_clusters(size_t min_cluster_size, double similarity_threshold) {
    spdlog::info("Building topic clusters (min size={}, threshold={})...",
                 min_cluster_size, similarity_threshold);

    TopicClusterResult result;

    std::vector<QueryRow> concepts;
    try {
        concepts = graph_.query(ConceptsQuery{});
    } catch (const std::exception& e) {
        spdlog::error("Error listing concepts for topic clustering: {}", e.what());
        throw;
    }
    result.concepts_considered = static_cast<int>(concepts.size());

    if (concepts.size() < min_cluster_size) {
        spdlog::info("Not enough concepts to build clusters");
        return result;
    }

    auto items = resolve_embeddings(concepts, result);
    auto clusters = greedy_cluster(items, similarity_threshold, min_cluster_size);
    result.clusters_found = static_cast<int>(clusters.size());
    spdlog::info("Found {} topic clusters among {} concepts with embeddings",
                 clusters.size(), items.size());

    for (size_t i = 0; i < clusters.size(); ++i) {
        materialize_topic(clusters[i], i + 1, result);
    }

    spdlog::info("Created {} topic clusters", result.clusters_created);
    return result;
}

std::vector<ClusterItem> TopicClusterer::resolve_embeddings(
    const std::vector<QueryRow>& concepts,
    TopicClusterResult& result
) {
    std::vector<ClusterItem> items;

    for (const auto& row : concepts) {
        const std::string& concept_id = row.node.id;
        try {
            auto activities = graph_.query(ActivitiesForConceptQuery{concept_id});
            if (activities.empty()) {
                continue;
            }

            std::string activity_id = activity_id_from_node_id(activities.front().node.id);
            auto embedding = vectors_.get_embedding_by_id(embedding_id_for_activity(activity_id));
            if (!embedding) {
                spdlog::debug("No embedding found for concept: {}", concept_id);
                continue;
            }

            items.push_back({concept_id, embedding->vector});
        } catch (const std::exception& e) {
            spdlog::debug("No embedding found for concept {}: {}", concept_id, e.what());
        }
    }

    result.concepts_with_embeddings = static_cast<int>(items.size());
    return items;
}

bool TopicClusterer::materialize_topic(
    const std::vector<std::string>& members,
    size_t ordinal,
    TopicClusterResult& result
) {
    GraphNode topic;
    topic.id = id_scheme_ == TopicIdScheme::ContentHash
        ? content_topic_id(members)
        : "topic_" + std::to_string(ordinal);
    topic.label = NodeLabel::Topic;
    topic.properties["name"] = "Topic Cluster " + std::to_string(ordinal);
    topic.properties["conceptCount"] = members.size();
    topic.properties["created_at"] = current_timestamp_iso();

    try {
        if (graph_.get_node(topic.id, NodeLabel::Topic)) {
            // The stored node keeps its name and conceptCount from the earlier cluster
            spdlog::debug("Reusing existing topic node {} for {} concepts", topic.id, members.size());
        }
        graph_.create_node(topic);

        for (const auto& concept_id : members) {
            GraphEdge edge;
            edge.from_id = topic.id;
            edge.to_id = concept_id;
            edge.type = RelationType::Contains;
            try {
                graph_.create_relationship(edge);
            } catch (const EdgeAlreadyExists& e) {
                spdlog::debug("Topic membership already recorded: {}", e.edge_key());
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Error creating topic cluster {}: {}", topic.id, e.what());
        return false;
    }

    result.clusters_created++;
    result.topic_ids.push_back(topic.id);
    return true;
}

} // namespace curio
