#pragma once

#include "curio/graph/graph_store.hpp"
#include "curio/vector/vector_store.hpp"
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace curio {

/**
 * @brief How topic node ids are assigned
 *
 * Sequential numbers topics per run (topic_1, topic_2, ...), so a re-run
 * does not recognise clusters it produced before. ContentHash derives the
 * id from the sorted member ids, so an identical cluster maps to the same
 * node on every run.
 */
enum class TopicIdScheme {
    Sequential,
    ContentHash
};

std::string to_string(TopicIdScheme scheme);

/**
 * @throws std::invalid_argument for anything but "sequential" / "content_hash"
 */
TopicIdScheme topic_id_scheme_from_string(const std::string& text);

/**
 * @brief Item fed to the clustering pass
 */
struct ClusterItem {
    std::string id;
    std::vector<float> vector;
};

/**
 * @brief Greedy single-pass clustering
 *
 * Items are visited in the given order. Each unassigned item seeds a new
 * cluster and pulls in every later unassigned item whose similarity to the
 * seed reaches `similarity_threshold`. Clusters are never revisited.
 * Clusters smaller than `min_cluster_size` are dropped and their members
 * stay unclustered.
 *
 * The result depends on the input order; it is not a stable clustering.
 *
 * @return Member ids of each surviving cluster, seed first
 */
std::vector<std::vector<std::string>> greedy_cluster(
    const std::vector<ClusterItem>& items,
    double similarity_threshold,
    size_t min_cluster_size
);

/**
 * @brief "topic_" + 16 hex digits of FNV-1a over the sorted member ids
 */
std::string content_topic_id(std::vector<std::string> member_ids);

/**
 * @brief Counters reported by a clustering run
 */
struct TopicClusterResult {
    int clusters_created = 0;           ///< Topics materialised in the graph
    int clusters_found = 0;             ///< Clusters that reached min size
    int concepts_considered = 0;        ///< Concept nodes enumerated
    int concepts_with_embeddings = 0;   ///< Concepts whose embedding resolved
    std::vector<std::string> topic_ids; ///< Ids of the created topics

    nlohmann::json to_json() const;
};

/**
 * @brief Groups Concepts into Topic nodes by embedding similarity
 *
 * A concept's embedding is the embedding of the first activity it was
 * learned from. Each surviving cluster becomes a Topic node with one
 * CONTAINS edge per member. A cluster whose topic or member edges cannot
 * be written is logged and skipped; the remaining clusters are still
 * written.
 */
class TopicClusterer {
public:
    TopicClusterer(VectorStore& vectors, GraphStore& graph,
                   TopicIdScheme id_scheme = TopicIdScheme::Sequential);

    TopicClusterResult build_topic_clusters(
        size_t min_cluster_size = 3,
        double similarity_threshold = 0.65
    );

    TopicIdScheme get_id_scheme() const { return id_scheme_; }
    void set_id_scheme(TopicIdScheme scheme) { id_scheme_ = scheme; }

private:
    VectorStore& vectors_;
    GraphStore& graph_;
    TopicIdScheme id_scheme_;

    // Concepts with a resolvable embedding, in enumeration order
    std::vector<ClusterItem> resolve_embeddings(
        const std::vector<QueryRow>& concepts,
        TopicClusterResult& result
    );

    bool materialize_topic(
        const std::vector<std::string>& members,
        size_t ordinal,
        TopicClusterResult& result
    );
};

} // namespace curio
