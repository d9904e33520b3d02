#pragma once

#include "curio/graph/graph_store.hpp"
#include "curio/vector/vector_store.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace curio {

/**
 * @brief Result of a single edge write
 */
enum class EdgeWriteOutcome {
    Created,
    AlreadyExists,
    Failed
};

const char* to_string(EdgeWriteOutcome outcome);

/**
 * @brief Counters reported by a relationship build
 */
struct RelationshipBuildResult {
    int relationships_created = 0;      ///< Edges written by this run
    int already_existing = 0;           ///< Writes answered with EdgeAlreadyExists
    int failed = 0;                     ///< Writes that failed for another reason
    int pairs_compared = 0;             ///< Similarity computations performed
    int pairs_above_threshold = 0;      ///< Pairs kept after threshold and dedup

    void record(EdgeWriteOutcome outcome);

    nlohmann::json to_json() const;
};

/**
 * @brief Builds similarity edges between Concepts and between Activities
 *
 * Every build fetches one page of embeddings, compares each unordered pair
 * once and writes edges for pairs whose cosine similarity reaches the
 * threshold. The cost is quadratic in `limit`, which is the only bound on
 * the work done: keep it in the low thousands at most.
 *
 * Embedding retrieval failures propagate. Everything after that is handled
 * per item: a failed concept lookup counts as "no concepts", a failed edge
 * write is logged and counted, and the loop moves on.
 */
class RelationshipBuilder {
public:
    RelationshipBuilder(VectorStore& vectors, GraphStore& graph);

    /**
     * @brief Link the concepts of similar activities with RELATED_TO edges
     *
     * Pairs of embeddings owned by the same activity are skipped. For each
     * surviving pair, every concept of one activity is linked to every
     * distinct concept of the other; an unordered concept pair is written
     * at most once per run.
     */
    RelationshipBuildResult build_concept_relationships(
        double threshold = 0.7,
        size_t limit = 100
    );

    /**
     * @brief Link similar activities directly with CONNECTS edges
     *
     * Deduplicated on the unordered activity-id pair.
     */
    RelationshipBuildResult build_activity_relationships(
        double threshold = 0.75,
        size_t limit = 50
    );

    /**
     * @brief Chain the activities of each session with BEFORE edges
     *
     * Sessions are taken from the metadata of the fetched embeddings; each
     * session's Activity nodes are ordered by timestamp and every activity
     * is linked to its successor.
     */
    RelationshipBuildResult build_temporal_relationships(size_t limit = 100);

    /**
     * @brief Write one edge and classify the outcome
     */
    EdgeWriteOutcome write_edge(const GraphEdge& edge);

private:
    VectorStore& vectors_;
    GraphStore& graph_;

    struct SimilarPair {
        size_t first;
        size_t second;
        double similarity;
    };

    EmbeddingBatch fetch_embeddings(size_t limit, const char* stage);

    std::vector<std::string> concepts_for_activity(
        const std::string& activity_id,
        std::map<std::string, std::vector<std::string>>& cache
    );

    // Similarity of batch entries i and j; nullopt when the vectors cannot be compared
    std::optional<double> compare(const EmbeddingBatch& batch, size_t i, size_t j,
                                  RelationshipBuildResult& result) const;

    static GraphEdge similarity_edge(
        const std::string& from_id,
        const std::string& to_id,
        RelationType type,
        double similarity
    );
};

} // namespace curio
