#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace curio {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Metadata attached to an embedding by the ingestion pipeline
 */
struct EmbeddingMetadata {
    std::string activity_id;                        ///< Owning activity (without "activity_" prefix)
    std::string title;                              ///< Activity title
    std::string source_type;                        ///< "browser", "document", ...
    std::string timestamp;                          ///< ISO-8601
    std::string session_id;                         ///< Empty when the activity has no session
    std::map<std::string, std::string> extra;       ///< Any other metadata field

    nlohmann::json to_json() const;

    /**
     * @brief Parse metadata; numeric ids are accepted and stored as text
     */
    static EmbeddingMetadata from_json(const nlohmann::json& j);
};

/**
 * @brief An embedding produced upstream; read-only to the engine
 */
struct EmbeddingRecord {
    std::string id;
    std::vector<float> vector;
    std::string document;
    EmbeddingMetadata metadata;

    nlohmann::json to_json() const;
    static EmbeddingRecord from_json(const nlohmann::json& j);
};

/**
 * @brief Column-oriented page of embeddings: ids[i], vectors[i], metadatas[i]
 */
struct EmbeddingBatch {
    std::vector<std::string> ids;
    std::vector<std::vector<float>> vectors;
    std::vector<EmbeddingMetadata> metadatas;

    size_t size() const { return ids.size(); }
    bool empty() const { return ids.empty(); }

    void push_back(const EmbeddingRecord& record);
};

/**
 * @brief Failure talking to the vector store; fatal for a build
 */
class VectorStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Vector Store Interface
// ============================================================================

/**
 * @brief Source of embeddings consumed by the graph builders
 */
class VectorStore {
public:
    virtual ~VectorStore() = default;

    /**
     * @brief Fetch up to `limit` embeddings starting at `offset`
     * @throws VectorStoreError on retrieval failure
     */
    virtual EmbeddingBatch get_all_embeddings(size_t limit, size_t offset = 0) = 0;

    /**
     * @brief Fetch one embedding, nullopt if it does not exist
     * @throws VectorStoreError on retrieval failure
     */
    virtual std::optional<EmbeddingRecord> get_embedding_by_id(const std::string& id) = 0;

    /**
     * @brief Name for logs
     */
    virtual std::string get_store_name() const = 0;
};

} // namespace curio
