#pragma once

#include "curio/vector/vector_store.hpp"
#include <mutex>
#include <string>

namespace curio {

/**
 * @brief Connection settings for a ChromaDB server
 */
struct ChromaConfig {
    std::string base_url = "http://localhost:8000";    ///< Server root, no trailing slash needed
    std::string collection = "knowledge_base";         ///< Collection name
    int timeout_seconds = 30;                          ///< Per-request timeout
};

/**
 * @brief Vector store reading a ChromaDB collection over its REST API
 *
 * The collection id is resolved on first use with
 * GET /api/v1/collections/{name}; records are read with
 * POST /api/v1/collections/{id}/get. Transport failures, non-2xx replies
 * and malformed payloads raise VectorStoreError.
 */
class ChromaVectorStore : public VectorStore {
public:
    explicit ChromaVectorStore(ChromaConfig config);

    EmbeddingBatch get_all_embeddings(size_t limit, size_t offset = 0) override;
    std::optional<EmbeddingRecord> get_embedding_by_id(const std::string& id) override;
    std::string get_store_name() const override { return "chroma"; }

    const ChromaConfig& get_config() const { return config_; }

    /**
     * @brief Convert a Chroma "get" response into a batch
     * @throws VectorStoreError if the columns are missing or misaligned
     */
    static EmbeddingBatch parse_get_response(const nlohmann::json& response);

private:
    ChromaConfig config_;
    std::mutex mutex_;
    std::string collection_id_;

    std::string resolve_collection_id();
    nlohmann::json post_get(const nlohmann::json& body);
    std::string url(const std::string& path) const;
};

} // namespace curio
