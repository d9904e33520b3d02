#pragma once

#include "curio/vector/vector_store.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace curio {

/**
 * @brief Vector store backed by memory, loadable from a JSON export
 *
 * File format: {"embeddings": [{"id", "embedding", "document", "metadata"}]}
 * Records are returned in insertion order.
 */
class InMemoryVectorStore : public VectorStore {
public:
    InMemoryVectorStore() = default;

    EmbeddingBatch get_all_embeddings(size_t limit, size_t offset = 0) override;
    std::optional<EmbeddingRecord> get_embedding_by_id(const std::string& id) override;
    std::string get_store_name() const override { return "memory"; }

    /**
     * @brief Add a record
     * @throws VectorStoreError if the id is empty or already present
     */
    void add(const EmbeddingRecord& record);

    size_t size() const;

    nlohmann::json to_json() const;
    void load_json(const nlohmann::json& j);

    void save_to_json(const std::string& filename) const;
    static std::unique_ptr<InMemoryVectorStore> load_from_json(const std::string& filename);

private:
    mutable std::mutex mutex_;
    std::vector<EmbeddingRecord> records_;
    std::map<std::string, size_t> index_;      // id -> position in records_
};

} // namespace curio
