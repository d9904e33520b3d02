#include "curio/vector/memory_vector_store.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace curio {

EmbeddingBatch InMemoryVectorStore::get_all_embeddings(size_t limit, size_t offset) {
    std::lock_guard lock(mutex_);

    EmbeddingBatch batch;
    for (size_t i = offset; i < records_.size() && batch.size() < limit; ++i) {
        batch.push_back(records_[i]);
    }
    return batch;
}

std::optional<EmbeddingRecord> InMemoryVectorStore::get_embedding_by_id(const std::string& id) {
    std::lock_guard lock(mutex_);

    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return records_[it->second];
}

void InMemoryVectorStore::add(const EmbeddingRecord& record) {
    if (record.id.empty()) {
        throw VectorStoreError("Embedding must have an id");
    }

    std::lock_guard lock(mutex_);
    if (index_.count(record.id) > 0) {
        throw VectorStoreError("Embedding already exists: " + record.id);
    }

    index_[record.id] = records_.size();
    records_.push_back(record);
}

size_t InMemoryVectorStore::size() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

nlohmann::json InMemoryVectorStore::to_json() const {
    std::lock_guard lock(mutex_);

    nlohmann::json embeddings = nlohmann::json::array();
    for (const auto& record : records_) {
        embeddings.push_back(record.to_json());
    }

    nlohmann::json j;
    j["embeddings"] = embeddings;
    return j;
}

void InMemoryVectorStore::load_json(const nlohmann::json& j) {
    {
        std::lock_guard lock(mutex_);
        records_.clear();
        index_.clear();
    }

    if (!j.contains("embeddings")) {
        throw VectorStoreError("Embedding document has no \"embeddings\" array");
    }

    try {
        for (const auto& item : j.at("embeddings")) {
            add(EmbeddingRecord::from_json(item));
        }
    } catch (const nlohmann::json::exception& e) {
        throw VectorStoreError(std::string("Malformed embedding record: ") + e.what());
    }

    spdlog::info("Loaded {} embeddings", size());
}

void InMemoryVectorStore::save_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw VectorStoreError("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

std::unique_ptr<InMemoryVectorStore> InMemoryVectorStore::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw VectorStoreError("Failed to open file for reading: " + filename);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw VectorStoreError("Malformed embeddings file " + filename + ": " + e.what());
    }

    auto store = std::make_unique<InMemoryVectorStore>();
    store->load_json(j);
    return store;
}

} // namespace curio
