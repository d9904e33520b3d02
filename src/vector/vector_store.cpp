#include "curio/vector/vector_store.hpp"

namespace curio {

namespace {

// Metadata values arrive as strings or numbers depending on the writer
std::string scalar_to_string(const nlohmann::json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

} // anonymous namespace

// ==========================================
// EmbeddingMetadata
// ==========================================

nlohmann::json EmbeddingMetadata::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : extra) {
        j[key] = value;
    }
    j["activity_id"] = activity_id;
    if (!title.empty()) j["title"] = title;
    if (!source_type.empty()) j["source_type"] = source_type;
    if (!timestamp.empty()) j["timestamp"] = timestamp;
    if (!session_id.empty()) j["session_id"] = session_id;
    return j;
}

EmbeddingMetadata EmbeddingMetadata::from_json(const nlohmann::json& j) {
    EmbeddingMetadata metadata;
    if (!j.is_object()) {
        return metadata;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        std::string value = scalar_to_string(it.value());

        if (key == "activity_id") metadata.activity_id = value;
        else if (key == "title") metadata.title = value;
        else if (key == "source_type") metadata.source_type = value;
        else if (key == "timestamp") metadata.timestamp = value;
        else if (key == "session_id") metadata.session_id = value;
        else metadata.extra[key] = value;
    }

    return metadata;
}

// ==========================================
// EmbeddingRecord
// ==========================================

nlohmann::json EmbeddingRecord::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["embedding"] = vector;
    if (!document.empty()) {
        j["document"] = document;
    }
    j["metadata"] = metadata.to_json();
    return j;
}

EmbeddingRecord EmbeddingRecord::from_json(const nlohmann::json& j) {
    EmbeddingRecord record;
    record.id = j.at("id").get<std::string>();
    record.vector = j.at("embedding").get<std::vector<float>>();
    if (j.contains("document") && j["document"].is_string()) {
        record.document = j["document"].get<std::string>();
    }
    if (j.contains("metadata")) {
        record.metadata = EmbeddingMetadata::from_json(j["metadata"]);
    }
    return record;
}

// ==========================================
// EmbeddingBatch
// ==========================================

void EmbeddingBatch::push_back(const EmbeddingRecord& record) {
    ids.push_back(record.id);
    vectors.push_back(record.vector);
    metadatas.push_back(record.metadata);
}

} // namespace curio
