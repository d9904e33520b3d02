#include "curio/vector/chroma_vector_store.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <utility>

using json = nlohmann::json;

namespace curio {

// ============================================================================
// Helper Functions for HTTP Requests
// ============================================================================

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// GET when payload is null, POST otherwise
std::string http_request(const std::string& url, const std::string* payload, int timeout_seconds) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw VectorStoreError("Failed to initialize CURL");
    }

    std::string response;
    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    header_list = curl_slist_append(header_list, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    if (payload) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload->c_str());
    }

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        std::string error = curl_easy_strerror(res);
        curl_easy_cleanup(curl);
        throw VectorStoreError("CURL request to " + url + " failed: " + error);
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (http_code < 200 || http_code >= 300) {
        throw VectorStoreError(
            "HTTP request to " + url + " failed with code " +
            std::to_string(http_code) + ": " + response);
    }

    return response;
}

json parse_body(const std::string& body, const std::string& what) {
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw VectorStoreError("Malformed " + what + " response: " + e.what());
    }
}

} // anonymous namespace

// ============================================================================
// ChromaVectorStore
// ============================================================================

ChromaVectorStore::ChromaVectorStore(ChromaConfig config)
    : config_(std::move(config)) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

EmbeddingBatch ChromaVectorStore::get_all_embeddings(size_t limit, size_t offset) {
    json body;
    body["limit"] = limit;
    body["offset"] = offset;
    body["include"] = {"embeddings", "metadatas", "documents"};

    EmbeddingBatch batch = parse_get_response(post_get(body));
    spdlog::debug("Fetched {} embeddings from Chroma collection {}", batch.size(), config_.collection);
    return batch;
}

std::optional<EmbeddingRecord> ChromaVectorStore::get_embedding_by_id(const std::string& id) {
    json body;
    body["ids"] = {id};
    body["include"] = {"embeddings", "metadatas", "documents"};

    json response = post_get(body);
    EmbeddingBatch batch = parse_get_response(response);
    if (batch.empty()) {
        return std::nullopt;
    }

    EmbeddingRecord record;
    record.id = batch.ids[0];
    record.vector = batch.vectors[0];
    record.metadata = batch.metadatas[0];
    if (response.contains("documents") && response["documents"].is_array() &&
        !response["documents"].empty() && response["documents"][0].is_string()) {
        record.document = response["documents"][0].get<std::string>();
    }
    return record;
}

EmbeddingBatch ChromaVectorStore::parse_get_response(const json& response) {
    if (!response.contains("ids") || !response["ids"].is_array()) {
        throw VectorStoreError("Chroma response has no ids column");
    }

    const json& ids = response["ids"];
    const json& embeddings = response.contains("embeddings") ? response["embeddings"] : json();
    const json& metadatas = response.contains("metadatas") ? response["metadatas"] : json();

    if (!embeddings.is_array() || embeddings.size() != ids.size()) {
        throw VectorStoreError("Chroma response embeddings do not line up with ids");
    }

    EmbeddingBatch batch;
    try {
        for (size_t i = 0; i < ids.size(); ++i) {
            EmbeddingRecord record;
            record.id = ids[i].get<std::string>();
            record.vector = embeddings[i].get<std::vector<float>>();
            if (metadatas.is_array() && i < metadatas.size()) {
                record.metadata = EmbeddingMetadata::from_json(metadatas[i]);
            }
            batch.push_back(record);
        }
    } catch (const json::exception& e) {
        throw VectorStoreError(std::string("Malformed Chroma record: ") + e.what());
    }
    return batch;
}

std::string ChromaVectorStore::resolve_collection_id() {
    std::lock_guard lock(mutex_);
    if (!collection_id_.empty()) {
        return collection_id_;
    }

    std::string body = http_request(url("/api/v1/collections/" + config_.collection),
                                    nullptr, config_.timeout_seconds);
    json j = parse_body(body, "collection");
    if (!j.contains("id") || !j["id"].is_string()) {
        throw VectorStoreError("Chroma collection " + config_.collection + " has no id");
    }

    collection_id_ = j["id"].get<std::string>();
    spdlog::info("Chroma collection {} resolved to {}", config_.collection, collection_id_);
    return collection_id_;
}

json ChromaVectorStore::post_get(const json& body) {
    std::string collection_id = resolve_collection_id();
    std::string payload = body.dump();
    std::string response = http_request(url("/api/v1/collections/" + collection_id + "/get"),
                                        &payload, config_.timeout_seconds);
    return parse_body(response, "get");
}

std::string ChromaVectorStore::url(const std::string& path) const {
    return config_.base_url + path;
}

} // namespace curio
