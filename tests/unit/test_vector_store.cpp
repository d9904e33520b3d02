#include <gtest/gtest.h>
#include "curio/vector/chroma_vector_store.hpp"
#include "curio/vector/memory_vector_store.hpp"
#include "test_fixtures.hpp"
#include <cstdio>
#include <fstream>

using namespace curio;
using namespace curio::test;

// ==========================================
// Metadata Tests
// ==========================================

TEST(EmbeddingMetadataTest, KnownAndExtraFields) {
    auto metadata = EmbeddingMetadata::from_json({
        {"activity_id", 42},
        {"title", "Intro to Graphs"},
        {"session_id", "s9"},
        {"url", "https://example.org/graphs"}
    });

    EXPECT_EQ(metadata.activity_id, "42");
    EXPECT_EQ(metadata.title, "Intro to Graphs");
    EXPECT_EQ(metadata.session_id, "s9");
    EXPECT_TRUE(metadata.timestamp.empty());
    ASSERT_EQ(metadata.extra.count("url"), 1u);
    EXPECT_EQ(metadata.extra["url"], "https://example.org/graphs");

    auto j = metadata.to_json();
    EXPECT_EQ(j["activity_id"], "42");
    EXPECT_EQ(j["url"], "https://example.org/graphs");
    EXPECT_FALSE(j.contains("timestamp"));
}

TEST(EmbeddingMetadataTest, NonObjectIsEmpty) {
    auto metadata = EmbeddingMetadata::from_json(nullptr);
    EXPECT_TRUE(metadata.activity_id.empty());
    EXPECT_TRUE(metadata.extra.empty());
}

// ==========================================
// In-Memory Store Tests
// ==========================================

TEST(InMemoryVectorStoreTest, PagesInInsertionOrder) {
    InMemoryVectorStore store;
    for (const std::string& id : {"1", "2", "3", "4", "5"}) {
        store.add(make_embedding(id, {1.0f, 0.0f}));
    }

    auto first = store.get_all_embeddings(2);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first.ids[0], "embedding_1");
    EXPECT_EQ(first.ids[1], "embedding_2");
    EXPECT_EQ(first.metadatas[1].activity_id, "2");

    auto tail = store.get_all_embeddings(10, 3);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail.ids[0], "embedding_4");

    EXPECT_TRUE(store.get_all_embeddings(10, 5).empty());
    EXPECT_TRUE(store.get_all_embeddings(0).empty());
}

TEST(InMemoryVectorStoreTest, GetById) {
    InMemoryVectorStore store;
    store.add(make_embedding("7", {0.5f, 0.5f}, "s1", "2026-01-01T10:00:00Z"));

    auto record = store.get_embedding_by_id("embedding_7");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->vector, (std::vector<float>{0.5f, 0.5f}));
    EXPECT_EQ(record->metadata.session_id, "s1");

    EXPECT_FALSE(store.get_embedding_by_id("embedding_8").has_value());
}

TEST(InMemoryVectorStoreTest, RejectsDuplicateAndEmptyIds) {
    InMemoryVectorStore store;
    store.add(make_embedding("1", {1.0f}));
    EXPECT_THROW(store.add(make_embedding("1", {2.0f})), VectorStoreError);

    EmbeddingRecord anonymous;
    EXPECT_THROW(store.add(anonymous), VectorStoreError);
    EXPECT_EQ(store.size(), 1u);
}

TEST(InMemoryVectorStoreTest, SaveAndLoad) {
    InMemoryVectorStore store;
    EmbeddingRecord record = make_embedding("1", {0.25f, -0.5f}, "s1");
    record.document = "Graph theory notes";
    store.add(record);
    store.add(make_embedding("2", {1.0f, 0.0f}));

    std::string path = ::testing::TempDir() + "curio_embeddings_test.json";
    store.save_to_json(path);
    auto loaded = InMemoryVectorStore::load_from_json(path);
    std::remove(path.c_str());

    ASSERT_EQ(loaded->size(), 2u);
    auto first = loaded->get_embedding_by_id("embedding_1");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->document, "Graph theory notes");
    EXPECT_EQ(first->vector, (std::vector<float>{0.25f, -0.5f}));
    EXPECT_EQ(first->metadata.session_id, "s1");
}

TEST(InMemoryVectorStoreTest, LoadRejectsBadDocuments) {
    InMemoryVectorStore store;
    EXPECT_THROW(store.load_json({{"records", nlohmann::json::array()}}), VectorStoreError);
    nlohmann::json missing_vector;
    missing_vector["embeddings"] = nlohmann::json::array({nlohmann::json::object({{"id", "x"}})});
    EXPECT_THROW(store.load_json(missing_vector), VectorStoreError);
    EXPECT_THROW(InMemoryVectorStore::load_from_json("/nonexistent/embeddings.json"), VectorStoreError);

    std::string path = ::testing::TempDir() + "curio_bad_embeddings.json";
    {
        std::ofstream file(path);
        file << "[1, 2";
    }
    EXPECT_THROW(InMemoryVectorStore::load_from_json(path), VectorStoreError);
    std::remove(path.c_str());
}

// ==========================================
// Chroma Store Tests
// ==========================================

TEST(ChromaVectorStoreTest, ParsesGetResponse) {
    nlohmann::json response;
    response["ids"] = nlohmann::json::array({"embedding_1", "embedding_2"});
    response["embeddings"] = nlohmann::json::array({
        nlohmann::json::array({1.0, 0.0}),
        nlohmann::json::array({0.0, 1.0})
    });
    response["metadatas"] = nlohmann::json::array({
        nlohmann::json::object({{"activity_id", "1"}}),
        nullptr
    });
    response["documents"] = nlohmann::json::array({"first", nullptr});

    EmbeddingBatch batch = ChromaVectorStore::parse_get_response(response);
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch.ids[1], "embedding_2");
    EXPECT_EQ(batch.vectors[1], (std::vector<float>{0.0f, 1.0f}));
    EXPECT_EQ(batch.metadatas[0].activity_id, "1");
    EXPECT_TRUE(batch.metadatas[1].activity_id.empty());
}

TEST(ChromaVectorStoreTest, RejectsMisalignedColumns) {
    nlohmann::json no_ids;
    no_ids["embeddings"] = nlohmann::json::array();
    EXPECT_THROW(ChromaVectorStore::parse_get_response(no_ids), VectorStoreError);

    nlohmann::json short_embeddings;
    short_embeddings["ids"] = nlohmann::json::array({"a", "b"});
    short_embeddings["embeddings"] = nlohmann::json::array({nlohmann::json::array({1.0})});
    EXPECT_THROW(ChromaVectorStore::parse_get_response(short_embeddings), VectorStoreError);

    nlohmann::json bad_vector;
    bad_vector["ids"] = nlohmann::json::array({"a"});
    bad_vector["embeddings"] = nlohmann::json::array({"not a vector"});
    EXPECT_THROW(ChromaVectorStore::parse_get_response(bad_vector), VectorStoreError);
}

TEST(ChromaVectorStoreTest, TrailingSlashIsTrimmed) {
    ChromaConfig config;
    config.base_url = "http://localhost:8000//";
    ChromaVectorStore store(config);
    EXPECT_EQ(store.get_config().base_url, "http://localhost:8000");
    EXPECT_EQ(store.get_store_name(), "chroma");
}

TEST(ChromaVectorStoreTest, UnreachableServerRaisesVectorStoreError) {
    ChromaConfig config;
    config.base_url = "http://127.0.0.1:1";
    config.timeout_seconds = 2;
    ChromaVectorStore store(config);

    EXPECT_THROW(store.get_all_embeddings(10), VectorStoreError);
}
