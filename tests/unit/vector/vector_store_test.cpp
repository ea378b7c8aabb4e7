#include <gtest/gtest.h>

#include <filesystem>
#include <future>
#include <set>
#include <thread>

#include "../../common/utilities_test.hpp"
#include "ragkit_core/vector/vector_store.hpp"

namespace ragkit_core {

using ragkit_tests::TestUtilities;

class VectorStoreTest : public ragkit_tests::StoreTestBase {
 protected:
  Chunk chunk(const std::string &tenant, const std::string &doc, int index) {
    return TestUtilities::create_test_chunk(tenant, doc, doc + ".txt", index,
                                            tenant + "/" + doc + "/" + std::to_string(index));
  }
};

TEST_F(VectorStoreTest, EmptyStore_IsAbsentAndSearchReturnsEmpty) {
  auto store = open_vector_store();
  EXPECT_EQ(store->state(), IndexState::Absent);
  EXPECT_TRUE(store->search({1.0f, 0.0f}, 5, "tenant-a").empty());
}

TEST_F(VectorStoreTest, TwoDimensionalStore_ReturnsNearestChunk) {
  auto store = open_vector_store();
  store->add_chunks({chunk("t", "d", 0), chunk("t", "d", 1)}, {{1.0f, 0.0f}, {0.0f, 1.0f}});

  auto results = store->search({1.0f, 0.0f}, 1, "t");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk.chunk_index, 0);
  EXPECT_NEAR(results[0].score, 1.0f, 1e-5);
  EXPECT_EQ(store->state(), IndexState::Loaded);
}

TEST_F(VectorStoreTest, AddChunks_StoresNormalizedEmbeddingsAndReturnsIds) {
  auto store = open_vector_store();
  auto ids = store->add_chunks({chunk("t", "d", 0)}, {{3.0f, 4.0f}});

  ASSERT_EQ(ids.size(), 1u);
  auto stored = metadata_store_->get_chunk(ids[0], /*with_embedding=*/true);
  ASSERT_TRUE(stored.has_value());
  ASSERT_EQ(stored->embedding.size(), 2u);
  EXPECT_NEAR(stored->embedding[0], 0.6f, 1e-6);
  EXPECT_NEAR(stored->embedding[1], 0.8f, 1e-6);
}

TEST_F(VectorStoreTest, AddChunks_RejectsMismatchedInput) {
  auto store = open_vector_store();
  EXPECT_THROW(store->add_chunks({chunk("t", "d", 0)}, {}), std::invalid_argument);
  EXPECT_THROW(store->add_chunks({chunk("t", "d", 0), chunk("t", "d", 1)}, {{1.0f, 0.0f}, {1.0f}}),
               std::invalid_argument);
  EXPECT_EQ(metadata_store_->count_chunks(), 0);
}

TEST_F(VectorStoreTest, Search_NeverCrossesTenants) {
  auto store = open_vector_store();
  std::vector<Chunk> chunks;
  std::vector<std::vector<float>> embeddings;
  for (int i = 0; i < 6; ++i) {
    chunks.push_back(chunk(i % 2 == 0 ? "tenant-a" : "tenant-b", "d", i));
    embeddings.push_back({1.0f, static_cast<float>(i) * 0.1f});
  }
  store->add_chunks(chunks, embeddings);

  for (const std::string tenant : {"tenant-a", "tenant-b"}) {
    auto results = store->search({1.0f, 0.0f}, 10, tenant);
    EXPECT_EQ(results.size(), 3u);
    for (const auto &result : results) {
      EXPECT_EQ(result.chunk.tenant_id, tenant);
    }
  }
  EXPECT_TRUE(store->search({1.0f, 0.0f}, 10, "tenant-c").empty());
  EXPECT_TRUE(store->search({1.0f, 0.0f}, 10, "").empty());
}

TEST_F(VectorStoreTest, Search_FiltersByDocId) {
  auto store = open_vector_store();
  store->add_chunks({chunk("t", "alpha", 0), chunk("t", "beta", 0), chunk("t", "alpha", 1)},
                    {{1.0f, 0.0f}, {1.0f, 0.1f}, {1.0f, 0.2f}});

  auto results = store->search({1.0f, 0.0f}, 5, "t", std::string("alpha"));
  ASSERT_EQ(results.size(), 2u);
  for (const auto &result : results) {
    EXPECT_EQ(result.chunk.doc_id, "alpha");
  }

  // An empty doc id means no document filter.
  EXPECT_EQ(store->search({1.0f, 0.0f}, 5, "t", std::string()).size(), 3u);
}

TEST_F(VectorStoreTest, Search_FiltersAfterRankingSoNarrowFiltersMayReturnFewerThanK) {
  auto store = open_vector_store();
  std::vector<Chunk> chunks;
  std::vector<std::vector<float>> embeddings;
  // Twenty close neighbours for tenant "crowd", then one far chunk for tenant "lonely".
  for (int i = 0; i < 20; ++i) {
    chunks.push_back(chunk("crowd", "d", i));
    embeddings.push_back({1.0f, 0.01f * static_cast<float>(i)});
  }
  chunks.push_back(chunk("lonely", "d", 0));
  embeddings.push_back({0.0f, 1.0f});
  store->add_chunks(chunks, embeddings);

  // k=1 over-fetches 5 neighbours, all from "crowd".
  EXPECT_TRUE(store->search({1.0f, 0.0f}, 1, "lonely").empty());
  // k=5 over-fetches all 21 and finds it.
  EXPECT_EQ(store->search({1.0f, 0.0f}, 5, "lonely").size(), 1u);
}

TEST_F(VectorStoreTest, SearchAfterAdd_SeesNewChunks) {
  auto store = open_vector_store();
  store->add_chunks({chunk("t", "d", 0)}, {{1.0f, 0.0f}});
  EXPECT_EQ(store->search({0.0f, 1.0f}, 5, "t").size(), 1u);

  store->add_chunks({chunk("t", "d", 1)}, {{0.0f, 1.0f}});
  auto results = store->search({0.0f, 1.0f}, 5, "t");
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk.chunk_index, 1);
}

TEST_F(VectorStoreTest, Reload_GivesIdenticalSearchResults) {
  std::vector<ChunkSearchResult> before;
  {
    auto store = open_vector_store();
    store->add_chunks({chunk("t", "d", 0), chunk("t", "d", 1), chunk("t", "d", 2)},
                      {{1.0f, 0.2f}, {0.3f, 1.0f}, {0.7f, 0.7f}});
    before = store->search({0.9f, 0.4f}, 3, "t");
  }

  auto reloaded = open_vector_store();
  EXPECT_EQ(reloaded->state(), IndexState::Loaded);
  auto after = reloaded->search({0.9f, 0.4f}, 3, "t");

  ASSERT_EQ(before.size(), after.size());
  for (size_t i = 0; i < before.size(); ++i) {
    EXPECT_EQ(before[i].chunk.id, after[i].chunk.id);
    EXPECT_NEAR(before[i].score, after[i].score, 1e-6);
  }
}

TEST_F(VectorStoreTest, CorruptSnapshot_RebuildsFromMetadata) {
  {
    auto store = open_vector_store();
    store->add_chunks({chunk("t", "d", 0), chunk("t", "d", 1)}, {{1.0f, 0.0f}, {0.0f, 1.0f}});
  }
  TestUtilities::write_file(snapshot_path_, "garbage bytes");

  auto store = open_vector_store();

  EXPECT_EQ(store->state(), IndexState::Loaded);
  EXPECT_EQ(store->indexed_count(), 2);
  auto results = store->search({0.0f, 1.0f}, 1, "t");
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk.chunk_index, 1);
}

TEST_F(VectorStoreTest, MissingSnapshot_RebuildsFromMetadata) {
  {
    auto store = open_vector_store();
    store->add_chunks({chunk("t", "d", 0)}, {{1.0f, 0.0f}});
  }
  std::filesystem::remove(snapshot_path_);

  auto store = open_vector_store();
  EXPECT_EQ(store->indexed_count(), 1);
  EXPECT_TRUE(std::filesystem::exists(snapshot_path_));
}

TEST_F(VectorStoreTest, StaleSnapshot_RebuildsWhenCountsDiffer) {
  {
    auto store = open_vector_store();
    store->add_chunks({chunk("t", "d", 0)}, {{1.0f, 0.0f}});
  }
  // Rows committed after the snapshot was written, as after a crash.
  Chunk late = chunk("t", "d", 1);
  late.embedding = {0.0f, 1.0f};
  metadata_store_->append_chunks({late});

  auto store = open_vector_store();
  EXPECT_EQ(store->indexed_count(), 2);
  auto results = store->search({0.0f, 1.0f}, 1, "t");
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk.chunk_index, 1);
}

TEST_F(VectorStoreTest, DimensionChange_RebuildsWithoutDuplicatingBatch) {
  auto store = open_vector_store();
  store->add_chunks({chunk("t", "old", 0), chunk("t", "old", 1)}, {{1.0f, 0.0f}, {0.0f, 1.0f}});
  EXPECT_EQ(store->dimension(), 2);

  auto ids = store->add_chunks({chunk("t", "new", 0), chunk("t", "new", 1)},
                               {{1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}});

  EXPECT_EQ(ids.size(), 2u);
  EXPECT_EQ(store->dimension(), 3);
  EXPECT_EQ(store->indexed_count(), 2);
  EXPECT_EQ(store->state(), IndexState::Loaded);

  auto results = store->search({0.0f, 0.0f, 1.0f}, 5, "t");
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk.doc_id, "new");
  EXPECT_EQ(results[0].chunk.chunk_index, 1);
  EXPECT_EQ(results[1].chunk.doc_id, "new");

  // The old dimensionality no longer matches the index.
  EXPECT_THROW(store->search({1.0f, 0.0f}, 1, "t"), std::invalid_argument);

  auto reloaded = open_vector_store();
  EXPECT_EQ(reloaded->dimension(), 3);
  EXPECT_EQ(reloaded->indexed_count(), 2);
}

TEST_F(VectorStoreTest, RebuildIndex_MatchesIncrementalIndex) {
  auto store = open_vector_store();
  store->add_chunks({chunk("t", "d", 0), chunk("t", "d", 1)}, {{1.0f, 0.0f}, {0.6f, 0.8f}});
  auto before = store->search({1.0f, 0.0f}, 2, "t");

  store->rebuild_index();

  auto after = store->search({1.0f, 0.0f}, 2, "t");
  ASSERT_EQ(before.size(), after.size());
  for (size_t i = 0; i < before.size(); ++i) {
    EXPECT_EQ(before[i].chunk.id, after[i].chunk.id);
  }
}

TEST_F(VectorStoreTest, ConcurrentAddsAndSearches_AllChunksIndexed) {
  auto store = open_vector_store();
  store->add_chunks({chunk("t", "seed", 0)}, {{1.0f, 0.0f}});

  auto writer = [&](const std::string &doc) {
    for (int i = 0; i < 5; ++i) {
      store->add_chunks({chunk("t", doc, i)}, {{1.0f, 0.1f * static_cast<float>(i)}});
    }
  };
  auto reader = [&] {
    for (int i = 0; i < 20; ++i) {
      auto results = store->search({1.0f, 0.0f}, 3, "t");
      EXPECT_FALSE(results.empty());
    }
  };

  auto w1 = std::async(std::launch::async, writer, std::string("w1"));
  auto w2 = std::async(std::launch::async, writer, std::string("w2"));
  auto r1 = std::async(std::launch::async, reader);
  w1.get();
  w2.get();
  r1.get();

  EXPECT_EQ(store->indexed_count(), 11);
  EXPECT_EQ(metadata_store_->count_chunks(), 11);
}

TEST_F(VectorStoreTest, RebuildDuringAdds_IndexesEachChunkOnce) {
  auto store = open_vector_store();
  store->add_chunks({chunk("t", "seed", 0)}, {{1.0f, 0.0f}});

  auto writer = [&](const std::string &doc) {
    for (int i = 0; i < 10; ++i) {
      store->add_chunks({chunk("t", doc, i)}, {{1.0f, 0.05f * static_cast<float>(i)}});
    }
  };
  auto rebuilder = [&] {
    for (int i = 0; i < 10; ++i) {
      store->rebuild_index();
    }
  };

  auto w1 = std::async(std::launch::async, writer, std::string("w1"));
  auto w2 = std::async(std::launch::async, writer, std::string("w2"));
  auto rb = std::async(std::launch::async, rebuilder);
  w1.get();
  w2.get();
  rb.get();

  EXPECT_EQ(metadata_store_->count_chunks(), 21);
  EXPECT_EQ(store->indexed_count(), metadata_store_->count_chunks());

  // Every hit is a distinct chunk.
  auto results = store->search({1.0f, 0.0f}, 21, "t");
  ASSERT_EQ(results.size(), 21u);
  std::set<int64_t> ids;
  for (const auto &result : results) {
    ids.insert(result.chunk.id);
  }
  EXPECT_EQ(ids.size(), 21u);

  // The snapshot agrees with metadata, so a restart loads it without rebuilding.
  auto reloaded = open_vector_store();
  EXPECT_EQ(reloaded->indexed_count(), 21);
  EXPECT_EQ(reloaded->state(), IndexState::Loaded);
}

}  // namespace ragkit_core
