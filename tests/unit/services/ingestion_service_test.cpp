#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "ragkit_core/services/ingestion_service.hpp"

namespace ragkit_core {

using ::testing::_;
using ::testing::Return;

class IngestionServiceTest : public ragkit_tests::StoreTestBase {
 protected:
  void SetUp() override {
    StoreTestBase::SetUp();
    vector_store_ = open_vector_store();
    embedder_ = std::make_shared<ragkit_tests::FakeEmbedder>(std::vector<float>{1.0f, 0.0f});
    service_ = std::make_unique<IngestionService>(vector_store_, embedder_, TextChunker(100, 20));
  }

  void TearDown() override {
    service_.reset();
    vector_store_.reset();
    StoreTestBase::TearDown();
  }

  RequestContext context_{"req-1", "trace-1", "tenant-a"};
  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<ragkit_tests::FakeEmbedder> embedder_;
  std::unique_ptr<IngestionService> service_;
};

TEST_F(IngestionServiceTest, IngestText_StoresChunksUnderCallerTenant) {
  const std::string text = std::string(60, 'a') + "\n\n" + std::string(60, 'b');

  IngestResult result = service_->ingest_text(context_, "notes.txt", text, std::string("doc-1"));

  EXPECT_EQ(result.doc_id, "doc-1");
  EXPECT_EQ(result.chunk_count, 2u);
  EXPECT_EQ(embedder_->calls(), 1);
  EXPECT_EQ(vector_store_->indexed_count(), 2);

  auto hits = vector_store_->search({1.0f, 0.0f}, 5, "tenant-a");
  ASSERT_EQ(hits.size(), 2u);
  for (const auto &hit : hits) {
    EXPECT_EQ(hit.chunk.tenant_id, "tenant-a");
    EXPECT_EQ(hit.chunk.doc_id, "doc-1");
    EXPECT_EQ(hit.chunk.source, "notes.txt");
  }
  EXPECT_TRUE(vector_store_->search({1.0f, 0.0f}, 5, "tenant-b").empty());
}

TEST_F(IngestionServiceTest, IngestText_GeneratesDocIdWhenMissingOrEmpty) {
  IngestResult first = service_->ingest_text(context_, "a.txt", "Some content here.");
  IngestResult second = service_->ingest_text(context_, "b.txt", "Other content.", std::string());

  EXPECT_FALSE(first.doc_id.empty());
  EXPECT_FALSE(second.doc_id.empty());
  EXPECT_NE(first.doc_id, second.doc_id);
}

TEST_F(IngestionServiceTest, IngestText_BlankTextIsRejected) {
  EXPECT_THROW(service_->ingest_text(context_, "empty.txt", "  \n\n "), std::invalid_argument);
  EXPECT_EQ(embedder_->calls(), 0);
  EXPECT_EQ(metadata_store_->count_chunks(), 0);
}

TEST_F(IngestionServiceTest, IngestText_EmbeddingFailureStoresNothing) {
  embedder_->fail_with("model not loaded");

  EXPECT_THROW(service_->ingest_text(context_, "a.txt", "Some content."), EmbeddingUnavailable);
  EXPECT_EQ(metadata_store_->count_chunks(), 0);
  EXPECT_EQ(vector_store_->state(), IndexState::Absent);
}

TEST_F(IngestionServiceTest, IngestText_WrongEmbeddingCountIsEmbeddingFailure) {
  auto mock = std::make_shared<ragkit_tests::MockEmbedder>();
  EXPECT_CALL(*mock, embed(_)).WillOnce(Return(std::vector<std::vector<float>>{}));
  IngestionService service(vector_store_, mock, TextChunker(100, 20));

  EXPECT_THROW(service.ingest_text(context_, "a.txt", "Some content."), EmbeddingUnavailable);
  EXPECT_EQ(metadata_store_->count_chunks(), 0);
}

}  // namespace ragkit_core
