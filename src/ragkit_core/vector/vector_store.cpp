#include "ragkit_core/vector/vector_store.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace ragkit_core {

std::string to_string(IndexState state) {
  switch (state) {
    case IndexState::Absent:
      return "Absent";
    case IndexState::Loaded:
      return "Loaded";
    case IndexState::Rebuilding:
      return "Rebuilding";
  }
  return "Unknown";
}

VectorStore::VectorStore(std::shared_ptr<MetadataStore> metadata_store,
                         const std::filesystem::path &snapshot_path)
    : metadata_store_(std::move(metadata_store)), index_(snapshot_path) {
  if (!metadata_store_) {
    throw std::invalid_argument("VectorStore requires a metadata store");
  }
  initialize();
}

void VectorStore::initialize() {
  std::lock_guard<std::mutex> lock(mutex_);

  const std::optional<int> metadata_dimension = metadata_store_->latest_dimension();
  const bool loaded = index_.load_snapshot();

  if (!metadata_dimension) {
    // Nothing stored; a leftover snapshot cannot be trusted.
    index_.clear();
    state_ = IndexState::Absent;
    return;
  }

  if (loaded) {
    const int64_t expected = metadata_store_->count_chunks_with_dimension(*metadata_dimension);
    if (index_.dimension() == *metadata_dimension && index_.size() == expected) {
      state_ = IndexState::Loaded;
      std::cout << "VectorStore: loaded snapshot with " << index_.size() << " vectors of dimension "
                << index_.dimension() << std::endl;
      return;
    }
    std::cerr << "Warning: index snapshot is stale (dimension " << index_.dimension() << ", "
              << index_.size() << " vectors; metadata has " << expected << " of dimension "
              << *metadata_dimension << "). Rebuilding." << std::endl;
  } else {
    std::cerr << "Warning: index snapshot missing or unreadable. Rebuilding from metadata."
              << std::endl;
  }

  rebuild_locked(*metadata_dimension);
}

void VectorStore::rebuild_locked(int dimension) {
  state_ = IndexState::Rebuilding;
  try {
    EmbeddingScan scan = metadata_store_->scan_embeddings(dimension);
    index_.reset(dimension);
    index_.add(scan.ids, scan.vectors);
    index_.write_snapshot();
  } catch (...) {
    index_.clear();
    state_ = IndexState::Absent;
    throw;
  }
  state_ = IndexState::Loaded;
  std::cout << "VectorStore: rebuilt index with " << index_.size() << " vectors of dimension "
            << dimension << std::endl;
}

void VectorStore::rebuild_index() {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::optional<int> metadata_dimension = metadata_store_->latest_dimension();
  if (!metadata_dimension) {
    index_.clear();
    state_ = IndexState::Absent;
    return;
  }
  rebuild_locked(*metadata_dimension);
}

std::vector<int64_t> VectorStore::add_chunks(const std::vector<Chunk> &chunks,
                                             const std::vector<std::vector<float>> &embeddings) {
  if (chunks.size() != embeddings.size()) {
    throw std::invalid_argument("add_chunks: got " + std::to_string(chunks.size()) +
                                " chunks but " + std::to_string(embeddings.size()) +
                                " embeddings");
  }
  if (chunks.empty()) {
    return {};
  }

  const size_t dimension = embeddings.front().size();
  if (dimension == 0) {
    throw std::invalid_argument("add_chunks: embeddings must not be empty");
  }

  std::vector<Chunk> records;
  records.reserve(chunks.size());
  std::vector<float> flat;
  flat.reserve(chunks.size() * dimension);
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (embeddings[i].size() != dimension) {
      throw std::invalid_argument("add_chunks: embedding " + std::to_string(i) + " has dimension " +
                                  std::to_string(embeddings[i].size()) + ", expected " +
                                  std::to_string(dimension));
    }
    Chunk record = chunks[i];
    record.id = 0;
    record.embedding = embeddings[i];
    normalize_l2(record.embedding);
    flat.insert(flat.end(), record.embedding.begin(), record.embedding.end());
    records.push_back(std::move(record));
  }

  // Append, index update and snapshot form one critical section with rebuilds.
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<int64_t> ids = metadata_store_->append_chunks(records);

  if (!index_.has_index()) {
    index_.reset(static_cast<int>(dimension));
    index_.add(ids, flat);
  } else if (index_.dimension() != static_cast<int>(dimension)) {
    std::cerr << "Warning: dimension changed from " << index_.dimension() << " to " << dimension
              << "; rebuilding index from metadata." << std::endl;
    // The scan already contains the rows written above.
    rebuild_locked(static_cast<int>(dimension));
    return ids;
  } else {
    index_.add(ids, flat);
  }
  index_.write_snapshot();
  state_ = IndexState::Loaded;
  return ids;
}

std::vector<ChunkSearchResult> VectorStore::search(const std::vector<float> &query_vector,
                                                   int k,
                                                   const std::string &tenant_id,
                                                   const std::optional<std::string> &doc_id) {
  if (k <= 0) {
    return {};
  }

  std::vector<IndexHit> hits;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!index_.has_index() || index_.size() == 0) {
      return {};
    }
    std::vector<float> query = query_vector;
    normalize_l2(query);
    const int64_t search_k =
        std::min<int64_t>(std::max(OVERFETCH_FACTOR * k, k), index_.size());
    hits = index_.search(query, static_cast<int>(search_k));
  }
  if (hits.empty()) {
    return {};
  }

  std::vector<int64_t> ids;
  ids.reserve(hits.size());
  for (const auto &hit : hits) {
    ids.push_back(hit.id);
  }
  std::unordered_map<int64_t, Chunk> id_to_chunk = metadata_store_->get_chunks(ids);

  const bool filter_doc = doc_id.has_value() && !doc_id->empty();
  std::vector<ChunkSearchResult> results;
  results.reserve(static_cast<size_t>(k));
  // Neighbour order first, filters second.
  for (const auto &hit : hits) {
    auto it = id_to_chunk.find(hit.id);
    if (it == id_to_chunk.end()) {
      std::cerr << "Warning: index returned id " << hit.id
                << " but no corresponding metadata found in DB." << std::endl;
      continue;
    }
    if (it->second.tenant_id != tenant_id) {
      continue;
    }
    if (filter_doc && it->second.doc_id != *doc_id) {
      continue;
    }
    results.push_back({std::move(it->second), hit.score});
    if (static_cast<int>(results.size()) >= k) {
      break;
    }
  }
  return results;
}

int VectorStore::dimension() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.dimension();
}

int64_t VectorStore::indexed_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.size();
}

}  // namespace ragkit_core
