#include "ragkit_core/vector/vector_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace ragkit_core {

void normalize_l2(std::vector<float> &vector) {
  if (vector.empty()) {
    return;
  }
  faiss::fvec_renorm_L2(vector.size(), 1, vector.data());
}

VectorIndex::VectorIndex(std::filesystem::path snapshot_path)
    : snapshot_path_(std::move(snapshot_path)) {}

bool VectorIndex::load_snapshot() {
  index_.reset();
  std::error_code ec;
  if (!std::filesystem::exists(snapshot_path_, ec)) {
    return false;
  }

  try {
    std::unique_ptr<faiss::Index> loaded(faiss::read_index(snapshot_path_.string().c_str()));
    auto *id_map = dynamic_cast<faiss::IndexIDMap2 *>(loaded.get());
    if (!id_map) {
      std::cerr << "Warning: snapshot " << snapshot_path_
                << " does not hold an id-mapped index; ignoring it." << std::endl;
      return false;
    }
    loaded.release();
    index_.reset(id_map);
    return true;
  } catch (const std::exception &e) {
    // FaissException for bad headers, bad_alloc for corrupt size fields
    std::cerr << "Warning: failed to read index snapshot " << snapshot_path_ << ": " << e.what()
              << std::endl;
    return false;
  }
}

void VectorIndex::write_snapshot() const {
  if (!index_) {
    return;
  }
  std::error_code ec;
  if (snapshot_path_.has_parent_path()) {
    std::filesystem::create_directories(snapshot_path_.parent_path(), ec);
    if (ec) {
      throw VectorStoreError("Failed to create snapshot directory: " + ec.message());
    }
  }

  std::filesystem::path tmp_path = snapshot_path_;
  tmp_path += ".tmp";
  try {
    faiss::write_index(index_.get(), tmp_path.string().c_str());
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError("Failed to write index snapshot: " + std::string(e.what()));
  }

  std::filesystem::rename(tmp_path, snapshot_path_, ec);
  if (ec) {
    throw VectorStoreError("Failed to replace index snapshot: " + ec.message());
  }
}

void VectorIndex::reset(int dimension) {
  if (dimension <= 0) {
    throw std::invalid_argument("Index dimension must be positive, got " +
                                std::to_string(dimension));
  }
  auto index = std::make_unique<faiss::IndexIDMap2>(new faiss::IndexFlatIP(dimension));
  index->own_fields = true;
  index_ = std::move(index);
}

void VectorIndex::clear() {
  index_.reset();
}

void VectorIndex::add(const std::vector<int64_t> &ids, const std::vector<float> &vectors) {
  if (!index_) {
    throw VectorStoreError("Vector index not initialized. Cannot add vectors.");
  }
  if (ids.empty()) {
    return;
  }
  if (vectors.size() != ids.size() * static_cast<size_t>(index_->d)) {
    throw std::invalid_argument("Vector buffer does not match " + std::to_string(ids.size()) +
                                " rows of dimension " + std::to_string(index_->d));
  }

  std::vector<faiss::idx_t> faiss_ids(ids.begin(), ids.end());
  try {
    index_->add_with_ids(static_cast<faiss::idx_t>(ids.size()), vectors.data(), faiss_ids.data());
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError("Failed to add vectors to index: " + std::string(e.what()));
  }
}

std::vector<IndexHit> VectorIndex::search(const std::vector<float> &query, int k) const {
  if (!index_ || index_->ntotal == 0 || k <= 0) {
    return {};
  }
  if (query.size() != static_cast<size_t>(index_->d)) {
    throw std::invalid_argument("Query vector dimension mismatch. Expected " +
                                std::to_string(index_->d) + ", got " +
                                std::to_string(query.size()));
  }

  const faiss::idx_t actual_k = std::min<faiss::idx_t>(k, index_->ntotal);
  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  index_->search(1, query.data(), actual_k, distances.data(), labels.data());

  std::vector<IndexHit> hits;
  hits.reserve(actual_k);
  for (faiss::idx_t i = 0; i < actual_k; ++i) {
    if (labels[i] == -1) {
      continue;
    }
    hits.push_back({static_cast<int64_t>(labels[i]), distances[i]});
  }
  return hits;
}

int VectorIndex::dimension() const {
  return index_ ? static_cast<int>(index_->d) : 0;
}

int64_t VectorIndex::size() const {
  return index_ ? static_cast<int64_t>(index_->ntotal) : 0;
}

}  // namespace ragkit_core
