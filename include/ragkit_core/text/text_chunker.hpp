#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ragkit_core {

struct TextChunk {
  std::string content;
  int chunk_index = 0;
};

/**
 * @class TextChunker
 * @brief Splits plain text into indexed chunks.
 *
 * The text is split into paragraphs on blank lines. Short paragraphs are merged until the
 * merged section reaches the minimum size; a merged section longer than `chunk_size` bytes
 * is cut into overlapping windows. Windows hold at most `chunk_size` bytes, start
 * `chunk_size - chunk_overlap` bytes apart, and never split a UTF-8 code point.
 */
class TextChunker {
 public:
  TextChunker(size_t chunk_size, size_t chunk_overlap);

  // Throws std::invalid_argument when `text` is not valid UTF-8.
  std::vector<TextChunk> chunk(const std::string &text) const;

  std::vector<std::string> split_into_windows(const std::string &text) const;

  size_t chunk_size() const { return chunk_size_; }
  size_t chunk_overlap() const { return chunk_overlap_; }
  size_t min_chunk_size() const { return min_chunk_size_; }

 private:
  size_t chunk_size_;
  size_t chunk_overlap_;
  size_t min_chunk_size_;
};

}  // namespace ragkit_core
