#include "ragkit_core/text/text_chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ragkit_core {

namespace {

bool is_blank(const std::string &s) {
  return s.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

// Byte offsets of every code point start, plus text.size().
std::vector<size_t> code_point_boundaries(const std::string &text) {
  std::vector<size_t> boundaries;
  boundaries.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    boundaries.push_back(static_cast<size_t>(it - text.begin()));
  }
  boundaries.push_back(text.size());
  return boundaries;
}

// Largest boundary <= limit that lies past `start`; the next boundary if none does.
size_t boundary_at_or_before(const std::vector<size_t> &boundaries, size_t start, size_t limit) {
  auto it = std::upper_bound(boundaries.begin(), boundaries.end(), limit);
  size_t candidate = *(it - 1);
  if (candidate > start) {
    return candidate;
  }
  return *std::upper_bound(boundaries.begin(), boundaries.end(), start);
}

// Offsets where a paragraph begins. One or more blank lines separate paragraphs; a break
// runs from a newline through the last newline of the whitespace run that follows it.
std::vector<size_t> paragraph_starts(const std::string &text) {
  std::vector<size_t> starts = {0};
  size_t pos = text.find('\n');
  while (pos != std::string::npos) {
    size_t last_newline = pos;
    size_t scan = pos + 1;
    while (scan < text.size() && std::isspace(static_cast<unsigned char>(text[scan]))) {
      if (text[scan] == '\n') {
        last_newline = scan;
      }
      ++scan;
    }
    if (last_newline > pos) {
      starts.push_back(last_newline + 1);
    }
    pos = text.find('\n', last_newline + 1);
  }
  return starts;
}

}  // namespace

TextChunker::TextChunker(size_t chunk_size, size_t chunk_overlap)
    : chunk_size_(chunk_size), chunk_overlap_(chunk_overlap), min_chunk_size_(chunk_size / 4) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("chunk_size must be positive");
  }
  if (chunk_overlap_ >= chunk_size_) {
    throw std::invalid_argument("chunk_overlap must be smaller than chunk_size");
  }
}

std::vector<std::string> TextChunker::split_into_windows(const std::string &text) const {
  std::vector<std::string> out;
  if (text.empty()) {
    return out;
  }

  const std::vector<size_t> boundaries = code_point_boundaries(text);
  const size_t step = chunk_size_ - chunk_overlap_;
  size_t start = 0;
  while (true) {
    const size_t end = boundary_at_or_before(boundaries, start, std::min(start + chunk_size_, text.size()));
    out.emplace_back(text.substr(start, end - start));
    if (end >= text.size()) {
      break;
    }
    start = boundary_at_or_before(boundaries, start, start + step);
  }
  return out;
}

std::vector<TextChunk> TextChunker::chunk(const std::string &text) const {
  if (!utf8::is_valid(text.begin(), text.end())) {
    throw std::invalid_argument("text is not valid UTF-8");
  }
  std::vector<TextChunk> chunks;
  if (is_blank(text)) {
    return chunks;
  }

  std::vector<size_t> split_points = paragraph_starts(text);
  split_points.push_back(text.size());

  int next_index = 0;
  auto emit = [&](const std::string &content) {
    if (!is_blank(content)) {
      chunks.push_back({content, next_index++});
    }
  };

  std::string merged;
  auto flush = [&] {
    if (merged.size() > chunk_size_) {
      for (const auto &window : split_into_windows(merged)) {
        emit(window);
      }
    } else {
      emit(merged);
    }
    merged.clear();
  };

  for (size_t i = 0; i + 1 < split_points.size(); ++i) {
    const size_t start = split_points[i];
    const size_t end = split_points[i + 1];
    if (end <= start) {
      continue;
    }
    merged += text.substr(start, end - start);
    if (merged.size() >= min_chunk_size_) {
      flush();
    }
  }
  // Trailing paragraphs shorter than the minimum
  if (!merged.empty()) {
    flush();
  }
  return chunks;
}

}  // namespace ragkit_core
