#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ragkit_core/types/chunk.hpp"

namespace ragkit_core {

struct ContextWindow {
  std::string text;
  std::vector<RetrievalCandidate> used;
};

// "[source#chunk_index] content\n"
std::string render_context_entry(const Chunk &chunk);

/**
 * Packs candidates in order until the next rendered entry would push the text past
 * `budget` characters, counted as UTF-8 code points. Packing stops at the first entry that
 * does not fit; later, smaller entries are not tried.
 */
ContextWindow build_context(const std::vector<RetrievalCandidate> &ranked, size_t budget);

}  // namespace ragkit_core
