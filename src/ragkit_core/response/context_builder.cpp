#include "ragkit_core/response/context_builder.hpp"

#include <utf8.h>

namespace ragkit_core {

std::string render_context_entry(const Chunk &chunk) {
  return "[" + chunk.citation_key() + "] " + chunk.content + "\n";
}

ContextWindow build_context(const std::vector<RetrievalCandidate> &ranked, size_t budget) {
  ContextWindow window;
  size_t length = 0;
  for (const auto &candidate : ranked) {
    std::string entry = render_context_entry(candidate.chunk);
    const auto entry_length = static_cast<size_t>(utf8::distance(entry.begin(), entry.end()));
    if (length + entry_length > budget) {
      break;
    }
    window.text += entry;
    length += entry_length;
    window.used.push_back(candidate);
  }
  return window;
}

}  // namespace ragkit_core
