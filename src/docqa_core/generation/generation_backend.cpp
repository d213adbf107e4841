#include "docqa_core/generation/generation_backend.hpp"

#include <algorithm>

namespace docqa_core {

std::string build_prompt(const ContextBundle &context, size_t max_chunks) {
  std::string combined;
  const size_t count = std::min(max_chunks, context.entries.size());
  for (size_t i = 0; i < count; ++i) {
    if (i > 0) {
      combined += "\n\n";
    }
    combined += context.entries[i].text;
  }

  return "Based on the following context, please answer the question. If the context doesn't "
         "contain enough information to answer the question, please say so clearly. Be concise "
         "and accurate.\n\nContext:\n" +
         combined + "\n\nQuestion: " + context.question + "\n\nAnswer:";
}

}  // namespace docqa_core
