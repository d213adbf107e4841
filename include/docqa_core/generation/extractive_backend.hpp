#pragma once

#include <string>
#include <vector>

#include "docqa_core/generation/generation_backend.hpp"

namespace docqa_core {

/**
 * Deterministic last resort. Answers from the context itself: the sentences
 * sharing the most words with the question, or the leading context text when
 * nothing overlaps. Does not fail.
 */
class ExtractiveBackend : public GenerationBackend {
 public:
  static constexpr size_t kMaxContextEntries = 3;
  static constexpr size_t kMaxBodyLength = 800;
  static constexpr size_t kWordsPerFragment = 3;

  std::string name() const override {
    return "extractive";
  }

  GenerationOptions default_options() const override;

  std::string generate(const ContextBundle &context, const GenerationOptions &options) override;

  void generate_stream(const ContextBundle &context,
                       const GenerationOptions &options,
                       const FragmentCallback &on_fragment) override;

  static std::string answer_prefix(const std::string &question);

  // Consecutive groups of words; concatenating the result gives back text unchanged
  static std::vector<std::string> split_fragments(const std::string &text, size_t words_per_fragment);
};

}  // namespace docqa_core
