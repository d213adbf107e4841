#include "docqa_core/generation/extractive_backend.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include "docqa_core/util/text_utils.hpp"

namespace docqa_core {

namespace {

const std::set<std::string> kStopWords = {"a",    "an",   "and",  "are",  "as",   "at",  "be",
                                          "by",   "do",   "does", "for",  "from", "has", "have",
                                          "how",  "i",    "in",   "is",   "it",   "of",  "on",
                                          "or",   "that", "the",  "this", "to",   "was", "what",
                                          "when", "where", "which", "who", "why", "with"};

struct ScoredSentence {
  std::string text;
  size_t overlap = 0;
  size_t position = 0;
};

std::vector<std::string> split_sentences(const std::string &text) {
  std::vector<std::string> sentences;
  std::string current;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    current += c;
    const bool terminator = c == '.' || c == '!' || c == '?';
    const bool at_break =
        c == '\n' ||
        (terminator && (i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1]))));
    if (at_break) {
      std::string sentence = text::trim(current);
      if (!sentence.empty()) {
        sentences.push_back(std::move(sentence));
      }
      current.clear();
    }
  }
  std::string tail = text::trim(current);
  if (!tail.empty()) {
    sentences.push_back(std::move(tail));
  }
  return sentences;
}

std::string leading_text(const ContextBundle &context) {
  std::string combined;
  const size_t count = std::min(ExtractiveBackend::kMaxContextEntries, context.entries.size());
  for (size_t i = 0; i < count; ++i) {
    if (i > 0) {
      combined += "\n\n";
    }
    combined += context.entries[i].text;
  }
  return combined;
}

std::string extract_body(const ContextBundle &context) {
  std::set<std::string> question_words;
  for (auto &word : text::words(context.question)) {
    if (kStopWords.count(word) == 0) {
      question_words.insert(std::move(word));
    }
  }

  std::vector<ScoredSentence> scored;
  const size_t count = std::min(ExtractiveBackend::kMaxContextEntries, context.entries.size());
  for (size_t i = 0; i < count; ++i) {
    for (auto &sentence : split_sentences(context.entries[i].text)) {
      std::set<std::string> seen;
      for (auto &word : text::words(sentence)) {
        if (question_words.count(word) > 0) {
          seen.insert(std::move(word));
        }
      }
      if (!seen.empty()) {
        scored.push_back({std::move(sentence), seen.size(), scored.size()});
      }
    }
  }

  if (scored.empty()) {
    return leading_text(context);
  }

  std::stable_sort(scored.begin(), scored.end(),
                   [](const ScoredSentence &a, const ScoredSentence &b) {
                     return a.overlap > b.overlap;
                   });
  if (scored.size() > 3) {
    scored.resize(3);
  }
  // Present the picked sentences in the order they appear in the context
  std::sort(scored.begin(), scored.end(), [](const ScoredSentence &a, const ScoredSentence &b) {
    return a.position < b.position;
  });

  std::string body;
  for (const auto &sentence : scored) {
    if (!body.empty()) {
      body += " ";
    }
    body += sentence.text;
  }
  return body;
}

}  // namespace

GenerationOptions ExtractiveBackend::default_options() const {
  return GenerationOptions{};
}

std::string ExtractiveBackend::answer_prefix(const std::string &question) {
  const auto question_words = text::words(question);
  auto mentions = [&](std::initializer_list<const char *> candidates) {
    return std::any_of(candidates.begin(), candidates.end(), [&](const char *candidate) {
      return std::find(question_words.begin(), question_words.end(), candidate) !=
             question_words.end();
    });
  };

  if (mentions({"what", "define", "definition"})) {
    return "Based on the provided context:\n\n";
  }
  if (mentions({"how", "explain", "process"})) {
    return "Here's how it works according to the documents:\n\n";
  }
  if (mentions({"when", "time", "date"})) {
    return "According to the information available:\n\n";
  }
  return "Based on the relevant information I found:\n\n";
}

std::vector<std::string> ExtractiveBackend::split_fragments(const std::string &text,
                                                            size_t words_per_fragment) {
  std::vector<std::string> fragments;
  if (words_per_fragment == 0) {
    words_per_fragment = 1;
  }

  std::string current;
  size_t words_in_current = 0;
  size_t i = 0;
  while (i < text.size()) {
    // A word is its leading whitespace plus the following non-space run
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
      current += text[i++];
    }
    if (i == text.size()) {
      break;
    }
    while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
      current += text[i++];
    }
    if (++words_in_current == words_per_fragment) {
      fragments.push_back(std::move(current));
      current.clear();
      words_in_current = 0;
    }
  }

  if (!current.empty()) {
    if (words_in_current == 0 && !fragments.empty()) {
      fragments.back() += current;  // trailing whitespace only
    } else {
      fragments.push_back(std::move(current));
    }
  }
  return fragments;
}

std::string ExtractiveBackend::generate(const ContextBundle &context,
                                        const GenerationOptions & /*options*/) {
  if (context.empty()) {
    return kNoContextAnswer;
  }
  return answer_prefix(context.question) +
         text::truncate_code_points(text::sanitize_utf8(extract_body(context)), kMaxBodyLength);
}

void ExtractiveBackend::generate_stream(const ContextBundle &context,
                                        const GenerationOptions &options,
                                        const FragmentCallback &on_fragment) {
  for (const auto &fragment : split_fragments(generate(context, options), kWordsPerFragment)) {
    if (!on_fragment(fragment)) {
      return;
    }
  }
}

}  // namespace docqa_core
