#include "tokenized_document.hpp"

#include <stdexcept>

namespace Honyaku {
namespace comments {

TokenizedDocument::TokenizedDocument(
    std::shared_ptr<const grammar::Grammar> grammar,
    const TextDocument &document, size_t maxLineLength)
    : grammar_(std::move(grammar)), uri_(document.uri()),
      languageId_(document.languageId()), version_(document.version()),
      lines_(document.lines()), maxLineLength_(maxLineLength) {
  if (!grammar_) {
    throw std::invalid_argument("TokenizedDocument requires a grammar");
  }
}

const std::string &TokenizedDocument::lineText(size_t line) const {
  static const std::string kEmpty;
  if (line >= lines_.size())
    return kEmpty;
  return lines_[line];
}

const LineTokenization &TokenizedDocument::lineTokens(size_t line) {
  if (line >= lines_.size()) {
    throw std::out_of_range("line out of range");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // 直前の行の状態を引き継ぎながら必要な行まで進める
  while (cache_.size() <= line) {
    const size_t next = cache_.size();
    grammar::RuleStack prior;
    if (!cache_.empty()) {
      prior = cache_.back().ruleStackAfter;
    }

    grammar::LineTokens result =
        grammar::tokenizeLine(*grammar_, lines_[next], prior, maxLineLength_);

    LineTokenization entry;
    entry.lineNumber = next;
    entry.tokens = std::move(result.tokens);
    entry.ruleStackAfter = std::move(result.ruleStack);
    cache_.push_back(std::move(entry));
  }
  return cache_[line];
}

size_t TokenizedDocument::tokenizedLineCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

} // namespace comments
} // namespace Honyaku
