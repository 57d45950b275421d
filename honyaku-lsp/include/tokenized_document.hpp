#pragma once

#include "grammar.hpp"
#include "text_document.hpp"
#include "tokenizer.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Honyaku {
namespace comments {

struct LineTokenization {
  size_t lineNumber{0};
  std::vector<grammar::Token> tokens;
  grammar::RuleStack ruleStackAfter;
};

// 1 つのドキュメント版に対するトークナイズ結果のキャッシュ。
// 行は要求された位置まで先頭から順に遅延評価する
class TokenizedDocument {
public:
  TokenizedDocument(std::shared_ptr<const grammar::Grammar> grammar,
                    const TextDocument &document,
                    size_t maxLineLength = grammar::kDefaultMaxLineLength);

  TokenizedDocument(const TokenizedDocument &) = delete;
  TokenizedDocument &operator=(const TokenizedDocument &) = delete;

  const std::string &uri() const { return uri_; }
  const std::string &languageId() const { return languageId_; }
  int version() const { return version_; }
  const grammar::Grammar &grammar() const { return *grammar_; }

  size_t lineCount() const { return lines_.size(); }
  const std::string &lineText(size_t line) const;

  // 返した参照はこのオブジェクトが生きている間有効
  const LineTokenization &lineTokens(size_t line);

  size_t tokenizedLineCount() const;

private:
  std::shared_ptr<const grammar::Grammar> grammar_;
  std::string uri_;
  std::string languageId_;
  int version_{0};
  std::vector<std::string> lines_;
  size_t maxLineLength_;

  mutable std::mutex mutex_;
  std::deque<LineTokenization> cache_;
};

} // namespace comments
} // namespace Honyaku
