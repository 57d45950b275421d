#pragma once

#include "tokenized_document.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Honyaku {
namespace comments {

// (言語ID, URI) ごとに TokenizedDocument を 1 つだけ保持する。
// 内容の変更とクローズで破棄し、編集をまたいで再利用しない
class ParseCache {
public:
  static std::string makeKey(const std::string &languageId,
                             const std::string &uri);

  std::shared_ptr<TokenizedDocument>
  getOrCreate(const TextDocument &document,
              const std::shared_ptr<const grammar::Grammar> &grammar,
              size_t maxLineLength = grammar::kDefaultMaxLineLength);

  void remove(const std::string &languageId, const std::string &uri);
  void clear();
  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<TokenizedDocument>> entries_;
};

} // namespace comments
} // namespace Honyaku
