#include "parse_cache.hpp"

namespace Honyaku {
namespace comments {

std::string ParseCache::makeKey(const std::string &languageId,
                                const std::string &uri) {
  return languageId + "-" + uri;
}

std::shared_ptr<TokenizedDocument>
ParseCache::getOrCreate(const TextDocument &document,
                        const std::shared_ptr<const grammar::Grammar> &grammar,
                        size_t maxLineLength) {
  const std::string key = makeKey(document.languageId(), document.uri());

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    // 無効化が漏れても古い版を返さない
    if (it->second->version() == document.version() &&
        &it->second->grammar() == grammar.get()) {
      return it->second;
    }
    entries_.erase(it);
  }

  auto entry =
      std::make_shared<TokenizedDocument>(grammar, document, maxLineLength);
  entries_[key] = entry;
  return entry;
}

void ParseCache::remove(const std::string &languageId,
                        const std::string &uri) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.erase(makeKey(languageId, uri));
}

void ParseCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

size_t ParseCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace comments
} // namespace Honyaku
