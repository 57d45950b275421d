#pragma once

#include "grammar.hpp"

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace Honyaku {
namespace grammar {

// どの言語IDにどのルールファイルを使うかの宣言
struct GrammarDescriptor {
  std::vector<std::string> languages;
  std::string scopeName;
  std::string path;
};

// [{ "languages": [...], "scopeName": "...", "path": "..." }, ...]
// 相対パスは baseDir からの相対として解決する
std::vector<GrammarDescriptor>
parseGrammarDescriptors(const nlohmann::json &descriptors,
                        const std::string &baseDir);

// 記述ファイル (grammars.json) を読み込む。読めない場合は空を返す
std::vector<GrammarDescriptor>
loadGrammarDescriptors(const std::string &descriptorFile);

class GrammarRegistry {
public:
  explicit GrammarRegistry(
      std::vector<GrammarDescriptor> descriptors,
      const std::vector<std::string> &excludedLanguages = {"log"});

  // 言語IDに対応する文法を返す (未対応なら nullptr)。
  // 初回要求時に読み込み、結果はプロセス終了まで保持する
  std::shared_ptr<const Grammar> getGrammar(const std::string &languageId);

  bool isLanguageSupported(const std::string &languageId) const;

  const std::vector<GrammarDescriptor> &descriptors() const {
    return descriptors_;
  }

private:
  const GrammarDescriptor *findDescriptor(const std::string &languageId) const;

  std::vector<GrammarDescriptor> descriptors_;
  std::set<std::string> excluded_;

  std::mutex mutex_;
  // 同じルールファイルを共有する言語は同じ Grammar を使う
  std::unordered_map<std::string, std::shared_ptr<const Grammar>> byPath_;
  std::unordered_map<std::string, std::shared_ptr<const Grammar>> byLanguage_;
};

} // namespace grammar
} // namespace Honyaku
