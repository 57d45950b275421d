#pragma once

#include <boost/regex.hpp>
#include <cstddef>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Honyaku {
namespace grammar {

enum class RuleKind {
  Match,    // match
  BeginEnd, // begin / end
  Include   // patterns のみを持つコンテナ (ルート、repository エントリ)
};

// capture 番号 -> スコープ名
using CaptureMap = std::map<size_t, std::string>;

struct Rule {
  int id{-1};
  RuleKind kind{RuleKind::Include};
  std::string name;
  std::string contentName;

  // Match では match、BeginEnd では begin の正規表現
  // コンパイルに失敗したルールは nullptr のまま無効化される
  std::shared_ptr<const boost::regex> pattern;

  std::string endSource;
  std::shared_ptr<const boost::regex> end; // 後方参照を含む場合は nullptr
  bool endHasBackReferences{false};
  bool applyEndPatternLast{false};

  CaptureMap captures; // match の captures / begin の beginCaptures
  CaptureMap endCaptures;

  std::vector<int> patterns;   // 記述どおりの子ルール
  std::vector<int> candidates; // Include を展開した探索対象ルール
};

class GrammarBuilder;

// TextMate 形式 (.tmLanguage.json) のルールセットをコンパイルしたもの。
// 構築後は変更されず、複数のトークナイズ呼び出しから共有される。
class Grammar {
  // GrammarBuilder だけが生成できるようにするための鍵
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

public:
  explicit Grammar(ConstructionKey) {}

  static std::shared_ptr<const Grammar> fromJson(const nlohmann::json &doc);
  static std::shared_ptr<const Grammar> loadFromFile(const std::string &path);

  const std::string &scopeName() const { return scopeName_; }
  int rootRuleId() const { return rootRuleId_; }
  const Rule &rule(int id) const { return rules_.at(static_cast<size_t>(id)); }

private:
  friend class GrammarBuilder;

  std::string scopeName_;
  int rootRuleId_{-1};
  std::vector<Rule> rules_;
};

// TextMate 文法の正規表現 (Oniguruma 互換の Perl 構文) をコンパイルする。
// 後読み、\G、(?x)、(?i) などを受け付ける。失敗した場合は nullptr
std::shared_ptr<const boost::regex> compilePattern(const std::string &source);

std::string escapeRegex(const std::string &text);

} // namespace grammar
} // namespace Honyaku
