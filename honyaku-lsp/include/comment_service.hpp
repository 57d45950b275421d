#pragma once

#include "comment_merger.hpp"
#include "grammar_registry.hpp"
#include "parse_cache.hpp"
#include "text_document.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace Honyaku {
namespace comments {

// 翻訳対象として切り出したテキストと、その元になったソース範囲
struct CommentBlock {
  Range range;
  std::string comment;
  bool isLineComment{true};
  bool humanize{false};
  std::string scope;

  // humanize が有効なら識別子を単語に分解した文字列
  std::string translatableText() const;
};

enum class LookupStatus { Ok, NoGrammar, NoMatch, EmptyAfterStrip };

struct CommentLookup {
  LookupStatus status{LookupStatus::NoMatch};
  std::optional<CommentBlock> block;
};

struct Settings {
  bool multiLineMerge{false};
  std::string preferredLanguage{"en"}; // 翻訳先の言語コード
  IndentationPolicy mergeIndentation{IndentationPolicy::Strict};
};

// 部分的な設定更新。値のない項目は現在の設定を維持する
struct SettingsUpdate {
  std::optional<bool> multiLineMerge;
  std::optional<std::string> preferredLanguage; // 言語名または言語コード
  std::optional<IndentationPolicy> mergeIndentation;
};

// エディタの選択範囲を問い合わせるフック。選択がなければ std::nullopt
using SelectionProvider = std::function<std::optional<CommentBlock>(
    const TextDocument &, const Position &)>;

// locate -> merge -> extract を実行する
CommentLookup computeComment(TokenizedDocument &document,
                             const Position &position,
                             const Settings &settings);

class CommentService {
public:
  CommentService(std::shared_ptr<grammar::GrammarRegistry> registry,
                 Settings settings = Settings{});

  CommentLookup getComment(const TextDocument &document,
                           const Position &position,
                           const SelectionProvider &selection = nullptr);

  // ドキュメントの変更・クローズ時に呼ぶ
  void removeDocument(const std::string &languageId, const std::string &uri);

  void setSettings(const SettingsUpdate &update);
  Settings settings() const;

  void setMaxTokenizationLineLength(size_t maxLineLength);

  grammar::GrammarRegistry &registry() { return *registry_; }
  const ParseCache &cache() const { return cache_; }

private:
  std::shared_ptr<grammar::GrammarRegistry> registry_;
  ParseCache cache_;

  mutable std::mutex settingsMutex_;
  Settings settings_;
  size_t maxLineLength_{grammar::kDefaultMaxLineLength};
};

IndentationPolicy parseIndentationPolicy(const std::string &value,
                                         IndentationPolicy fallback);

} // namespace comments
} // namespace Honyaku
