#pragma once

#include "grammar.hpp"

#include <boost/regex.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace Honyaku {
namespace grammar {

static constexpr size_t kDefaultMaxLineLength = 20000;

struct Token {
  size_t startColumn{0}; // 行内のバイト位置
  size_t endColumn{0};
  std::vector<std::string> scopes; // 先頭がルートスコープ、末尾が最も詳細
};

// ルールスタックの 1 段。生成後は変更しない
struct StackFrame {
  std::shared_ptr<const StackFrame> parent;
  int ruleId{-1};
  std::shared_ptr<const boost::regex> endPattern;
  std::string endSource; // 後方参照を展開した後の end パターン
  std::vector<std::string> nameScopes;    // begin / end 自身に付くスコープ
  std::vector<std::string> contentScopes; // 内側のテキストに付くスコープ
  size_t depth{0};
};

// 行をまたいで受け渡す不変のルールスタック
class RuleStack {
public:
  RuleStack() = default;

  static RuleStack initial(const Grammar &grammar);

  bool empty() const { return top_ == nullptr; }
  const StackFrame *top() const { return top_.get(); }
  size_t depth() const { return top_ ? top_->depth : 0; }

  RuleStack push(int ruleId, std::shared_ptr<const boost::regex> endPattern,
                 std::string endSource, std::vector<std::string> nameScopes,
                 std::vector<std::string> contentScopes) const;
  RuleStack pop() const;

  bool operator==(const RuleStack &other) const;
  bool operator!=(const RuleStack &other) const { return !(*this == other); }

private:
  explicit RuleStack(std::shared_ptr<const StackFrame> top)
      : top_(std::move(top)) {}

  std::shared_ptr<const StackFrame> top_;
};

struct LineTokens {
  std::vector<Token> tokens;
  RuleStack ruleStack;
};

// 1 行をトークナイズする。prior が空の場合は文書先頭の状態から始める。
// 同じ入力には常に同じ結果を返し、入力が不正でも失敗しない。
LineTokens tokenizeLine(const Grammar &grammar, const std::string &lineText,
                        const RuleStack &prior,
                        size_t maxLineLength = kDefaultMaxLineLength);

// トークンのコメントスコープ (comment / comment.*) のうち最も詳細なもの
const std::string *commentScopeOf(const Token &token);

bool hasScope(const Token &token, const std::string &scope);
bool hasScopePrefix(const Token &token, const std::string &prefix);

// スコープ名が prefix そのものか、prefix + "." で始まるか
bool scopeMatches(const std::string &scope, const std::string &prefix);

bool isWhitespace(const std::string &lineText, const Token &token);

} // namespace grammar
} // namespace Honyaku
