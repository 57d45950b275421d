#pragma once

#include "comment_merger.hpp"
#include "tokenized_document.hpp"

#include <optional>
#include <string>

namespace Honyaku {
namespace comments {

struct ExtractedText {
  std::string text;
  bool humanize{false};
};

// 範囲内のコメント記号と継続行の `*` を取り除き、行を空白 1 つで連結する。
// 何も残らない場合は std::nullopt
std::optional<ExtractedText> extractText(TokenizedDocument &document,
                                         const CommentSpan &span,
                                         const std::string &scope);

// 空白を含まず英数字・`_`・`-` だけからなり、英数字を 1 文字以上含むか
bool isHumanizable(const std::string &text);

// fix_this_now / fixThisNow -> "fix this now"
std::string humanizeIdentifier(const std::string &text);

// 文法が区切り記号にスコープを付けていない場合の文字列ベースの除去
void sanitizeLineComment(std::string &segment);
void sanitizeBlockComment(std::string &segment);

} // namespace comments
} // namespace Honyaku
