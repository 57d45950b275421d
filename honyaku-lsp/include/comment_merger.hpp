#pragma once

#include "comment_locator.hpp"
#include "tokenized_document.hpp"

#include <cstddef>
#include <string>

namespace Honyaku {
namespace comments {

// バイト列で表したコメントの範囲 (end は排他的)
struct CommentSpan {
  size_t startLine{0};
  size_t startColumn{0};
  size_t endLine{0};
  size_t endColumn{0};
};

// 行コメントを結合するときにインデントの違いをどう扱うか
enum class IndentationPolicy {
  Ignore, // スコープが同じなら結合する
  Strict  // 行頭の空白が一致する行だけを結合する
};

bool isLineCommentScope(const std::string &scope);

// 一致したコメントの範囲を求める。ブロックコメントは開始記号から終了記号まで、
// 行コメントは multiLineMerge が有効なら上下に隣接する同じスコープの行を含める
CommentSpan mergeComment(TokenizedDocument &document,
                         const CommentMatch &match, bool multiLineMerge,
                         IndentationPolicy indentation);

} // namespace comments
} // namespace Honyaku
