#pragma once

#include "text_document.hpp"
#include "tokenized_document.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace Honyaku {
namespace comments {

enum class MatchKind {
  Exact, // カーソル位置のトークンがコメント
  Below  // 下方向の走査で見つかったコメント
};

struct CommentMatch {
  size_t line{0};
  size_t tokenIndex{0};
  std::string scope; // 一致したトークンのコメントスコープ
  MatchKind kind{MatchKind::Exact};
};

// position にあるコメント、またはその下に続くコメントを探す
std::optional<CommentMatch> locateComment(TokenizedDocument &document,
                                          const Position &position);

// 行内で最初の空白以外のトークン (なければ tokens.size())
size_t firstContentToken(const std::string &lineText,
                         const LineTokenization &line);

bool isBlankLine(const std::string &lineText);

} // namespace comments
} // namespace Honyaku
