#include "comment_locator.hpp"
#include "utf16.hpp"

#include <cctype>

namespace Honyaku {
namespace comments {

bool isBlankLine(const std::string &lineText) {
  for (char c : lineText) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      return false;
  }
  return true;
}

size_t firstContentToken(const std::string &lineText,
                         const LineTokenization &line) {
  for (size_t i = 0; i < line.tokens.size(); ++i) {
    if (!grammar::isWhitespace(lineText, line.tokens[i]))
      return i;
  }
  return line.tokens.size();
}

namespace {

std::optional<CommentMatch> matchExact(TokenizedDocument &document,
                                       size_t lineNumber, size_t column) {
  const std::string &text = document.lineText(lineNumber);
  const LineTokenization &line = document.lineTokens(lineNumber);
  if (line.tokens.empty())
    return std::nullopt;

  size_t index = line.tokens.size();
  for (size_t i = 0; i < line.tokens.size(); ++i) {
    const auto &token = line.tokens[i];
    if (column >= token.startColumn && column < token.endColumn) {
      index = i;
      break;
    }
  }
  // 行末にカーソルがある場合は最後のトークンを対象にする
  if (index == line.tokens.size() && !text.empty() && column == text.size()) {
    index = line.tokens.size() - 1;
  }
  if (index == line.tokens.size())
    return std::nullopt;

  const std::string *scope = grammar::commentScopeOf(line.tokens[index]);
  if (!scope)
    return std::nullopt;

  CommentMatch match;
  match.line = lineNumber;
  match.tokenIndex = index;
  match.scope = *scope;
  match.kind = MatchKind::Exact;
  return match;
}

std::optional<CommentMatch> scanBelow(TokenizedDocument &document,
                                      size_t fromLine) {
  for (size_t lineNumber = fromLine; lineNumber < document.lineCount();
       ++lineNumber) {
    const std::string &text = document.lineText(lineNumber);
    if (isBlankLine(text))
      continue;

    const LineTokenization &line = document.lineTokens(lineNumber);
    size_t index = firstContentToken(text, line);
    if (index == line.tokens.size())
      continue;

    const std::string *scope = grammar::commentScopeOf(line.tokens[index]);
    if (!scope) {
      // コードが現れたら探索を打ち切る
      return std::nullopt;
    }

    CommentMatch match;
    match.line = lineNumber;
    match.tokenIndex = index;
    match.scope = *scope;
    match.kind = MatchKind::Below;
    return match;
  }
  return std::nullopt;
}

} // namespace

std::optional<CommentMatch> locateComment(TokenizedDocument &document,
                                          const Position &position) {
  if (position.line < 0 ||
      static_cast<size_t>(position.line) >= document.lineCount())
    return std::nullopt;

  const size_t lineNumber = static_cast<size_t>(position.line);
  const size_t column =
      utf16ToByteColumn(document.lineText(lineNumber), position.character);

  if (auto exact = matchExact(document, lineNumber, column)) {
    return exact;
  }
  return scanBelow(document, lineNumber + 1);
}

} // namespace comments
} // namespace Honyaku
