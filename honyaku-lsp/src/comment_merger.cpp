#include "comment_merger.hpp"

namespace Honyaku {
namespace comments {

bool isLineCommentScope(const std::string &scope) {
  return !grammar::scopeMatches(scope, "comment.block");
}

namespace {

struct TokenCursor {
  size_t line{0};
  size_t index{0};
};

bool isBeginDelimiter(const grammar::Token &token) {
  return grammar::hasScopePrefix(token, "punctuation.definition.comment.begin");
}

bool isEndDelimiter(const grammar::Token &token) {
  return grammar::hasScopePrefix(token, "punctuation.definition.comment.end");
}

// ひとつ前のトークンへ移動する。空行は読み飛ばす
bool previousToken(TokenizedDocument &document, TokenCursor &cursor) {
  if (cursor.index > 0) {
    --cursor.index;
    return true;
  }
  size_t line = cursor.line;
  while (line > 0) {
    --line;
    const LineTokenization &tokens = document.lineTokens(line);
    if (!tokens.tokens.empty()) {
      cursor.line = line;
      cursor.index = tokens.tokens.size() - 1;
      return true;
    }
  }
  return false;
}

bool nextToken(TokenizedDocument &document, TokenCursor &cursor) {
  const LineTokenization &current = document.lineTokens(cursor.line);
  if (cursor.index + 1 < current.tokens.size()) {
    ++cursor.index;
    return true;
  }
  for (size_t line = cursor.line + 1; line < document.lineCount(); ++line) {
    const LineTokenization &tokens = document.lineTokens(line);
    if (!tokens.tokens.empty()) {
      cursor.line = line;
      cursor.index = 0;
      return true;
    }
  }
  return false;
}

const grammar::Token &tokenAt(TokenizedDocument &document,
                              const TokenCursor &cursor) {
  return document.lineTokens(cursor.line).tokens[cursor.index];
}

CommentSpan mergeBlock(TokenizedDocument &document, const CommentMatch &match) {
  TokenCursor first{match.line, match.tokenIndex};
  while (!isBeginDelimiter(tokenAt(document, first))) {
    TokenCursor candidate = first;
    if (!previousToken(document, candidate) ||
        !grammar::hasScope(tokenAt(document, candidate), match.scope))
      break;
    first = candidate;
  }

  TokenCursor last{match.line, match.tokenIndex};
  while (!isEndDelimiter(tokenAt(document, last))) {
    TokenCursor candidate = last;
    if (!nextToken(document, candidate) ||
        !grammar::hasScope(tokenAt(document, candidate), match.scope))
      break;
    last = candidate;
  }

  CommentSpan span;
  span.startLine = first.line;
  span.startColumn = tokenAt(document, first).startColumn;
  span.endLine = last.line;
  span.endColumn = tokenAt(document, last).endColumn;
  return span;
}

// 行内でコメントスコープを持つトークンの連続範囲
struct LineExtent {
  size_t firstToken{0};
  size_t lastToken{0};
};

LineExtent extentAround(const LineTokenization &line, size_t index,
                        const std::string &scope) {
  LineExtent extent{index, index};
  while (extent.firstToken > 0 &&
         grammar::hasScope(line.tokens[extent.firstToken - 1], scope)) {
    --extent.firstToken;
  }
  while (extent.lastToken + 1 < line.tokens.size() &&
         grammar::hasScope(line.tokens[extent.lastToken + 1], scope)) {
    ++extent.lastToken;
  }
  return extent;
}

std::string leadingWhitespace(const std::string &text) {
  size_t i = 0;
  while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) {
    ++i;
  }
  return text.substr(0, i);
}

// 空白以外の内容がすべて scope のコメントである行か
bool commentOnlyLine(TokenizedDocument &document, size_t lineNumber,
                     const std::string &scope, LineExtent &extent) {
  const std::string &text = document.lineText(lineNumber);
  if (isBlankLine(text))
    return false;

  const LineTokenization &line = document.lineTokens(lineNumber);
  size_t first = firstContentToken(text, line);
  if (first == line.tokens.size() ||
      !grammar::hasScope(line.tokens[first], scope))
    return false;

  extent = extentAround(line, first, scope);
  for (size_t i = extent.lastToken + 1; i < line.tokens.size(); ++i) {
    if (!grammar::isWhitespace(text, line.tokens[i]))
      return false;
  }
  return true;
}

CommentSpan mergeLine(TokenizedDocument &document, const CommentMatch &match,
                      bool multiLineMerge, IndentationPolicy indentation) {
  const LineTokenization &line = document.lineTokens(match.line);
  LineExtent extent = extentAround(line, match.tokenIndex, match.scope);

  CommentSpan span;
  span.startLine = match.line;
  span.startColumn = line.tokens[extent.firstToken].startColumn;
  span.endLine = match.line;
  span.endColumn = line.tokens[extent.lastToken].endColumn;

  if (!multiLineMerge)
    return span;

  // コードの後ろに付いた行末コメントは結合しない
  LineExtent own;
  if (!commentOnlyLine(document, match.line, match.scope, own) ||
      own.firstToken != extent.firstToken)
    return span;

  const std::string indent = leadingWhitespace(document.lineText(match.line));
  auto compatible = [&](size_t lineNumber) {
    return indentation == IndentationPolicy::Ignore ||
           leadingWhitespace(document.lineText(lineNumber)) == indent;
  };

  for (size_t lineNumber = match.line; lineNumber > 0;) {
    --lineNumber;
    LineExtent other;
    if (!commentOnlyLine(document, lineNumber, match.scope, other) ||
        !compatible(lineNumber))
      break;
    span.startLine = lineNumber;
    span.startColumn =
        document.lineTokens(lineNumber).tokens[other.firstToken].startColumn;
  }

  for (size_t lineNumber = match.line + 1; lineNumber < document.lineCount();
       ++lineNumber) {
    LineExtent other;
    if (!commentOnlyLine(document, lineNumber, match.scope, other) ||
        !compatible(lineNumber))
      break;
    span.endLine = lineNumber;
    span.endColumn =
        document.lineTokens(lineNumber).tokens[other.lastToken].endColumn;
  }

  return span;
}

} // namespace

CommentSpan mergeComment(TokenizedDocument &document,
                         const CommentMatch &match, bool multiLineMerge,
                         IndentationPolicy indentation) {
  if (isLineCommentScope(match.scope)) {
    return mergeLine(document, match, multiLineMerge, indentation);
  }
  return mergeBlock(document, match);
}

} // namespace comments
} // namespace Honyaku
