#include "text_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace Honyaku {
namespace comments {

namespace {

inline bool isNewline(char c) { return c == '\n' || c == '\r'; }

inline void setSpace(char &c) {
  if (!isNewline(c)) {
    c = ' ';
  }
}

inline bool isBlank(char c) { return c == ' ' || c == '\t' || c == '\r'; }

std::string trim(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && isBlank(text[start])) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && isBlank(text[end - 1])) {
    --end;
  }
  return text.substr(start, end - start);
}

std::vector<std::string> splitLines(const std::string &text) {
  std::vector<std::string> lines;
  size_t pos = 0;
  while (true) {
    size_t lineEnd = text.find('\n', pos);
    if (lineEnd == std::string::npos) {
      lines.push_back(text.substr(pos));
      break;
    }
    lines.push_back(text.substr(pos, lineEnd - pos));
    pos = lineEnd + 1;
  }
  return lines;
}

// 継続行の先頭にある `*` を 1 つだけ取り除く
void stripContinuationMarker(std::string &line) {
  size_t idx = 0;
  while (idx < line.size() && isBlank(line[idx])) {
    ++idx;
  }
  if (idx < line.size() && line[idx] == '*') {
    line[idx] = ' ';
  }
}

// ブロック末尾の `**/` のような閉じ記号前の `*` の並びを取り除く
void stripTrailingStars(std::string &line) {
  size_t end = line.size();
  while (end > 0 && isBlank(line[end - 1])) {
    --end;
  }
  size_t stars = end;
  while (stars > 0 && line[stars - 1] == '*') {
    --stars;
  }
  if (stars < end && (stars == 0 || isBlank(line[stars - 1]))) {
    line.erase(stars, end - stars);
  }
}

} // namespace

void sanitizeLineComment(std::string &segment) {
  const size_t len = segment.size();
  size_t i = 0;
  while (i < len && isBlank(segment[i])) {
    ++i;
  }
  if (i >= len)
    return;

  if (i + 1 < len && segment[i] == '/' && segment[i + 1] == '/') {
    setSpace(segment[i]);
    setSpace(segment[i + 1]);
    i += 2;
    while (i < len && (segment[i] == '/' || segment[i] == '!')) {
      setSpace(segment[i]);
      ++i;
    }
  } else if (segment[i] == '#') {
    while (i < len && segment[i] == '#') {
      setSpace(segment[i]);
      ++i;
    }
    if (i < len && segment[i] == '!') {
      setSpace(segment[i]);
      ++i;
    }
  } else if (segment[i] == '%' || segment[i] == ';') {
    const char marker = segment[i];
    while (i < len && segment[i] == marker) {
      setSpace(segment[i]);
      ++i;
    }
  } else if (i + 1 < len && segment[i] == '-' && segment[i + 1] == '-') {
    while (i < len && segment[i] == '-') {
      setSpace(segment[i]);
      ++i;
    }
  }

  while (i < len && (segment[i] == ' ' || segment[i] == '\t')) {
    setSpace(segment[i]);
    ++i;
  }
}

void sanitizeBlockComment(std::string &segment) {
  const size_t len = segment.size();
  if (len == 0)
    return;

  size_t start = 0;
  while (start < len && isBlank(segment[start])) {
    ++start;
  }

  if (start + 4 <= len && segment.compare(start, 4, "<!--") == 0) {
    size_t i = start;
    for (; i < start + 4; ++i) {
      setSpace(segment[i]);
    }
    while (i < len && segment[i] == '-') {
      setSpace(segment[i]);
      ++i;
    }
  } else if (start + 2 <= len && segment.compare(start, 2, "/*") == 0) {
    setSpace(segment[start]);
    setSpace(segment[start + 1]);
    size_t i = start + 2;
    while (i < len && segment[i] == '*') {
      setSpace(segment[i]);
      ++i;
    }
  } else if (start + 2 <= len && segment.compare(start, 2, "{-") == 0) {
    setSpace(segment[start]);
    setSpace(segment[start + 1]);
  }

  size_t end = len;
  while (end > 0 && isBlank(segment[end - 1])) {
    --end;
  }

  if (end >= 3 && segment.compare(end - 3, 3, "-->") == 0) {
    size_t idx = end - 3;
    for (size_t k = idx; k < end; ++k) {
      setSpace(segment[k]);
    }
    while (idx > 0 && segment[idx - 1] == '-') {
      --idx;
      setSpace(segment[idx]);
    }
  } else if (end >= 2 && segment.compare(end - 2, 2, "*/") == 0) {
    size_t idx = end - 2;
    setSpace(segment[idx]);
    setSpace(segment[idx + 1]);
    while (idx > 0 && segment[idx - 1] == '*') {
      --idx;
      setSpace(segment[idx]);
    }
  } else if (end >= 2 && segment.compare(end - 2, 2, "-}") == 0) {
    setSpace(segment[end - 2]);
    setSpace(segment[end - 1]);
  }

  size_t pos = 0;
  while (pos < len) {
    size_t lineEnd = segment.find('\n', pos);
    if (lineEnd == std::string::npos) {
      lineEnd = len;
    }

    size_t idx = pos;
    while (idx < lineEnd && isBlank(segment[idx])) {
      ++idx;
    }
    if (idx < lineEnd && segment[idx] == '*') {
      setSpace(segment[idx]);
    }

    pos = (lineEnd < len) ? lineEnd + 1 : len;
  }
}

std::optional<ExtractedText> extractText(TokenizedDocument &document,
                                         const CommentSpan &span,
                                         const std::string &scope) {
  const bool isBlock = !isLineCommentScope(scope);

  std::vector<std::string> rawLines;
  std::vector<std::string> contentLines;
  bool sawDelimiter = false;

  for (size_t lineNumber = span.startLine;
       lineNumber <= span.endLine && lineNumber < document.lineCount();
       ++lineNumber) {
    const std::string &text = document.lineText(lineNumber);
    const size_t from = lineNumber == span.startLine
                            ? std::min(span.startColumn, text.size())
                            : 0;
    const size_t to = lineNumber == span.endLine
                          ? std::min(span.endColumn, text.size())
                          : text.size();

    rawLines.push_back(to > from ? text.substr(from, to - from)
                                 : std::string());

    // 区切り記号のトークンは空白に置き換える
    std::string content;
    const LineTokenization &line = document.lineTokens(lineNumber);
    for (const auto &token : line.tokens) {
      const size_t a = std::max(token.startColumn, from);
      const size_t b = std::min(token.endColumn, to);
      if (a >= b)
        continue;
      if (grammar::hasScopePrefix(token, "punctuation.definition.comment")) {
        sawDelimiter = true;
        content.append(b - a, ' ');
      } else {
        content.append(text, a, b - a);
      }
    }
    contentLines.push_back(std::move(content));
  }

  std::vector<std::string> lines;
  if (sawDelimiter) {
    lines = std::move(contentLines);
    if (isBlock) {
      for (auto &line : lines) {
        stripContinuationMarker(line);
      }
      if (!lines.empty()) {
        stripTrailingStars(lines.back());
      }
    }
  } else if (isBlock) {
    std::string joined;
    for (size_t i = 0; i < rawLines.size(); ++i) {
      if (i > 0)
        joined += '\n';
      joined += rawLines[i];
    }
    sanitizeBlockComment(joined);
    lines = splitLines(joined);
  } else {
    lines = std::move(rawLines);
    for (auto &line : lines) {
      sanitizeLineComment(line);
    }
  }

  std::string text;
  for (const auto &line : lines) {
    std::string trimmed = trim(line);
    if (trimmed.empty())
      continue;
    if (!text.empty())
      text += ' ';
    text += trimmed;
  }

  if (text.empty())
    return std::nullopt;

  ExtractedText extracted;
  extracted.humanize = isHumanizable(text);
  extracted.text = std::move(text);
  return extracted;
}

bool isHumanizable(const std::string &text) {
  bool hasWord = false;
  for (char ch : text) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (c >= 0x80)
      return false;
    if (std::isalnum(c)) {
      hasWord = true;
    } else if (c != '_' && c != '-') {
      return false;
    }
  }
  // `// ----` のような区切り線は識別子として扱わない
  return hasWord;
}

std::string humanizeIdentifier(const std::string &text) {
  std::string spaced;
  spaced.reserve(text.size() + 8);
  for (size_t i = 0; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c == '_' || c == '-' || std::isspace(c)) {
      spaced += ' ';
      continue;
    }
    if (i > 0 && std::isupper(c)) {
      unsigned char prev = static_cast<unsigned char>(text[i - 1]);
      bool nextLower =
          i + 1 < text.size() &&
          std::islower(static_cast<unsigned char>(text[i + 1]));
      // fooBar / foo2Bar / XMLHttp の境界で区切る
      if (std::islower(prev) || std::isdigit(prev) ||
          (std::isupper(prev) && nextLower)) {
        spaced += ' ';
      }
    }
    spaced += static_cast<char>(std::tolower(c));
  }

  std::string result;
  result.reserve(spaced.size());
  for (char c : spaced) {
    if (c == ' ' && (result.empty() || result.back() == ' '))
      continue;
    result += c;
  }
  if (!result.empty() && result.back() == ' ')
    result.pop_back();
  return result;
}

} // namespace comments
} // namespace Honyaku
