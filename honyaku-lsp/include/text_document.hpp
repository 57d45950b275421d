#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace Honyaku {

// LSP 互換の位置 (character は UTF-16 コードユニット単位)
struct Position {
  int line{0};
  int character{0};
};

struct Range {
  Position start;
  Position end;
};

inline bool operator==(const Position &a, const Position &b) {
  return a.line == b.line && a.character == b.character;
}
inline bool operator!=(const Position &a, const Position &b) {
  return !(a == b);
}
inline bool operator==(const Range &a, const Range &b) {
  return a.start == b.start && a.end == b.end;
}
inline bool operator!=(const Range &a, const Range &b) { return !(a == b); }

// エディタで開かれているドキュメントのスナップショット
class TextDocument {
public:
  TextDocument(std::string uri, std::string languageId, int version,
               std::string text);

  const std::string &uri() const { return uri_; }
  const std::string &languageId() const { return languageId_; }
  int version() const { return version_; }

  // 改行 (\n, \r\n) を除いた行テキスト
  const std::vector<std::string> &lines() const { return lines_; }
  size_t lineCount() const { return lines_.size(); }
  const std::string &lineAt(size_t line) const;

  void setText(std::string text, int version);
  void applyChange(const Range &range, const std::string &newText,
                   int version);

private:
  void splitLines();

  std::string uri_;
  std::string languageId_;
  int version_{0};
  std::string text_;
  std::vector<std::string> lines_;
};

} // namespace Honyaku
