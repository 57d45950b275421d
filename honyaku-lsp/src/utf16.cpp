#include "utf16.hpp"

namespace {
static inline size_t utf8SeqLen(unsigned char c) {
  if (c < 0x80)
    return 1;
  if ((c >> 5) == 0x6)
    return 2;
  if ((c >> 4) == 0xE)
    return 3;
  if ((c >> 3) == 0x1E)
    return 4;
  return 1;
}

// i の位置の文字を読み進め、消費した UTF-16 コードユニット数を返す
static inline unsigned int advanceCodePoint(const std::string &s, size_t &i) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  size_t len = utf8SeqLen(c);

  // 途中で切れたシーケンスや不正なバイトは 1 コードユニットとして扱う
  if (len == 1 || i + len > s.size()) {
    i += 1;
    return 1;
  }
  for (size_t k = 1; k < len; ++k) {
    if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
      i += 1;
      return 1;
    }
  }

  i += len;
  // 4 バイト文字は BMP 外 (サロゲートペア)
  return len == 4 ? 2 : 1;
}
} // namespace

namespace Honyaku {

size_t computeByteOffset(const std::string &text, int line, int character) {
  size_t offset = 0;
  int currentLine = 0;
  while (currentLine < line && offset < text.size()) {
    size_t newline = text.find('\n', offset);
    if (newline == std::string::npos)
      return text.size();
    offset = newline + 1;
    ++currentLine;
  }
  if (currentLine < line)
    return text.size();

  unsigned int col16 = 0;
  while (offset < text.size() && text[offset] != '\n' &&
         col16 < static_cast<unsigned int>(character < 0 ? 0 : character)) {
    col16 += advanceCodePoint(text, offset);
  }
  return offset;
}

size_t utf16ToByteColumn(const std::string &lineText, int character) {
  size_t i = 0;
  unsigned int col16 = 0;
  const unsigned int target =
      static_cast<unsigned int>(character < 0 ? 0 : character);
  while (i < lineText.size() && col16 < target) {
    col16 += advanceCodePoint(lineText, i);
  }
  return i;
}

int byteColumnToUtf16(const std::string &lineText, size_t column) {
  if (column > lineText.size())
    column = lineText.size();
  size_t i = 0;
  unsigned int col16 = 0;
  while (i < column) {
    col16 += advanceCodePoint(lineText, i);
  }
  return static_cast<int>(col16);
}

} // namespace Honyaku
