#include "text_document.hpp"
#include "utf16.hpp"

#include <utility>

namespace Honyaku {

TextDocument::TextDocument(std::string uri, std::string languageId,
                           int version, std::string text)
    : uri_(std::move(uri)), languageId_(std::move(languageId)),
      version_(version), text_(std::move(text)) {
  splitLines();
}

const std::string &TextDocument::lineAt(size_t line) const {
  static const std::string kEmpty;
  if (line >= lines_.size())
    return kEmpty;
  return lines_[line];
}

void TextDocument::setText(std::string text, int version) {
  text_ = std::move(text);
  version_ = version;
  splitLines();
}

void TextDocument::applyChange(const Range &range, const std::string &newText,
                               int version) {
  size_t start = computeByteOffset(text_, range.start.line,
                                   range.start.character);
  size_t end = computeByteOffset(text_, range.end.line, range.end.character);
  if (end < start)
    std::swap(start, end);
  text_.replace(start, end - start, newText);
  version_ = version;
  splitLines();
}

void TextDocument::splitLines() {
  lines_.clear();
  size_t pos = 0;
  while (true) {
    size_t lineEnd = text_.find('\n', pos);
    if (lineEnd == std::string::npos) {
      lineEnd = text_.size();
    }
    size_t contentEnd = lineEnd;
    if (contentEnd > pos && text_[contentEnd - 1] == '\r')
      --contentEnd;
    lines_.push_back(text_.substr(pos, contentEnd - pos));
    if (lineEnd >= text_.size())
      break;
    pos = lineEnd + 1;
  }
}

} // namespace Honyaku
