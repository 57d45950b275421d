#pragma once

#include "text_document.hpp"

#include <cstddef>
#include <string>

namespace Honyaku {

// LSP の (line, character) をテキスト先頭からのバイトオフセットに変換
size_t computeByteOffset(const std::string &text, int line, int character);

// 1 行分のテキストにおける UTF-16 列とバイト列の相互変換
size_t utf16ToByteColumn(const std::string &lineText, int character);
int byteColumnToUtf16(const std::string &lineText, size_t column);

} // namespace Honyaku
