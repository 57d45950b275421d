#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Honyaku {
namespace languages {

struct Language {
  std::string name; // 表示名 (例: "Japanese")
  std::string code; // 翻訳 API の言語コード (例: "ja")
};

const std::vector<Language> &all();

// 表示名または言語コードから言語コードを引く (大文字小文字は区別しない)。
// "en-US" のような地域付きのコードは地域なしのコードにも照合する
std::optional<std::string> findLanguageCode(const std::string &nameOrCode);

std::string resolveLanguageCode(const std::string &nameOrCode,
                                const std::string &fallback = "en");

} // namespace languages
} // namespace Honyaku
