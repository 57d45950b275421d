#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Honyaku {

class Translator {
public:
  virtual ~Translator() = default;

  // text を targetLanguage (言語コード) に翻訳する。失敗時は std::nullopt
  virtual std::optional<std::string>
  translate(const std::string &text, const std::string &targetLanguage) = 0;
};

// クライアントへ honyaku/translate リクエストを送って翻訳を依頼する
class RequestTranslator : public Translator {
public:
  // method, params を送り、応答の result を返す (エラー応答なら std::nullopt)
  using RequestSender = std::function<std::optional<nlohmann::json>(
      const std::string &, const nlohmann::json &)>;

  explicit RequestTranslator(RequestSender sender);

  std::optional<std::string>
  translate(const std::string &text,
            const std::string &targetLanguage) override;

private:
  RequestSender sender_;
};

} // namespace Honyaku
