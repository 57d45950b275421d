#include "translator.hpp"

#include <cstdlib>
#include <iostream>

namespace Honyaku {

static bool isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("HONYAKU_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

RequestTranslator::RequestTranslator(RequestSender sender)
    : sender_(std::move(sender)) {}

std::optional<std::string>
RequestTranslator::translate(const std::string &text,
                             const std::string &targetLanguage) {
  if (!sender_ || text.empty())
    return std::nullopt;

  nlohmann::json params = {{"text", text}, {"to", targetLanguage}};
  auto result = sender_("honyaku/translate", params);
  if (!result) {
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] translate request failed" << std::endl;
    }
    return std::nullopt;
  }

  // 文字列、または { "text": "..." } のどちらの形でも受け付ける
  if (result->is_string()) {
    return result->get<std::string>();
  }
  if (result->is_object() && result->contains("text") &&
      (*result)["text"].is_string()) {
    return (*result)["text"].get<std::string>();
  }

  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] unexpected translate result: " << result->dump()
              << std::endl;
  }
  return std::nullopt;
}

} // namespace Honyaku
