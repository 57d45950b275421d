#pragma once

#include "comment_service.hpp"
#include "grammar_registry.hpp"
#include "text_document.hpp"
#include "translator.hpp"

#include <cstddef>
#include <deque>
#include <istream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace Honyaku {

using json = nlohmann::json;

json toJson(const Position &position);
json toJson(const Range &range);
Position positionFromJson(const json &value);
Range rangeFromJson(const json &value);

class LSPServer {
public:
  // grammars は initializationOptions で上書きされない場合に使う文法
  LSPServer(std::istream &in, std::ostream &out,
            std::vector<grammar::GrammarDescriptor> grammars);

  // exit を受け取るか入力が終わるまで処理する。終了コードを返す
  int run();

private:
  std::istream &in_;
  std::ostream &out_;

  // インメモリテキストストア: uri -> ドキュメント
  std::unordered_map<std::string, TextDocument> docs_;

  std::vector<grammar::GrammarDescriptor> defaultGrammars_;
  std::unique_ptr<comments::CommentService> service_;
  std::unique_ptr<Translator> translator_;

  // クライアントが受け付けるサーバー発リクエスト
  bool clientSelectionContains_{false};
  bool clientTranslate_{false};

  // サーバー発リクエストの応答待ちの間に届いたメッセージ
  std::deque<json> pending_;
  int nextRequestId_{1};
  bool inputClosed_{false};
  bool shutdownRequested_{false};
  bool exitRequested_{false};

  bool readMessage(std::string &jsonPayload);
  bool nextMessage(json &msg);
  void reply(const json &msg);
  std::optional<json> sendRequest(const std::string &method,
                                  const json &params);

  void handle(const json &req);

  json onInitialize(const json &id, const json &params);
  void onDidOpen(const json &params);
  void onDidChange(const json &params);
  void onDidClose(const json &params);
  void onDidChangeConfiguration(const json &params);
  json onHover(const json &id, const json &params);
  json onCommentAtPosition(const json &id, const json &params);

  void applySettings(const json &settings);
  std::optional<comments::CommentBlock>
  lookupComment(const json &params);
  std::optional<comments::CommentBlock>
  requestSelection(const TextDocument &document, const Position &position);
};

} // namespace Honyaku
