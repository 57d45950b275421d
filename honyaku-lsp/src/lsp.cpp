#include "lsp.hpp"
#include "languages.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using nlohmann::json;

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

namespace {

constexpr int kMethodNotFound = -32601;
constexpr int kInternalError = -32603;

json nullResult(const json &id) {
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", nullptr}};
}

std::optional<size_t> readLineLength(const json &value) {
  if (value.is_number_unsigned() || value.is_number_integer()) {
    long long length = value.get<long long>();
    if (length >= 0)
      return static_cast<size_t>(length);
  }
  return std::nullopt;
}

} // namespace

json toJson(const Position &position) {
  return json{{"line", position.line}, {"character", position.character}};
}

json toJson(const Range &range) {
  return json{{"start", toJson(range.start)}, {"end", toJson(range.end)}};
}

Position positionFromJson(const json &value) {
  Position position;
  position.line = value.at("line").get<int>();
  position.character = value.at("character").get<int>();
  return position;
}

Range rangeFromJson(const json &value) {
  Range range;
  range.start = positionFromJson(value.at("start"));
  range.end = positionFromJson(value.at("end"));
  return range;
}

LSPServer::LSPServer(std::istream &in, std::ostream &out,
                     std::vector<grammar::GrammarDescriptor> grammars)
    : in_(in), out_(out), defaultGrammars_(std::move(grammars)) {
  service_ = std::make_unique<comments::CommentService>(
      std::make_shared<grammar::GrammarRegistry>(defaultGrammars_));
  translator_ = std::make_unique<RequestTranslator>(
      [this](const std::string &method, const json &params) {
        return sendRequest(method, params);
      });
}

bool LSPServer::readMessage(std::string &jsonPayload) {
  // 最小限のLSPヘッダー読み取り: Content-Length、空行、本文の順
  std::string line;
  size_t contentLength = 0;

  while (std::getline(in_, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.rfind("Content-Length:", 0) == 0) {
      try {
        contentLength = static_cast<size_t>(std::stoul(line.substr(15)));
      } catch (const std::exception &e) {
        if (isDebugEnabled()) {
          std::cerr << "[DEBUG] invalid Content-Length: " << e.what()
                    << std::endl;
        }
        contentLength = 0;
      }
    }
    if (line.empty())
      break; // 空行はヘッダー終了を示す
  }

  if (!contentLength || !in_.good())
    return false;

  jsonPayload.resize(contentLength);
  in_.read(&jsonPayload[0], static_cast<std::streamsize>(contentLength));
  return in_.gcount() == static_cast<std::streamsize>(contentLength);
}

bool LSPServer::nextMessage(json &msg) {
  if (!pending_.empty()) {
    msg = std::move(pending_.front());
    pending_.pop_front();
    return true;
  }

  std::string jsonPayload;
  while (!inputClosed_) {
    if (!readMessage(jsonPayload)) {
      inputClosed_ = true;
      break;
    }
    try {
      msg = json::parse(jsonPayload);
      return true;
    } catch (const json::parse_error &e) {
      if (isDebugEnabled()) {
        std::cerr << "[DEBUG] JSON parse error: " << e.what() << std::endl;
      }
    }
  }
  return false;
}

void LSPServer::reply(const json &msg) {
  std::string payload = msg.dump();
  out_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
  out_.flush();
}

std::optional<json> LSPServer::sendRequest(const std::string &method,
                                           const json &params) {
  const std::string id = "honyaku-" + std::to_string(nextRequestId_++);
  reply(json{{"jsonrpc", "2.0"},
             {"id", id},
             {"method", method},
             {"params", params}});

  // 応答が届くまで他のメッセージは退避しておき、後で順に処理する
  std::string jsonPayload;
  while (!inputClosed_) {
    if (!readMessage(jsonPayload)) {
      inputClosed_ = true;
      break;
    }
    json msg;
    try {
      msg = json::parse(jsonPayload);
    } catch (const json::parse_error &e) {
      if (isDebugEnabled()) {
        std::cerr << "[DEBUG] JSON parse error: " << e.what() << std::endl;
      }
      continue;
    }

    const bool isResponse = !msg.contains("method") && msg.contains("id") &&
                            msg["id"].is_string() &&
                            msg["id"].get<std::string>() == id;
    if (!isResponse) {
      pending_.push_back(std::move(msg));
      continue;
    }

    if (msg.contains("error")) {
      if (isDebugEnabled()) {
        std::cerr << "[DEBUG] " << method
                  << " failed: " << msg["error"].dump() << std::endl;
      }
      return std::nullopt;
    }
    return msg.contains("result") ? msg["result"] : json();
  }
  return std::nullopt;
}

void LSPServer::handle(const json &req) {
  try {
    if (!req.contains("method")) {
      // 応答待ちではないサーバー発リクエストへの応答
      if (isDebugEnabled()) {
        std::cerr << "[DEBUG] unexpected response: " << req.dump()
                  << std::endl;
      }
      return;
    }

    std::string method = req["method"];
    const bool isRequest = req.contains("id");
    const json id = isRequest ? req["id"] : json();
    const json params = req.value("params", json::object());

    if (method == "initialize") {
      reply(onInitialize(id, params));
    } else if (method == "initialized") {
      // 初期化完了
    } else if (method == "textDocument/didOpen") {
      onDidOpen(params);
    } else if (method == "textDocument/didChange") {
      onDidChange(params);
    } else if (method == "textDocument/didClose") {
      onDidClose(params);
    } else if (method == "workspace/didChangeConfiguration") {
      onDidChangeConfiguration(params);
    } else if (method == "textDocument/hover") {
      reply(onHover(id, params));
    } else if (method == "honyaku/commentAtPosition") {
      reply(onCommentAtPosition(id, params));
    } else if (method == "shutdown") {
      shutdownRequested_ = true;
      reply(nullResult(id));
    } else if (method == "exit") {
      exitRequested_ = true;
    } else if (isRequest) {
      reply(json{{"jsonrpc", "2.0"},
                 {"id", id},
                 {"error",
                  {{"code", kMethodNotFound},
                   {"message", "Method not found: " + method}}}});
    }
  } catch (const std::exception &e) {
    // クラッシュを避けるため基本的なエラーレスポンスを送信
    if (req.contains("id")) {
      json error = {{"jsonrpc", "2.0"},
                    {"id", req["id"]},
                    {"error",
                     {{"code", kInternalError}, {"message", e.what()}}}};
      reply(error);
    }
  }
}

int LSPServer::run() {
  json msg;
  while (!exitRequested_ && nextMessage(msg)) {
    handle(msg);
  }
  return shutdownRequested_ ? 0 : 1;
}

json LSPServer::onInitialize(const json &id, const json &params) {
  comments::Settings settings;
  std::vector<grammar::GrammarDescriptor> grammars = defaultGrammars_;
  std::vector<std::string> excluded = {"log"};
  std::optional<size_t> maxLineLength;

  // initializationOptionsから設定を抽出
  if (params.contains("initializationOptions") &&
      params["initializationOptions"].is_object()) {
    const json &opts = params["initializationOptions"];

    if (opts.contains("grammars") && opts["grammars"].is_array()) {
      std::string baseDir;
      if (opts.contains("grammarBaseDir") &&
          opts["grammarBaseDir"].is_string()) {
        baseDir = opts["grammarBaseDir"].get<std::string>();
      }
      grammars = grammar::parseGrammarDescriptors(opts["grammars"], baseDir);
    }
    if (opts.contains("excludedLanguages") &&
        opts["excludedLanguages"].is_array()) {
      excluded.clear();
      for (const auto &language : opts["excludedLanguages"]) {
        if (language.is_string()) {
          excluded.push_back(language.get<std::string>());
        }
      }
    }
    if (opts.contains("multiLineMerge") &&
        opts["multiLineMerge"].is_boolean()) {
      settings.multiLineMerge = opts["multiLineMerge"];
    }
    if (opts.contains("mergeIndentation") &&
        opts["mergeIndentation"].is_string()) {
      settings.mergeIndentation = comments::parseIndentationPolicy(
          opts["mergeIndentation"].get<std::string>(),
          settings.mergeIndentation);
    }

    // 翻訳先: preferredLanguage、なければエディタの表示言語
    if (opts.contains("userLanguage") && opts["userLanguage"].is_string()) {
      settings.preferredLanguage = languages::resolveLanguageCode(
          opts["userLanguage"].get<std::string>());
    }
    if (opts.contains("preferredLanguage") &&
        opts["preferredLanguage"].is_string() &&
        !opts["preferredLanguage"].get<std::string>().empty()) {
      settings.preferredLanguage = languages::resolveLanguageCode(
          opts["preferredLanguage"].get<std::string>());
    }
    if (opts.contains("maxTokenizationLineLength")) {
      maxLineLength = readLineLength(opts["maxTokenizationLineLength"]);
    }

    if (opts.contains("selectionContains") &&
        opts["selectionContains"].is_boolean()) {
      clientSelectionContains_ = opts["selectionContains"];
    }
    if (opts.contains("translate") && opts["translate"].is_boolean()) {
      clientTranslate_ = opts["translate"];
    }
  }

  service_ = std::make_unique<comments::CommentService>(
      std::make_shared<grammar::GrammarRegistry>(std::move(grammars),
                                                 excluded),
      settings);
  if (maxLineLength) {
    service_->setMaxTokenizationLineLength(*maxLineLength);
  }

  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] initialize: grammars="
              << service_->registry().descriptors().size()
              << " target=" << settings.preferredLanguage
              << " multiLineMerge=" << settings.multiLineMerge << std::endl;
  }

  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"result",
               {{"capabilities",
                 {{"textDocumentSync",
                   {{"openClose", true}, {"change", 2}}}, // Incremental
                  {"hoverProvider", true}}},
                {"serverInfo", {{"name", "honyaku-lsp"}}}}}};
}

void LSPServer::onDidOpen(const json &params) {
  const json &item = params.at("textDocument");
  std::string uri = item.at("uri").get<std::string>();
  std::string text = item.at("text").get<std::string>();
  std::string languageId = item.value("languageId", std::string());
  int version = item.value("version", 0);

  auto it = docs_.find(uri);
  if (it != docs_.end()) {
    service_->removeDocument(it->second.languageId(), uri);
    docs_.erase(it);
  }
  service_->removeDocument(languageId, uri);
  docs_.emplace(uri, TextDocument(uri, languageId, version, std::move(text)));
}

void LSPServer::onDidChange(const json &params) {
  std::string uri = params.at("textDocument").at("uri");
  auto it = docs_.find(uri);
  if (it == docs_.end())
    return;

  TextDocument &document = it->second;
  int version =
      params["textDocument"].value("version", document.version() + 1);

  // 変更は受け取った順に適用する
  for (const auto &change : params.at("contentChanges")) {
    std::string newText = change.at("text");
    if (change.contains("range")) {
      document.applyChange(rangeFromJson(change["range"]), newText, version);
    } else {
      document.setText(std::move(newText), version);
    }
  }

  service_->removeDocument(document.languageId(), uri);
}

void LSPServer::onDidClose(const json &params) {
  std::string uri = params.at("textDocument").at("uri");
  auto it = docs_.find(uri);
  if (it == docs_.end())
    return;
  service_->removeDocument(it->second.languageId(), uri);
  docs_.erase(it);
}

void LSPServer::onDidChangeConfiguration(const json &params) {
  if (!params.contains("settings") || !params["settings"].is_object())
    return;
  const json &settings = params["settings"];
  if (settings.contains("honyaku") && settings["honyaku"].is_object()) {
    applySettings(settings["honyaku"]);
  }
}

void LSPServer::applySettings(const json &settings) {
  comments::SettingsUpdate update;
  if (settings.contains("multiLineMerge") &&
      settings["multiLineMerge"].is_boolean()) {
    update.multiLineMerge = settings["multiLineMerge"].get<bool>();
  }
  if (settings.contains("preferredLanguage") &&
      settings["preferredLanguage"].is_string()) {
    update.preferredLanguage = settings["preferredLanguage"].get<std::string>();
  }
  if (settings.contains("mergeIndentation") &&
      settings["mergeIndentation"].is_string()) {
    update.mergeIndentation = comments::parseIndentationPolicy(
        settings["mergeIndentation"].get<std::string>(),
        service_->settings().mergeIndentation);
  }
  service_->setSettings(update);

  if (settings.contains("maxTokenizationLineLength")) {
    if (auto length = readLineLength(settings["maxTokenizationLineLength"])) {
      service_->setMaxTokenizationLineLength(*length);
    }
  }
}

std::optional<comments::CommentBlock>
LSPServer::requestSelection(const TextDocument &document,
                            const Position &position) {
  if (!clientSelectionContains_)
    return std::nullopt;

  json params = {{"textDocument", {{"uri", document.uri()}}},
                 {"position", toJson(position)}};
  auto result = sendRequest("honyaku/selectionContains", params);
  if (!result || !result->is_object() || !result->contains("range") ||
      !result->contains("comment") || !(*result)["comment"].is_string())
    return std::nullopt;

  comments::CommentBlock block;
  block.range = rangeFromJson((*result)["range"]);
  block.comment = (*result)["comment"].get<std::string>();
  block.isLineComment = false;
  block.humanize = false;
  return block;
}

std::optional<comments::CommentBlock>
LSPServer::lookupComment(const json &params) {
  std::string uri = params.at("textDocument").at("uri");
  auto it = docs_.find(uri);
  if (it == docs_.end())
    return std::nullopt;

  // sendRequest の間に届いた変更で docs_ が書き換わらないようコピーを使う
  const TextDocument document = it->second;
  Position position = positionFromJson(params.at("position"));

  comments::CommentLookup lookup = service_->getComment(
      document, position,
      [this](const TextDocument &doc, const Position &pos) {
        return requestSelection(doc, pos);
      });
  return lookup.block;
}

json LSPServer::onHover(const json &id, const json &params) {
  auto block = lookupComment(params);
  if (!block)
    return nullResult(id);

  const std::string text = block->translatableText();
  std::optional<std::string> translation;
  if (clientTranslate_) {
    translation =
        translator_->translate(text, service_->settings().preferredLanguage);
  }

  std::string value = translation ? *translation : "Translation failed";
  if (block->humanize) {
    value = text + " => " + value;
  }

  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"result",
               {{"contents", {{"kind", "plaintext"}, {"value", value}}},
                {"range", toJson(block->range)}}}};
}

json LSPServer::onCommentAtPosition(const json &id, const json &params) {
  auto block = lookupComment(params);
  if (!block)
    return nullResult(id);

  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"result",
               {{"range", toJson(block->range)},
                {"comment", block->comment},
                {"humanize", block->humanize},
                {"translatableText", block->translatableText()},
                {"isLineComment", block->isLineComment},
                {"scope", block->scope}}}};
}

} // namespace Honyaku
