#include "comment_service.hpp"
#include "comment_locator.hpp"
#include "languages.hpp"
#include "text_extractor.hpp"
#include "utf16.hpp"

#include <cstdlib>
#include <iostream>

namespace Honyaku {
namespace comments {

static bool isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("HONYAKU_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

std::string CommentBlock::translatableText() const {
  return humanize ? humanizeIdentifier(comment) : comment;
}

IndentationPolicy parseIndentationPolicy(const std::string &value,
                                         IndentationPolicy fallback) {
  if (value == "ignore")
    return IndentationPolicy::Ignore;
  if (value == "strict")
    return IndentationPolicy::Strict;
  return fallback;
}

CommentLookup computeComment(TokenizedDocument &document,
                             const Position &position,
                             const Settings &settings) {
  CommentLookup lookup;

  auto match = locateComment(document, position);
  if (!match) {
    lookup.status = LookupStatus::NoMatch;
    return lookup;
  }

  CommentSpan span = mergeComment(document, *match, settings.multiLineMerge,
                                  settings.mergeIndentation);
  auto extracted = extractText(document, span, match->scope);
  if (!extracted) {
    lookup.status = LookupStatus::EmptyAfterStrip;
    return lookup;
  }

  CommentBlock block;
  block.comment = std::move(extracted->text);
  block.humanize = extracted->humanize;
  if (block.translatableText().empty()) {
    lookup.status = LookupStatus::EmptyAfterStrip;
    return lookup;
  }

  block.range.start.line = static_cast<int>(span.startLine);
  block.range.start.character =
      byteColumnToUtf16(document.lineText(span.startLine), span.startColumn);
  block.range.end.line = static_cast<int>(span.endLine);
  block.range.end.character =
      byteColumnToUtf16(document.lineText(span.endLine), span.endColumn);
  block.isLineComment = isLineCommentScope(match->scope);
  block.scope = match->scope;

  lookup.status = LookupStatus::Ok;
  lookup.block = std::move(block);
  return lookup;
}

CommentService::CommentService(
    std::shared_ptr<grammar::GrammarRegistry> registry, Settings settings)
    : registry_(std::move(registry)), settings_(std::move(settings)) {}

CommentLookup CommentService::getComment(const TextDocument &document,
                                         const Position &position,
                                         const SelectionProvider &selection) {
  CommentLookup lookup;

  auto grammar = registry_->getGrammar(document.languageId());
  if (!grammar) {
    lookup.status = LookupStatus::NoGrammar;
    return lookup;
  }

  // 選択範囲がカーソル位置を含む場合はそれをそのまま使う
  if (selection) {
    auto selected = selection(document, position);
    if (selected && !selected->comment.empty()) {
      selected->humanize = false;
      lookup.status = LookupStatus::Ok;
      lookup.block = std::move(selected);
      return lookup;
    }
  }

  Settings current;
  size_t maxLineLength;
  {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    current = settings_;
    maxLineLength = maxLineLength_;
  }

  auto tokenized = cache_.getOrCreate(document, grammar, maxLineLength);
  lookup = computeComment(*tokenized, position, current);

  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] getComment " << document.uri() << " "
              << position.line << ":" << position.character << " status="
              << static_cast<int>(lookup.status) << std::endl;
  }
  return lookup;
}

void CommentService::removeDocument(const std::string &languageId,
                                    const std::string &uri) {
  cache_.remove(languageId, uri);
}

void CommentService::setSettings(const SettingsUpdate &update) {
  std::lock_guard<std::mutex> lock(settingsMutex_);
  if (update.multiLineMerge) {
    settings_.multiLineMerge = *update.multiLineMerge;
  }
  if (update.mergeIndentation) {
    settings_.mergeIndentation = *update.mergeIndentation;
  }
  if (update.preferredLanguage && !update.preferredLanguage->empty()) {
    settings_.preferredLanguage =
        languages::resolveLanguageCode(*update.preferredLanguage);
  }
}

Settings CommentService::settings() const {
  std::lock_guard<std::mutex> lock(settingsMutex_);
  return settings_;
}

void CommentService::setMaxTokenizationLineLength(size_t maxLineLength) {
  {
    std::lock_guard<std::mutex> lock(settingsMutex_);
    maxLineLength_ = maxLineLength;
  }
  // 既存のトークナイズ結果は古い上限で作られている
  cache_.clear();
}

} // namespace comments
} // namespace Honyaku
