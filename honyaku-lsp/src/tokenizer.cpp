#include "tokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace Honyaku {
namespace grammar {

static bool isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("HONYAKU_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

RuleStack RuleStack::initial(const Grammar &grammar) {
  auto frame = std::make_shared<StackFrame>();
  frame->ruleId = grammar.rootRuleId();
  frame->nameScopes = {grammar.scopeName()};
  frame->contentScopes = frame->nameScopes;
  frame->depth = 1;
  return RuleStack(std::move(frame));
}

RuleStack RuleStack::push(int ruleId,
                          std::shared_ptr<const boost::regex> endPattern,
                          std::string endSource,
                          std::vector<std::string> nameScopes,
                          std::vector<std::string> contentScopes) const {
  auto frame = std::make_shared<StackFrame>();
  frame->parent = top_;
  frame->ruleId = ruleId;
  frame->endPattern = std::move(endPattern);
  frame->endSource = std::move(endSource);
  frame->nameScopes = std::move(nameScopes);
  frame->contentScopes = std::move(contentScopes);
  frame->depth = depth() + 1;
  return RuleStack(std::move(frame));
}

RuleStack RuleStack::pop() const {
  if (!top_ || !top_->parent) {
    // ルートは取り除かない
    return *this;
  }
  return RuleStack(top_->parent);
}

bool RuleStack::operator==(const RuleStack &other) const {
  const StackFrame *a = top_.get();
  const StackFrame *b = other.top_.get();
  while (a && b) {
    if (a == b)
      return true;
    if (a->ruleId != b->ruleId || a->endSource != b->endSource ||
        a->contentScopes != b->contentScopes)
      return false;
    a = a->parent.get();
    b = b->parent.get();
  }
  return a == b;
}

namespace {

using Iterator = std::string::const_iterator;

bool searchFrom(const boost::regex &re, const std::string &line, size_t pos,
                boost::smatch &match) {
  boost::match_flag_type flags = boost::match_default;
  if (pos > 0) {
    flags |= boost::match_prev_avail;
  }
  try {
    Iterator first =
        line.cbegin() + static_cast<Iterator::difference_type>(pos);
    // 後読みは行頭まで遡れるようにし、\G は pos の位置に一致させる
    return boost::regex_search(first, line.cend(), match, re, flags,
                               line.cbegin());
  } catch (const std::runtime_error &e) {
    // 探索の上限 (error_complexity, error_stack) を超えたパターンは
    // この位置の候補から外して処理を続ける
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] regex search failed: " << e.what() << std::endl;
    }
    return false;
  }
}

void pushToken(std::vector<Token> &tokens, size_t start, size_t end,
               const std::vector<std::string> &scopes) {
  if (end <= start)
    return;
  if (!tokens.empty() && tokens.back().endColumn == start &&
      tokens.back().scopes == scopes) {
    tokens.back().endColumn = end;
    return;
  }
  Token token;
  token.startColumn = start;
  token.endColumn = end;
  token.scopes = scopes;
  tokens.push_back(std::move(token));
}

std::vector<std::string> withScope(const std::vector<std::string> &base,
                                   const std::string &scope) {
  std::vector<std::string> scopes = base;
  if (!scope.empty()) {
    scopes.push_back(scope);
  }
  return scopes;
}

// マッチ全体を captures の境界で分割してトークンを出力する
void emitCaptures(std::vector<Token> &tokens, const std::string &line,
                  const boost::smatch &match,
                  const std::vector<std::string> &base,
                  const CaptureMap &captures) {
  const size_t matchStart =
      static_cast<size_t>(match[0].first - line.cbegin());
  const size_t matchEnd = static_cast<size_t>(match[0].second - line.cbegin());
  if (matchEnd <= matchStart)
    return;

  struct Span {
    size_t start;
    size_t end;
    size_t index;
    const std::string *name;
  };

  std::vector<Span> spans;
  for (const auto &capture : captures) {
    size_t index = capture.first;
    if (index >= match.size() || !match[index].matched ||
        capture.second.empty())
      continue;
    size_t start = static_cast<size_t>(match[index].first - line.cbegin());
    size_t end = static_cast<size_t>(match[index].second - line.cbegin());
    if (end <= start)
      continue;
    spans.push_back(Span{start, end, index, &capture.second});
  }

  if (spans.empty()) {
    pushToken(tokens, matchStart, matchEnd, base);
    return;
  }

  // 外側の capture が先に並ぶよう開始位置、長さの順で整列
  std::sort(spans.begin(), spans.end(), [](const Span &a, const Span &b) {
    if (a.start != b.start)
      return a.start < b.start;
    if (a.end != b.end)
      return a.end > b.end;
    return a.index < b.index;
  });

  std::vector<size_t> cuts = {matchStart, matchEnd};
  for (const auto &span : spans) {
    cuts.push_back(std::max(span.start, matchStart));
    cuts.push_back(std::min(span.end, matchEnd));
  }
  std::sort(cuts.begin(), cuts.end());
  cuts.erase(std::unique(cuts.begin(), cuts.end()), cuts.end());

  for (size_t i = 0; i + 1 < cuts.size(); ++i) {
    size_t a = cuts[i];
    size_t b = cuts[i + 1];
    if (a < matchStart || b > matchEnd)
      continue;
    std::vector<std::string> scopes = base;
    for (const auto &span : spans) {
      if (span.start <= a && b <= span.end) {
        scopes.push_back(*span.name);
      }
    }
    pushToken(tokens, a, b, scopes);
  }
}

// end パターン中の \1..\9 を begin のキャプチャ内容で置き換える
std::shared_ptr<const boost::regex>
resolveBackReferences(const Rule &rule, const boost::smatch &beginMatch,
                      std::string &resolvedSource) {
  resolvedSource.clear();
  const std::string &source = rule.endSource;
  for (size_t i = 0; i < source.size(); ++i) {
    char c = source[i];
    if (c == '\\' && i + 1 < source.size()) {
      char next = source[i + 1];
      if (next >= '1' && next <= '9') {
        size_t index = static_cast<size_t>(next - '0');
        if (index < beginMatch.size() && beginMatch[index].matched) {
          resolvedSource += escapeRegex(beginMatch[index].str());
        }
        ++i;
        continue;
      }
      resolvedSource += c;
      resolvedSource += next;
      ++i;
      continue;
    }
    resolvedSource += c;
  }
  return compilePattern(resolvedSource);
}

} // namespace

LineTokens tokenizeLine(const Grammar &grammar, const std::string &lineText,
                        const RuleStack &prior, size_t maxLineLength) {
  LineTokens result;
  RuleStack stack = prior.empty() ? RuleStack::initial(grammar) : prior;
  const size_t len = lineText.size();

  if (maxLineLength > 0 && len > maxLineLength) {
    // 長すぎる行は解析せず、現在のスコープのまま状態を引き継ぐ
    pushToken(result.tokens, 0, len, stack.top()->contentScopes);
    result.ruleStack = stack;
    return result;
  }

  size_t pos = 0;
  // 同じ位置で幅ゼロの begin を繰り返さないための記録
  std::vector<int> emptyBeginsAtPos;
  size_t emptyBeginPos = std::string::npos;

  while (true) {
    const StackFrame *frame = stack.top();
    const Rule &frameRule = grammar.rule(frame->ruleId);

    boost::smatch best;
    bool found = false;
    bool bestIsEnd = false;
    int bestRule = -1;
    size_t bestStart = std::string::npos;

    auto consider = [&](const boost::regex &re, int ruleId, bool isEnd) {
      if (found && bestStart == pos)
        return; // これより前には見つからない
      boost::smatch match;
      if (!searchFrom(re, lineText, pos, match))
        return;
      size_t start = static_cast<size_t>(match[0].first - lineText.cbegin());
      if (!found || start < bestStart) {
        best = match;
        found = true;
        bestIsEnd = isEnd;
        bestRule = ruleId;
        bestStart = start;
      }
    };

    const bool hasEnd = frame->endPattern != nullptr;
    if (hasEnd && !frameRule.applyEndPatternLast) {
      consider(*frame->endPattern, frame->ruleId, true);
    }
    for (int id : frameRule.candidates) {
      const Rule &candidate = grammar.rule(id);
      if (!candidate.pattern)
        continue;
      consider(*candidate.pattern, id, false);
    }
    if (hasEnd && frameRule.applyEndPatternLast) {
      consider(*frame->endPattern, frame->ruleId, true);
    }

    if (!found) {
      pushToken(result.tokens, pos, len, frame->contentScopes);
      break;
    }

    const size_t start = bestStart;
    const size_t end = static_cast<size_t>(best[0].second - lineText.cbegin());
    pushToken(result.tokens, pos, start, frame->contentScopes);

    if (start != emptyBeginPos) {
      emptyBeginsAtPos.clear();
      emptyBeginPos = std::string::npos;
    }

    if (bestIsEnd) {
      emitCaptures(result.tokens, lineText, best, frame->nameScopes,
                   frameRule.endCaptures);
      stack = stack.pop();
      pos = end;
      continue;
    }

    const Rule &rule = grammar.rule(bestRule);
    if (rule.kind == RuleKind::Match) {
      if (start == end) {
        // 進まないマッチは無限ループになるため、残りをそのまま出力する
        pushToken(result.tokens, start, len, frame->contentScopes);
        break;
      }
      emitCaptures(result.tokens, lineText, best,
                   withScope(frame->contentScopes, rule.name), rule.captures);
      pos = end;
      continue;
    }

    // BeginEnd
    if (start == end) {
      if (std::find(emptyBeginsAtPos.begin(), emptyBeginsAtPos.end(),
                    bestRule) != emptyBeginsAtPos.end()) {
        pushToken(result.tokens, start, len, frame->contentScopes);
        break;
      }
      emptyBeginsAtPos.push_back(bestRule);
      emptyBeginPos = start;
    }

    std::vector<std::string> nameScopes =
        withScope(frame->contentScopes, rule.name);
    emitCaptures(result.tokens, lineText, best, nameScopes, rule.captures);

    std::shared_ptr<const boost::regex> endPattern = rule.end;
    std::string endSource = rule.endSource;
    if (rule.endHasBackReferences) {
      endPattern = resolveBackReferences(rule, best, endSource);
    }
    if (!endPattern) {
      // end を解釈できないルールは begin 部分だけのマッチとして扱う
      if (start == end) {
        pushToken(result.tokens, start, len, frame->contentScopes);
        break;
      }
      pos = end;
      continue;
    }

    std::vector<std::string> contentScopes =
        withScope(nameScopes, rule.contentName);
    stack = stack.push(bestRule, std::move(endPattern), std::move(endSource),
                       std::move(nameScopes), std::move(contentScopes));
    pos = end;
  }

  result.ruleStack = stack;
  return result;
}

bool scopeMatches(const std::string &scope, const std::string &prefix) {
  if (scope.size() < prefix.size() || scope.compare(0, prefix.size(), prefix))
    return false;
  return scope.size() == prefix.size() || scope[prefix.size()] == '.';
}

const std::string *commentScopeOf(const Token &token) {
  for (auto it = token.scopes.rbegin(); it != token.scopes.rend(); ++it) {
    if (scopeMatches(*it, "comment"))
      return &*it;
  }
  return nullptr;
}

bool hasScope(const Token &token, const std::string &scope) {
  return std::find(token.scopes.begin(), token.scopes.end(), scope) !=
         token.scopes.end();
}

bool hasScopePrefix(const Token &token, const std::string &prefix) {
  for (const auto &scope : token.scopes) {
    if (scopeMatches(scope, prefix))
      return true;
  }
  return false;
}

bool isWhitespace(const std::string &lineText, const Token &token) {
  for (size_t i = token.startColumn; i < token.endColumn && i < lineText.size();
       ++i) {
    if (!std::isspace(static_cast<unsigned char>(lineText[i])))
      return false;
  }
  return true;
}

} // namespace grammar
} // namespace Honyaku
