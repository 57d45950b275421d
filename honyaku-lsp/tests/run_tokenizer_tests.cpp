#include "grammar.hpp"
#include "grammar_registry.hpp"
#include "tokenizer.hpp"

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using Honyaku::grammar::Grammar;
using Honyaku::grammar::GrammarDescriptor;
using Honyaku::grammar::GrammarRegistry;
using Honyaku::grammar::LineTokens;
using Honyaku::grammar::RuleStack;
using Honyaku::grammar::Token;
using nlohmann::json;

namespace {

std::string grammarPath(const std::string &file) {
  return (std::filesystem::path(HONYAKU_TEST_GRAMMAR_DIR) / file).string();
}

std::shared_ptr<const Grammar> loadGrammar(const std::string &file) {
  return Grammar::loadFromFile(grammarPath(file));
}

std::string tokenText(const std::string &line, const Token &token) {
  return line.substr(token.startColumn, token.endColumn - token.startColumn);
}

// トークンが行全体を隙間なく覆っているか
bool coversLine(const std::string &line, const LineTokens &result) {
  size_t pos = 0;
  for (const auto &token : result.tokens) {
    if (token.startColumn != pos || token.endColumn <= token.startColumn)
      return false;
    pos = token.endColumn;
  }
  return pos == line.size();
}

const Token *tokenAtColumn(const LineTokens &result, size_t column) {
  for (const auto &token : result.tokens) {
    if (column >= token.startColumn && column < token.endColumn)
      return &token;
  }
  return nullptr;
}

bool isComment(const Token *token) {
  return token && Honyaku::grammar::commentScopeOf(*token) != nullptr;
}

// 複数行を順にトークナイズする
std::vector<LineTokens> tokenizeLines(const Grammar &grammar,
                                      const std::vector<std::string> &lines,
                                      size_t maxLineLength =
                                          Honyaku::grammar::kDefaultMaxLineLength) {
  std::vector<LineTokens> out;
  RuleStack state;
  for (const auto &line : lines) {
    out.push_back(
        Honyaku::grammar::tokenizeLine(grammar, line, state, maxLineLength));
    state = out.back().ruleStack;
  }
  return out;
}

bool test_block_comment_state_spans_lines() {
  auto grammar = loadGrammar("cstyle.tmLanguage.json");
  if (!grammar) {
    std::cerr << "cstyle grammar failed to load\n";
    return false;
  }

  std::vector<std::string> lines = {"int a; /* one", "two", "three */ b();"};
  auto result = tokenizeLines(*grammar, lines);

  for (size_t i = 0; i < lines.size(); ++i) {
    if (!coversLine(lines[i], result[i])) {
      std::cerr << "tokens do not cover line " << i << "\n";
      return false;
    }
  }
  if (isComment(tokenAtColumn(result[0], 0))) {
    std::cerr << "code before the block comment must not be a comment\n";
    return false;
  }
  if (!isComment(tokenAtColumn(result[0], 9)) ||
      !isComment(tokenAtColumn(result[1], 0)) ||
      !isComment(tokenAtColumn(result[2], 0))) {
    std::cerr << "block comment body must carry a comment scope\n";
    return false;
  }
  const Token *end = tokenAtColumn(result[2], 6);
  if (!end || !Honyaku::grammar::hasScopePrefix(
                  *end, "punctuation.definition.comment.end")) {
    std::cerr << "closing delimiter must be marked\n";
    return false;
  }
  if (isComment(tokenAtColumn(result[2], 9))) {
    std::cerr << "code after the block comment must not be a comment\n";
    return false;
  }
  if (result[2].ruleStack.depth() != 1) {
    std::cerr << "state must return to the root after the block\n";
    return false;
  }
  return true;
}

bool test_unterminated_block_runs_to_end() {
  auto grammar = loadGrammar("cstyle.tmLanguage.json");
  std::vector<std::string> lines = {"x = 1; /* open", "", "still open"};
  auto result = tokenizeLines(*grammar, lines);

  if (!isComment(tokenAtColumn(result[2], 0)) ||
      !isComment(tokenAtColumn(result[2], 9))) {
    std::cerr << "unterminated block comment must reach the last line\n";
    return false;
  }
  if (result[2].ruleStack.depth() != 2) {
    std::cerr << "state after the last line must stay inside the comment\n";
    return false;
  }
  return true;
}

bool test_comment_markers_inside_strings() {
  auto grammar = loadGrammar("cstyle.tmLanguage.json");
  const std::string line = "url = \"http://example.com\"; // real";
  auto result = tokenizeLines(*grammar, {line})[0];

  const size_t inString = line.find("//");
  if (isComment(tokenAtColumn(result, inString))) {
    std::cerr << "// inside a string literal must not start a comment\n";
    return false;
  }
  const size_t real = line.rfind("//");
  const Token *token = tokenAtColumn(result, real + 3);
  if (!isComment(token) ||
      *Honyaku::grammar::commentScopeOf(*token) !=
          "comment.line.double-slash.cstyle") {
    std::cerr << "trailing comment after the string was not found\n";
    return false;
  }
  return true;
}

bool test_lua_long_comment_back_reference() {
  auto grammar = loadGrammar("dashdash.tmLanguage.json");
  std::vector<std::string> lines = {"--[==[ first ]] still", "]==] x = 1"};
  auto result = tokenizeLines(*grammar, lines);

  if (!isComment(tokenAtColumn(result[0], lines[0].find("still")))) {
    std::cerr << "]] must not close a --[==[ comment\n";
    return false;
  }
  const Token *end = tokenAtColumn(result[1], 0);
  if (!end || tokenText(lines[1], *end) != "]==]" ||
      !Honyaku::grammar::hasScopePrefix(*end,
                                        "punctuation.definition.comment.end")) {
    std::cerr << "]==] must close the long comment\n";
    return false;
  }
  if (isComment(tokenAtColumn(result[1], 5))) {
    std::cerr << "code after ]==] must not be a comment\n";
    return false;
  }
  return true;
}

bool test_hash_special_variable_is_not_comment() {
  auto grammar = loadGrammar("hash.tmLanguage.json");
  const std::string line = "echo $# \"# quoted\" # note";
  auto result = tokenizeLines(*grammar, {line})[0];

  if (isComment(tokenAtColumn(result, line.find("$#") + 1))) {
    std::cerr << "$# must not start a comment\n";
    return false;
  }
  if (isComment(tokenAtColumn(result, line.find("\"#") + 1))) {
    std::cerr << "# inside quotes must not start a comment\n";
    return false;
  }
  if (!isComment(tokenAtColumn(result, line.find("note")))) {
    std::cerr << "# note must be a comment\n";
    return false;
  }
  return true;
}

bool test_zero_width_rules_terminate() {
  auto grammar = Grammar::fromJson(json::parse(R"json({
    "scopeName": "source.zero",
    "patterns": [
      { "name": "meta.empty", "match": "(?=a)" },
      { "name": "meta.lookahead", "begin": "(?=b)", "end": "(?=b)" },
      { "name": "comment.line.zero", "match": "#.*$" }
    ]
  })json"));
  if (!grammar) {
    std::cerr << "zero-width grammar failed to build\n";
    return false;
  }

  const std::vector<std::string> lines = {"xxabc # tail", "bbb", ""};
  for (const auto &line : lines) {
    auto result = Honyaku::grammar::tokenizeLine(*grammar, line, RuleStack());
    if (!coversLine(line, result)) {
      std::cerr << "zero-width match left a gap in '" << line << "'\n";
      return false;
    }
  }
  return true;
}

bool test_long_lines_keep_state() {
  auto grammar = loadGrammar("cstyle.tmLanguage.json");
  const std::string longLine(64, 'x');
  std::vector<std::string> lines = {"/* open", longLine + " */ code",
                                    "still inside"};
  auto result = tokenizeLines(*grammar, lines, 32);

  if (result[1].tokens.size() != 1 ||
      result[1].tokens[0].endColumn != lines[1].size()) {
    std::cerr << "over-long line must become a single token\n";
    return false;
  }
  if (!isComment(&result[1].tokens[0])) {
    std::cerr << "over-long line must keep the current scopes\n";
    return false;
  }
  if (result[1].ruleStack != result[0].ruleStack ||
      !isComment(tokenAtColumn(result[2], 0))) {
    std::cerr << "over-long line must leave the state unchanged\n";
    return false;
  }

  // 0 は上限なし
  auto unlimited = tokenizeLines(*grammar, lines, 0);
  if (isComment(tokenAtColumn(unlimited[2], 0))) {
    std::cerr << "without a limit the block must close on line 1\n";
    return false;
  }
  return true;
}

bool test_invalid_pattern_disables_only_that_rule() {
  auto grammar = Grammar::fromJson(json::parse(R"({
    "scopeName": "source.broken",
    "patterns": [
      { "name": "invalid.broken", "match": "([" },
      { "name": "comment.line.semi", "match": "(;)(.*)$",
        "captures": { "1": { "name": "punctuation.definition.comment.semi" } } }
    ]
  })"));
  if (!grammar) {
    std::cerr << "grammar with a bad pattern must still build\n";
    return false;
  }
  const std::string line = "mov ax, 1 ; load";
  auto result = Honyaku::grammar::tokenizeLine(*grammar, line, RuleStack());
  if (!coversLine(line, result) ||
      !isComment(tokenAtColumn(result, line.find("load")))) {
    std::cerr << "valid rules must keep working next to a broken one\n";
    return false;
  }
  return true;
}

bool test_case_insensitive_flag() {
  auto grammar = Grammar::fromJson(json::parse(R"({
    "scopeName": "source.batch",
    "patterns": [
      { "name": "comment.line.rem", "match": "(?i)(rem)\\b(.*)$",
        "captures": { "1": { "name": "punctuation.definition.comment.rem" } } }
    ]
  })"));
  const std::string line = "REM Remarks here";
  auto result = Honyaku::grammar::tokenizeLine(*grammar, line, RuleStack());
  if (!isComment(tokenAtColumn(result, 5))) {
    std::cerr << "(?i) prefix must make the pattern case-insensitive\n";
    return false;
  }
  return true;
}

bool test_apply_end_pattern_last() {
  const char *source = R"({
    "scopeName": "source.angle",
    "patterns": [
      { "name": "meta.angle", "begin": "<", "end": ">", %FLAG%
        "patterns": [ { "name": "keyword.shift", "match": ">>" } ] }
    ]
  })";
  auto build = [&](bool last) {
    std::string text = source;
    text.replace(text.find("%FLAG%"), 6,
                 last ? "\"applyEndPatternLast\": 1," : "");
    return Grammar::fromJson(json::parse(text));
  };

  const std::string line = "<a>>b>";
  auto withFlag =
      Honyaku::grammar::tokenizeLine(*build(true), line, RuleStack());
  const Token *shift = tokenAtColumn(withFlag, 2);
  if (!shift || !Honyaku::grammar::hasScope(*shift, "keyword.shift")) {
    std::cerr << "applyEndPatternLast must let inner patterns win ties\n";
    return false;
  }

  auto withoutFlag =
      Honyaku::grammar::tokenizeLine(*build(false), line, RuleStack());
  const Token *closed = tokenAtColumn(withoutFlag, 2);
  if (!closed || Honyaku::grammar::hasScope(*closed, "keyword.shift")) {
    std::cerr << "end pattern must win ties by default\n";
    return false;
  }
  return true;
}

bool test_tokenize_is_deterministic() {
  auto grammar = loadGrammar("cstyle.tmLanguage.json");
  const std::string line = "call(); /** doc";
  auto first = Honyaku::grammar::tokenizeLine(*grammar, line, RuleStack());
  auto second = Honyaku::grammar::tokenizeLine(*grammar, line, RuleStack());

  if (first.tokens.size() != second.tokens.size() ||
      first.ruleStack != second.ruleStack) {
    std::cerr << "same input must give the same tokens and state\n";
    return false;
  }
  for (size_t i = 0; i < first.tokens.size(); ++i) {
    if (first.tokens[i].startColumn != second.tokens[i].startColumn ||
        first.tokens[i].scopes != second.tokens[i].scopes) {
      std::cerr << "token " << i << " differs between runs\n";
      return false;
    }
  }
  return true;
}

bool test_registry_lookup() {
  auto descriptors = Honyaku::grammar::loadGrammarDescriptors(
      grammarPath("grammars.json"));
  if (descriptors.empty()) {
    std::cerr << "bundled grammars.json must list descriptors\n";
    return false;
  }

  GrammarRegistry registry(descriptors);
  auto cpp = registry.getGrammar("cpp");
  auto java = registry.getGrammar("JAVA");
  if (!cpp || !java || cpp != java) {
    std::cerr << "languages sharing a rule file must share one grammar\n";
    return false;
  }
  if (cpp->scopeName() != "source.cstyle") {
    std::cerr << "unexpected scope name " << cpp->scopeName() << "\n";
    return false;
  }
  if (registry.getGrammar("cpp") != cpp) {
    std::cerr << "grammar must be cached\n";
    return false;
  }
  if (registry.getGrammar("brainfuck") != nullptr ||
      registry.isLanguageSupported("brainfuck")) {
    std::cerr << "unknown language must have no grammar\n";
    return false;
  }
  return true;
}

bool test_registry_exclusions_and_missing_files() {
  std::vector<GrammarDescriptor> descriptors(2);
  descriptors[0].languages = {"log", "plaintext"};
  descriptors[0].scopeName = "source.hash";
  descriptors[0].path = grammarPath("hash.tmLanguage.json");
  descriptors[1].languages = {"ghost"};
  descriptors[1].scopeName = "source.ghost";
  descriptors[1].path = grammarPath("does-not-exist.tmLanguage.json");

  GrammarRegistry registry(descriptors);
  if (registry.getGrammar("log") != nullptr ||
      registry.getGrammar("Log") != nullptr) {
    std::cerr << "log must be excluded by default\n";
    return false;
  }
  if (!registry.getGrammar("plaintext")) {
    std::cerr << "other languages of the descriptor must still load\n";
    return false;
  }
  if (registry.getGrammar("ghost") != nullptr ||
      registry.getGrammar("ghost") != nullptr) {
    std::cerr << "unreadable rule file must give no grammar\n";
    return false;
  }

  GrammarRegistry noExclusions(descriptors, {});
  if (!noExclusions.getGrammar("log")) {
    std::cerr << "an empty exclusion list must allow log\n";
    return false;
  }
  return true;
}

bool test_descriptor_paths_resolve_against_base() {
  json descriptors = json::parse(R"([
    { "languages": ["a"], "scopeName": "source.a", "path": "rules/a.json" },
    { "language": "b", "scopeName": "source.b", "path": "/abs/b.json" },
    { "languages": ["c"] }
  ])");
  auto parsed = Honyaku::grammar::parseGrammarDescriptors(descriptors, "/base");
  if (parsed.size() != 2) {
    std::cerr << "expected 2 descriptors, got " << parsed.size() << "\n";
    return false;
  }
  if (parsed[0].path != "/base/rules/a.json" || parsed[1].path != "/abs/b.json" ||
      parsed[1].languages != std::vector<std::string>{"b"}) {
    std::cerr << "descriptor paths resolved incorrectly\n";
    return false;
  }
  return true;
}

bool test_long_string_lines_below_limit() {
  auto grammar = loadGrammar("cstyle.tmLanguage.json");
  if (!grammar) {
    std::cerr << "cstyle grammar failed to load\n";
    return false;
  }

  // 上限 (20000 バイト) に近い長さの文字列を含む行
  const std::vector<std::string> lines = {
      "x = '" + std::string(19500, 'a') + "'; // note",
      "y = \"" + std::string(19500, 'b') + "\"; // note",
  };
  for (const auto &line : lines) {
    if (line.size() >= Honyaku::grammar::kDefaultMaxLineLength) {
      std::cerr << "test line must stay below the length limit\n";
      return false;
    }
    auto result = Honyaku::grammar::tokenizeLine(*grammar, line, RuleStack());
    if (!coversLine(line, result)) {
      std::cerr << "long line tokens do not cover the line\n";
      return false;
    }
    if (isComment(tokenAtColumn(result, 100)) ||
        !isComment(tokenAtColumn(result, line.find("note")))) {
      std::cerr << "long string line must keep string and comment apart\n";
      return false;
    }
  }
  return true;
}

bool test_oniguruma_style_patterns() {
  auto grammar = Grammar::fromJson(json::parse(R"({
    "scopeName": "source.t",
    "patterns": [
      { "name": "string.quoted.double.t",
        "begin": "(?<![A-Za-z0-9_])\"", "end": "\"" },
      { "name": "comment.line.number-sign.t", "match": "\\G(#)(.*)$",
        "captures": { "1": { "name": "punctuation.definition.comment.t" } } },
      { "name": "comment.line.double-slash.t", "match": "(?x) (//) (.*) $",
        "captures": { "1": { "name": "punctuation.definition.comment.t" } } }
    ]
  })"));
  if (!grammar) {
    std::cerr << "grammar with lookbehind failed to build\n";
    return false;
  }

  // 後読みを含む begin が有効なので、文字列中の // はコメントではない
  const std::string line = "url = \"http://example.com\"; // done";
  auto result = Honyaku::grammar::tokenizeLine(*grammar, line, RuleStack());
  const Token *inString = tokenAtColumn(result, line.find("//"));
  if (!inString ||
      !Honyaku::grammar::hasScope(*inString, "string.quoted.double.t") ||
      isComment(inString)) {
    std::cerr << "lookbehind string rule must be applied\n";
    return false;
  }
  if (!isComment(tokenAtColumn(result, line.find("done")))) {
    std::cerr << "(?x) comment rule must match after the string\n";
    return false;
  }

  // \G は探索開始位置にしか一致しない
  const std::string anchored = "# top";
  const std::string later = "a # not";
  if (!isComment(tokenAtColumn(
          Honyaku::grammar::tokenizeLine(*grammar, anchored, RuleStack()),
          2)) ||
      isComment(tokenAtColumn(
          Honyaku::grammar::tokenizeLine(*grammar, later, RuleStack()), 4))) {
    std::cerr << "\\G must anchor at the search position\n";
    return false;
  }
  return true;
}

} // namespace

int main() {
  const bool ok1 = test_block_comment_state_spans_lines();
  const bool ok2 = test_unterminated_block_runs_to_end();
  const bool ok3 = test_comment_markers_inside_strings();
  const bool ok4 = test_lua_long_comment_back_reference();
  const bool ok5 = test_hash_special_variable_is_not_comment();
  const bool ok6 = test_zero_width_rules_terminate();
  const bool ok7 = test_long_lines_keep_state();
  const bool ok8 = test_invalid_pattern_disables_only_that_rule();
  const bool ok9 = test_case_insensitive_flag();
  const bool ok10 = test_apply_end_pattern_last();
  const bool ok11 = test_tokenize_is_deterministic();
  const bool ok12 = test_registry_lookup();
  const bool ok13 = test_registry_exclusions_and_missing_files();
  const bool ok14 = test_descriptor_paths_resolve_against_base();
  const bool ok15 = test_long_string_lines_below_limit();
  const bool ok16 = test_oniguruma_style_patterns();

  if (!ok1 || !ok2 || !ok3 || !ok4 || !ok5 || !ok6 || !ok7 || !ok8 || !ok9 ||
      !ok10 || !ok11 || !ok12 || !ok13 || !ok14 || !ok15 || !ok16)
    return 1;
  std::cout << "honyaku tokenizer tests passed\n";
  return 0;
}
