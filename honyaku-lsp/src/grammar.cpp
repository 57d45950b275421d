#include "grammar.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <unordered_map>

using nlohmann::json;

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

std::shared_ptr<const boost::regex> compilePattern(const std::string &source) {
  try {
    return std::make_shared<const boost::regex>(source, boost::regex::perl);
  } catch (const boost::regex_error &e) {
    // 対応していない構文のルールだけを無効にする
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] unsupported pattern '" << source << "': "
                << e.what() << std::endl;
    }
    return nullptr;
  }
}

std::string escapeRegex(const std::string &text) {
  // (?x) の中でも字義どおりになるよう # と空白もエスケープする
  static const std::string kSpecial = "\\^$.|?*+()[]{}# ";
  std::string escaped;
  escaped.reserve(text.size() * 2);
  for (char c : text) {
    if (kSpecial.find(c) != std::string::npos) {
      escaped += '\\';
    }
    escaped += c;
  }
  return escaped;
}

namespace {

bool hasBackReference(const std::string &source) {
  for (size_t i = 0; i + 1 < source.size(); ++i) {
    if (source[i] != '\\')
      continue;
    if (source[i + 1] >= '1' && source[i + 1] <= '9')
      return true;
    ++i; // エスケープされた文字を読み飛ばす
  }
  return false;
}

CaptureMap parseCaptures(const json &desc) {
  CaptureMap captures;
  if (!desc.is_object())
    return captures;
  for (auto it = desc.begin(); it != desc.end(); ++it) {
    const std::string &key = it.key();
    if (key.empty() ||
        key.find_first_not_of("0123456789") != std::string::npos)
      continue;
    const json &capture = it.value();
    if (capture.is_object() && capture.contains("name") &&
        capture["name"].is_string()) {
      captures[static_cast<size_t>(std::stoul(key))] =
          capture["name"].get<std::string>();
    }
  }
  return captures;
}

std::string stringField(const json &desc, const char *key) {
  if (desc.contains(key) && desc[key].is_string())
    return desc[key].get<std::string>();
  return std::string();
}

} // namespace

class GrammarBuilder {
public:
  explicit GrammarBuilder(const json &doc) : doc_(doc) {}

  std::shared_ptr<const Grammar> build() {
    if (!doc_.is_object() || !doc_.contains("scopeName") ||
        !doc_["scopeName"].is_string()) {
      return nullptr;
    }

    grammar_ = std::make_shared<Grammar>(Grammar::ConstructionKey());
    grammar_->scopeName_ = doc_["scopeName"].get<std::string>();

    if (doc_.contains("repository") && doc_["repository"].is_object()) {
      repository_ = &doc_["repository"];
    }

    int rootId = reserve();
    grammar_->rootRuleId_ = rootId;
    Rule root;
    root.id = rootId;
    root.kind = RuleKind::Include;
    root.name = grammar_->scopeName_;
    if (doc_.contains("patterns")) {
      root.patterns = compilePatterns(doc_["patterns"]);
    }
    grammar_->rules_[static_cast<size_t>(rootId)] = std::move(root);

    flattenCandidates();
    return grammar_;
  }

private:
  int reserve() {
    int id = static_cast<int>(grammar_->rules_.size());
    grammar_->rules_.emplace_back();
    grammar_->rules_.back().id = id;
    return id;
  }

  std::vector<int> compilePatterns(const json &patterns) {
    std::vector<int> ids;
    if (!patterns.is_array())
      return ids;
    for (const auto &entry : patterns) {
      int id = -1;
      if (entry.is_object() && entry.contains("include") &&
          entry["include"].is_string()) {
        id = resolveInclude(entry["include"].get<std::string>());
      } else {
        id = compileRule(entry, -1);
      }
      if (id >= 0) {
        ids.push_back(id);
      }
    }
    return ids;
  }

  int resolveInclude(const std::string &reference) {
    if (reference == "$self" || reference == "$base") {
      return grammar_->rootRuleId_;
    }
    if (!reference.empty() && reference[0] == '#') {
      return compileRepositoryEntry(reference.substr(1));
    }
    // 他の文法への参照 (source.xxx) は解決しない
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] unresolved include '" << reference << "' in "
                << grammar_->scopeName_ << std::endl;
    }
    return -1;
  }

  int compileRepositoryEntry(const std::string &name) {
    auto it = repositoryIds_.find(name);
    if (it != repositoryIds_.end())
      return it->second;

    if (!repository_ || !repository_->contains(name)) {
      if (isDebugEnabled()) {
        std::cerr << "[DEBUG] missing repository entry '#" << name << "' in "
                  << grammar_->scopeName_ << std::endl;
      }
      repositoryIds_[name] = -1;
      return -1;
    }

    // 再帰参照に備え、先に ID を確保する
    int id = reserve();
    repositoryIds_[name] = id;
    if (compileRule((*repository_)[name], id) < 0) {
      // 無効なエントリは空のコンテナとして残す
      grammar_->rules_[static_cast<size_t>(id)].kind = RuleKind::Include;
    }
    return id;
  }

  int compileRule(const json &desc, int reservedId) {
    if (!desc.is_object())
      return -1;

    if (desc.contains("include") && desc["include"].is_string() &&
        reservedId >= 0) {
      // repository エントリ自体が include の場合はコンテナとして包む
      Rule rule;
      rule.id = reservedId;
      int target = resolveInclude(desc["include"].get<std::string>());
      if (target >= 0)
        rule.patterns.push_back(target);
      grammar_->rules_[static_cast<size_t>(reservedId)] = std::move(rule);
      return reservedId;
    }

    Rule rule;
    rule.name = stringField(desc, "name");
    rule.contentName = stringField(desc, "contentName");

    if (desc.contains("match") && desc["match"].is_string()) {
      rule.kind = RuleKind::Match;
      rule.pattern = compilePattern(desc["match"].get<std::string>());
      if (desc.contains("captures")) {
        rule.captures = parseCaptures(desc["captures"]);
      }
    } else if (desc.contains("begin") && desc["begin"].is_string()) {
      if (!desc.contains("end") || !desc["end"].is_string()) {
        if (isDebugEnabled()) {
          std::cerr << "[DEBUG] begin rule without end (while rules are not "
                       "supported): "
                    << desc["begin"].get<std::string>() << std::endl;
        }
        return -1;
      }
      rule.kind = RuleKind::BeginEnd;
      rule.pattern = compilePattern(desc["begin"].get<std::string>());
      rule.endSource = desc["end"].get<std::string>();
      rule.endHasBackReferences = hasBackReference(rule.endSource);
      if (!rule.endHasBackReferences) {
        rule.end = compilePattern(rule.endSource);
      }
      if (desc.contains("captures")) {
        rule.captures = parseCaptures(desc["captures"]);
        rule.endCaptures = rule.captures;
      }
      if (desc.contains("beginCaptures")) {
        rule.captures = parseCaptures(desc["beginCaptures"]);
      }
      if (desc.contains("endCaptures")) {
        rule.endCaptures = parseCaptures(desc["endCaptures"]);
      }
      if (desc.contains("applyEndPatternLast")) {
        const json &flag = desc["applyEndPatternLast"];
        rule.applyEndPatternLast =
            (flag.is_boolean() && flag.get<bool>()) ||
            (flag.is_number_integer() && flag.get<int>() != 0);
      }
    } else if (desc.contains("patterns")) {
      rule.kind = RuleKind::Include;
    } else {
      return -1;
    }

    int id = reservedId >= 0 ? reservedId : reserve();
    rule.id = id;
    if (desc.contains("patterns")) {
      rule.patterns = compilePatterns(desc["patterns"]);
    }
    grammar_->rules_[static_cast<size_t>(id)] = std::move(rule);
    return id;
  }

  void collect(int id, std::vector<int> &out, std::set<int> &visited) {
    if (id < 0 || !visited.insert(id).second)
      return;
    const Rule &rule = grammar_->rules_[static_cast<size_t>(id)];
    if (rule.kind == RuleKind::Include) {
      for (int child : rule.patterns) {
        collect(child, out, visited);
      }
      return;
    }
    out.push_back(id);
  }

  void flattenCandidates() {
    for (auto &rule : grammar_->rules_) {
      std::vector<int> candidates;
      std::set<int> visited;
      for (int child : rule.patterns) {
        collect(child, candidates, visited);
      }
      rule.candidates = std::move(candidates);
    }
  }

  const json &doc_;
  const json *repository_{nullptr};
  std::shared_ptr<Grammar> grammar_;
  std::unordered_map<std::string, int> repositoryIds_;
};

std::shared_ptr<const Grammar> Grammar::fromJson(const json &doc) {
  GrammarBuilder builder(doc);
  return builder.build();
}

std::shared_ptr<const Grammar> Grammar::loadFromFile(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] cannot open grammar file: " << path << std::endl;
    }
    return nullptr;
  }

  std::ostringstream content;
  content << ifs.rdbuf();

  try {
    return fromJson(json::parse(content.str()));
  } catch (const json::exception &e) {
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] failed to parse grammar " << path << ": "
                << e.what() << std::endl;
    }
    return nullptr;
  }
}

} // namespace grammar
} // namespace Honyaku
