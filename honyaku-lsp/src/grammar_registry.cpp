#include "grammar_registry.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

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

namespace {

std::string toLower(std::string input) {
  std::transform(
      input.begin(), input.end(), input.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return input;
}

} // namespace

std::vector<GrammarDescriptor>
parseGrammarDescriptors(const json &descriptors, const std::string &baseDir) {
  std::vector<GrammarDescriptor> result;
  if (!descriptors.is_array())
    return result;

  for (const auto &entry : descriptors) {
    if (!entry.is_object() || !entry.contains("path") ||
        !entry["path"].is_string())
      continue;

    GrammarDescriptor descriptor;
    std::filesystem::path path(entry["path"].get<std::string>());
    if (path.is_relative() && !baseDir.empty()) {
      path = std::filesystem::path(baseDir) / path;
    }
    descriptor.path = path.lexically_normal().string();

    if (entry.contains("scopeName") && entry["scopeName"].is_string()) {
      descriptor.scopeName = entry["scopeName"].get<std::string>();
    }
    if (entry.contains("languages") && entry["languages"].is_array()) {
      for (const auto &language : entry["languages"]) {
        if (language.is_string()) {
          descriptor.languages.push_back(language.get<std::string>());
        }
      }
    } else if (entry.contains("language") && entry["language"].is_string()) {
      // VS Code の contributes.grammars と同じ単数形も受け付ける
      descriptor.languages.push_back(entry["language"].get<std::string>());
    }

    if (!descriptor.languages.empty()) {
      result.push_back(std::move(descriptor));
    }
  }
  return result;
}

std::vector<GrammarDescriptor>
loadGrammarDescriptors(const std::string &descriptorFile) {
  std::ifstream ifs(descriptorFile, std::ios::binary);
  if (!ifs) {
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] grammar descriptor file not found: "
                << descriptorFile << std::endl;
    }
    return {};
  }

  std::ostringstream content;
  content << ifs.rdbuf();

  try {
    json descriptors = json::parse(content.str());
    std::string baseDir =
        std::filesystem::path(descriptorFile).parent_path().string();
    return parseGrammarDescriptors(descriptors, baseDir);
  } catch (const json::parse_error &e) {
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] invalid grammar descriptor file "
                << descriptorFile << ": " << e.what() << std::endl;
    }
    return {};
  }
}

GrammarRegistry::GrammarRegistry(
    std::vector<GrammarDescriptor> descriptors,
    const std::vector<std::string> &excludedLanguages)
    : descriptors_(std::move(descriptors)) {
  for (const auto &language : excludedLanguages) {
    excluded_.insert(toLower(language));
  }
}

const GrammarDescriptor *
GrammarRegistry::findDescriptor(const std::string &languageId) const {
  const std::string key = toLower(languageId);
  if (key.empty() || excluded_.count(key))
    return nullptr;

  for (const auto &descriptor : descriptors_) {
    for (const auto &language : descriptor.languages) {
      if (toLower(language) == key)
        return &descriptor;
    }
  }
  return nullptr;
}

bool GrammarRegistry::isLanguageSupported(const std::string &languageId) const {
  return findDescriptor(languageId) != nullptr;
}

std::shared_ptr<const Grammar>
GrammarRegistry::getGrammar(const std::string &languageId) {
  const std::string key = toLower(languageId);

  std::lock_guard<std::mutex> lock(mutex_);
  auto cached = byLanguage_.find(key);
  if (cached != byLanguage_.end()) {
    return cached->second;
  }

  std::shared_ptr<const Grammar> grammar;
  const GrammarDescriptor *descriptor = findDescriptor(languageId);
  if (descriptor) {
    auto pathIt = byPath_.find(descriptor->path);
    if (pathIt != byPath_.end()) {
      grammar = pathIt->second;
    } else {
      if (isDebugEnabled()) {
        std::cerr << "[DEBUG] loading grammar for " << languageId << ": "
                  << descriptor->path << std::endl;
      }
      grammar = Grammar::loadFromFile(descriptor->path);
      if (grammar && !descriptor->scopeName.empty() &&
          grammar->scopeName() != descriptor->scopeName &&
          isDebugEnabled()) {
        std::cerr << "[DEBUG] grammar scope mismatch: expected "
                  << descriptor->scopeName << ", got " << grammar->scopeName()
                  << std::endl;
      }
      byPath_[descriptor->path] = grammar;
    }
  }

  // 見つからなかった結果も記録し、同じ言語で再読み込みしない
  byLanguage_[key] = grammar;
  return grammar;
}

} // namespace grammar
} // namespace Honyaku
