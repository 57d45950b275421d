#include "languages.hpp"

#include <algorithm>
#include <cctype>

namespace Honyaku {
namespace languages {

const std::vector<Language> &all() {
  static const std::vector<Language> table = {
      {"Afrikaans", "af"},      {"Albanian", "sq"},
      {"Amharic", "am"},        {"Arabic", "ar"},
      {"Armenian", "hy"},       {"Azerbaijani", "az"},
      {"Basque", "eu"},         {"Belarusian", "be"},
      {"Bengali", "bn"},        {"Bosnian", "bs"},
      {"Bulgarian", "bg"},      {"Catalan", "ca"},
      {"Cebuano", "ceb"},       {"Chichewa", "ny"},
      {"Chinese Simplified", "zh-CN"},
      {"Chinese Traditional", "zh-TW"},
      {"Corsican", "co"},       {"Croatian", "hr"},
      {"Czech", "cs"},          {"Danish", "da"},
      {"Dutch", "nl"},          {"English", "en"},
      {"Esperanto", "eo"},      {"Estonian", "et"},
      {"Filipino", "tl"},       {"Finnish", "fi"},
      {"French", "fr"},         {"Frisian", "fy"},
      {"Galician", "gl"},       {"Georgian", "ka"},
      {"German", "de"},         {"Greek", "el"},
      {"Gujarati", "gu"},       {"Haitian Creole", "ht"},
      {"Hausa", "ha"},          {"Hawaiian", "haw"},
      {"Hebrew", "iw"},         {"Hindi", "hi"},
      {"Hmong", "hmn"},         {"Hungarian", "hu"},
      {"Icelandic", "is"},      {"Igbo", "ig"},
      {"Indonesian", "id"},     {"Irish", "ga"},
      {"Italian", "it"},        {"Japanese", "ja"},
      {"Javanese", "jw"},       {"Kannada", "kn"},
      {"Kazakh", "kk"},         {"Khmer", "km"},
      {"Korean", "ko"},         {"Kurdish (Kurmanji)", "ku"},
      {"Kyrgyz", "ky"},         {"Lao", "lo"},
      {"Latin", "la"},          {"Latvian", "lv"},
      {"Lithuanian", "lt"},     {"Luxembourgish", "lb"},
      {"Macedonian", "mk"},     {"Malagasy", "mg"},
      {"Malay", "ms"},          {"Malayalam", "ml"},
      {"Maltese", "mt"},        {"Maori", "mi"},
      {"Marathi", "mr"},        {"Mongolian", "mn"},
      {"Myanmar (Burmese)", "my"},
      {"Nepali", "ne"},         {"Norwegian", "no"},
      {"Pashto", "ps"},         {"Persian", "fa"},
      {"Polish", "pl"},         {"Portuguese", "pt"},
      {"Punjabi", "pa"},        {"Romanian", "ro"},
      {"Russian", "ru"},        {"Samoan", "sm"},
      {"Scots Gaelic", "gd"},   {"Serbian", "sr"},
      {"Sesotho", "st"},        {"Shona", "sn"},
      {"Sindhi", "sd"},         {"Sinhala", "si"},
      {"Slovak", "sk"},         {"Slovenian", "sl"},
      {"Somali", "so"},         {"Spanish", "es"},
      {"Sundanese", "su"},      {"Swahili", "sw"},
      {"Swedish", "sv"},        {"Tajik", "tg"},
      {"Tamil", "ta"},          {"Telugu", "te"},
      {"Thai", "th"},           {"Turkish", "tr"},
      {"Ukrainian", "uk"},      {"Urdu", "ur"},
      {"Uzbek", "uz"},          {"Vietnamese", "vi"},
      {"Welsh", "cy"},          {"Xhosa", "xh"},
      {"Yiddish", "yi"},        {"Yoruba", "yo"},
      {"Zulu", "zu"},
  };
  return table;
}

namespace {

std::string toLower(const std::string &s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

const Language *lookup(const std::string &key) {
  const std::string lowered = toLower(key);
  for (const auto &language : all()) {
    if (toLower(language.name) == lowered ||
        toLower(language.code) == lowered) {
      return &language;
    }
  }
  return nullptr;
}

} // namespace

std::optional<std::string> findLanguageCode(const std::string &nameOrCode) {
  if (nameOrCode.empty())
    return std::nullopt;

  std::string key = nameOrCode;
  std::replace(key.begin(), key.end(), '_', '-');
  if (const Language *language = lookup(key)) {
    return language->code;
  }

  // en-US -> en
  size_t dash = key.find('-');
  if (dash != std::string::npos && dash > 0) {
    if (const Language *language = lookup(key.substr(0, dash))) {
      return language->code;
    }
  }
  return std::nullopt;
}

std::string resolveLanguageCode(const std::string &nameOrCode,
                                const std::string &fallback) {
  auto code = findLanguageCode(nameOrCode);
  return code ? *code : fallback;
}

} // namespace languages
} // namespace Honyaku
