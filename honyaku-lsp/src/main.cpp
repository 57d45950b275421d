#include "grammar_registry.hpp"
#include "lsp.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#ifndef HONYAKU_DEFAULT_GRAMMAR_DIR
#define HONYAKU_DEFAULT_GRAMMAR_DIR "grammars"
#endif

namespace {

void printUsage(const char *argv0) {
  std::cerr << "usage: " << argv0 << " [--stdio] [--grammars <dir>]"
            << std::endl;
}

} // namespace

int main(int argc, char **argv) {
  std::string grammarDir;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--stdio") {
      // stdio 以外の通信方式はない
    } else if (arg == "--grammars" && i + 1 < argc) {
      grammarDir = argv[++i];
    } else if (arg.rfind("--grammars=", 0) == 0) {
      grammarDir = arg.substr(11);
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else {
      printUsage(argv[0]);
      return 2;
    }
  }

  // 優先順位: コマンドライン、環境変数、ビルド時の既定値
  if (grammarDir.empty()) {
    if (const char *env = std::getenv("HONYAKU_GRAMMAR_DIR")) {
      grammarDir = env;
    }
  }
  if (grammarDir.empty()) {
    grammarDir = HONYAKU_DEFAULT_GRAMMAR_DIR;
  }

  std::string descriptorFile =
      (std::filesystem::path(grammarDir) / "grammars.json").string();
  auto grammars = Honyaku::grammar::loadGrammarDescriptors(descriptorFile);

  std::ios::sync_with_stdio(false);
  Honyaku::LSPServer server(std::cin, std::cout, std::move(grammars));
  return server.run();
}
