#include "Solver.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {
void PrintUsage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " [-o corpus.txt] PAGE.html [PAGE.html ...]\n"
            << "Builds a corpus from ranked word-frequency listing pages.\n"
            << "Words are written one per line in ascending rank order.\n";
}
}  // namespace

int main(int argc, char** argv) {
  std::string output = "corpus.txt";
  std::vector<std::string> pages;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-o" && i + 1 < argc) {
      output = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      return 0;
    } else if (!arg.empty() && arg[0] != '-') {
      pages.push_back(arg);
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage(argv[0]);
      return 1;
    }
  }
  if (pages.empty()) {
    PrintUsage(argv[0]);
    return 1;
  }

  cryptex::CorpusExtractor extractor;
  for (const auto& page : pages) {
    if (!extractor.AddPageFile(page)) {
      std::cerr << "Failed to read page: " << page << "\n";
      return 1;
    }
  }
  if (extractor.entries().empty()) {
    std::cerr << "Warning: no ranked words found in " << pages.size()
              << " page(s).\n";
  }
  if (!extractor.WriteCorpus(output)) {
    std::cerr << "Failed to write corpus: " << output << "\n";
    return 1;
  }
  std::cout << "Wrote " << extractor.entries().size() << " words to "
            << output << "\n";
  return 0;
}
