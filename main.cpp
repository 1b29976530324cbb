#include "Solver.hpp"

#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
constexpr const char* kVersion = "0.1.0";
constexpr int kPairsPerLine = 5;

struct Config {
  std::string input_path;
  std::string corpus_path = "corpus.txt";
  bool verbose = false;
  size_t max_nodes = 0;
  long long time_budget_ms = 0;
  std::vector<int> tolerance_schedule;
};

void PrintUsage(const char* argv0) {
  std::cout
      << "Usage:\n"
      << "  " << argv0 << " CIPHERTEXT.txt [-c corpus.txt] [-v]\n"
      << "Options:\n"
      << "  -c PATH               Word corpus, one word per line, most\n"
      << "                        frequent first (default corpus.txt)\n"
      << "  -v                    Print every search step\n"
      << "  --max-nodes N         Give up on a tolerance level after N nodes\n"
      << "  --time-budget-ms N    Give up on a tolerance level after N ms\n"
      << "  --tolerance LIST      Comma-separated unknown-word tolerances to\n"
      << "                        try in order (default 0..max(3, words/10)-1)\n"
      << "  --help                Show this help\n";
}

std::string TrimWhitespace(const std::string& input) {
  size_t start = 0;
  while (start < input.size() &&
         std::isspace(static_cast<unsigned char>(input[start]))) {
    ++start;
  }
  size_t end = input.size();
  while (end > start &&
         std::isspace(static_cast<unsigned char>(input[end - 1]))) {
    --end;
  }
  return input.substr(start, end - start);
}

bool ReadTextFile(const std::string& path, std::string* out) {
  std::ifstream infile(path, std::ios::binary);
  if (!infile) {
    return false;
  }
  std::ostringstream buffer;
  buffer << infile.rdbuf();
  if (infile.bad()) {
    return false;
  }
  *out = buffer.str();
  return true;
}

std::vector<int> ParseToleranceList(const std::string& text) {
  std::vector<int> schedule;
  std::stringstream stream(text);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = TrimWhitespace(item);
    if (item.empty()) {
      continue;
    }
    int value = std::stoi(item);
    if (value < 0) {
      throw std::out_of_range("negative tolerance");
    }
    schedule.push_back(value);
  }
  if (schedule.empty()) {
    throw std::invalid_argument("empty tolerance list");
  }
  return schedule;
}

// std::stoull accepts a leading '-' and wraps it around.
unsigned long long ParseCount(const std::string& text) {
  std::string trimmed = TrimWhitespace(text);
  if (!trimmed.empty() && trimmed[0] == '-') {
    throw std::out_of_range("negative count: " + trimmed);
  }
  return std::stoull(trimmed);
}

void PrintSubstitutions(const std::map<char, char>& translation) {
  std::cout << "Substitutions:\n";
  int i = 0;
  for (const auto& entry : translation) {
    std::cout << entry.first << " -> " << entry.second << ' ';
    if (i % kPairsPerLine == kPairsPerLine - 1) {
      std::cout << "\n";
    }
    ++i;
  }
  if (i % kPairsPerLine != 0) {
    std::cout << "\n";
  }
}

void PrintReport(const cryptex::SubstitutionSolver::Solution& solution) {
  std::cout << "Ciphertext:\n" << solution.ciphertext << "\n\n";
  std::cout << "Plaintext:\n" << solution.decoded_text << "\n\n";
  PrintSubstitutions(solution.translation);
  if (solution.words_skipped > 0) {
    std::cout << "Unmatched words: " << solution.words_skipped
              << " (tolerance " << solution.tolerance << ")\n";
  }
}
}  // namespace

int main(int argc, char** argv) {
  Config config;
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "-c" && i + 1 < argc) {
        config.corpus_path = argv[++i];
      } else if (arg == "-v") {
        config.verbose = true;
      } else if (arg == "--max-nodes" && i + 1 < argc) {
        config.max_nodes = static_cast<size_t>(ParseCount(argv[++i]));
      } else if (arg == "--time-budget-ms" && i + 1 < argc) {
        config.time_budget_ms =
            static_cast<long long>(ParseCount(argv[++i]));
      } else if (arg == "--tolerance" && i + 1 < argc) {
        config.tolerance_schedule = ParseToleranceList(argv[++i]);
      } else if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (!arg.empty() && arg[0] != '-' && config.input_path.empty()) {
        config.input_path = arg;
      } else {
        std::cerr << "Unknown argument: " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Invalid numeric argument: " << e.what() << "\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::cout << "Cryptex v" << kVersion << "\n\n";

  if (config.input_path.empty()) {
    PrintUsage(argv[0]);
    return 1;
  }

  std::string ciphertext;
  if (!ReadTextFile(config.input_path, &ciphertext)) {
    std::cerr << "Failed to read ciphertext: " << config.input_path << "\n";
    return 1;
  }
  ciphertext = TrimWhitespace(ciphertext);

  cryptex::PatternIndex index;
  std::string error;
  if (!cryptex::PatternIndex::LoadFromFile(config.corpus_path, &index,
                                           &error)) {
    std::cerr << "Failed to load corpus: " << error << "\n";
    return 1;
  }
  if (config.verbose) {
    std::cout << "Loaded " << index.size() << " corpus words in "
              << index.bucket_count() << " patterns.\n";
  }

  cryptex::SubstitutionSolver::Options options;
  options.tolerance_schedule = config.tolerance_schedule;
  options.max_nodes = config.max_nodes;
  options.time_budget = std::chrono::milliseconds(config.time_budget_ms);
  if (config.verbose) {
    options.trace = &std::cout;
  }

  cryptex::SubstitutionSolver solver(index);
  cryptex::SubstitutionSolver::Solution solution;
  auto start = std::chrono::steady_clock::now();
  bool solved = solver.Solve(ciphertext, options, &solution);
  auto end = std::chrono::steady_clock::now();

  if (!solved) {
    std::cout << "Failed to translate ciphertext.\n";
  } else {
    PrintReport(solution);
  }
  if (solution.levels_aborted > 0) {
    std::cerr << "Warning: " << solution.levels_aborted
              << " tolerance level(s) exceeded the search budget.\n";
  }
  if (config.verbose) {
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start)
            .count();
    std::cout << "Search nodes: " << solution.nodes << "\n";
    std::cout << "Total latency: " << micros << "us\n";
  }
  return 0;
}
