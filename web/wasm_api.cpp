#include "Solver.hpp"

#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

#include <emscripten/bind.h>

namespace {
cryptex::PatternIndex g_index;
bool g_loaded = false;

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  return lines;
}

std::string JsonEscape(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    if (c == '\\' || c == '"') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x",
                    static_cast<unsigned char>(c));
      out += buf;
    } else {
      out.push_back(c);
    }
  }
  return out;
}
}  // namespace

bool LoadCorpus(const std::string& corpus_text) {
  std::vector<std::string> words = SplitLines(corpus_text);
  g_index = cryptex::PatternIndex::Build(words);
  g_loaded = !g_index.empty();
  return g_loaded;
}

int CorpusSize() { return static_cast<int>(g_index.size()); }

std::string Solve(const std::string& ciphertext, int max_nodes) {
  if (!g_loaded) {
    return "{\"error\":\"corpus not loaded\"}";
  }
  cryptex::SubstitutionSolver::Options options;
  if (max_nodes > 0) {
    options.max_nodes = static_cast<size_t>(max_nodes);
  }
  cryptex::SubstitutionSolver solver(g_index);
  cryptex::SubstitutionSolver::Solution solution;
  bool solved = solver.Solve(ciphertext, options, &solution);

  std::ostringstream out;
  out << "{\"solved\":" << (solved ? "true" : "false");
  out << ",\"ciphertext\":\"" << JsonEscape(solution.ciphertext) << "\"";
  if (solved) {
    out << ",\"plaintext\":\"" << JsonEscape(solution.decoded_text) << "\"";
    out << ",\"substitutions\":{";
    bool first = true;
    for (const auto& entry : solution.translation) {
      if (!first) {
        out << ",";
      }
      out << "\"" << JsonEscape(std::string(1, entry.first)) << "\":\""
          << JsonEscape(std::string(1, entry.second)) << "\"";
      first = false;
    }
    out << "}";
    out << ",\"tolerance\":" << solution.tolerance;
    out << ",\"skipped\":" << solution.words_skipped;
  }
  out << ",\"nodes\":" << solution.nodes;
  out << ",\"aborted\":" << solution.levels_aborted;
  out << "}";
  return out.str();
}

EMSCRIPTEN_BINDINGS(cryptex_wasm) {
  emscripten::function("loadCorpus", &LoadCorpus);
  emscripten::function("corpusSize", &CorpusSize);
  emscripten::function("solve", &Solve);
}
