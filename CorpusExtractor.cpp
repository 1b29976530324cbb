#include "Solver.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <system_error>

namespace cryptex {
namespace {
// One table row of a ranked listing: rank cell, then a linked word cell.
const std::regex& RowPattern() {
  static const std::regex pattern(
      "<tr>\\n<td>([0-9]+)</td>\\n<td><a[^>]*>([^<]*)</a></td>");
  return pattern;
}
}  // namespace

size_t CorpusExtractor::AddPage(const std::string& page) {
  size_t found = 0;
  auto begin = std::sregex_iterator(page.begin(), page.end(), RowPattern());
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    const std::smatch& match = *it;
    const std::string rank_text = match[1].str();
    RankedWord entry;
    auto parsed = std::from_chars(rank_text.data(),
                                  rank_text.data() + rank_text.size(),
                                  entry.rank);
    if (parsed.ec != std::errc()) {
      continue;
    }
    entry.word = match[2].str();
    entries_.push_back(std::move(entry));
    ++found;
  }
  return found;
}

bool CorpusExtractor::AddPageFile(const std::string& path) {
  std::ifstream infile(path, std::ios::binary);
  if (!infile) {
    return false;
  }
  std::ostringstream buffer;
  buffer << infile.rdbuf();
  if (infile.bad()) {
    return false;
  }
  AddPage(buffer.str());
  return true;
}

std::vector<std::string> CorpusExtractor::Words() const {
  std::vector<RankedWord> sorted = entries_;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const RankedWord& a, const RankedWord& b) {
                     return a.rank < b.rank;
                   });
  std::vector<std::string> words;
  words.reserve(sorted.size());
  for (auto& entry : sorted) {
    words.push_back(std::move(entry.word));
  }
  return words;
}

bool CorpusExtractor::WriteCorpus(const std::string& path) const {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    return false;
  }
  const std::vector<std::string> words = Words();
  for (size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      out << '\n';
    }
    out << words[i];
  }
  out.flush();
  return static_cast<bool>(out);
}

}  // namespace cryptex
