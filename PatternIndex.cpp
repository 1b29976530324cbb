#include "Solver.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <fstream>
#include <utility>

#if defined(CRYPTEX_USE_HWY)
#include "hwy/highway.h"
#endif

namespace cryptex {
namespace {
#if defined(CRYPTEX_USE_HWY)
// Widest vector Highway may pick (SVE/RVV), so unaligned loads past the last
// word of a block stay in bounds.
constexpr size_t kBlockPadding = 256;
#endif

bool IsLowerAscii(char c) { return c >= 'a' && c <= 'z'; }

}  // namespace

std::string Pattern(std::string_view word) {
  std::array<int, 256> rank;
  rank.fill(-1);
  std::string out;
  out.reserve(word.size());
  int next = 0;
  for (char c : word) {
    int& r = rank[static_cast<unsigned char>(c)];
    if (r < 0) {
      r = next++;
    }
    out.push_back(static_cast<char>('0' + r));
  }
  return out;
}

PatternIndex PatternIndex::Build(const std::vector<std::string>& words) {
  PatternIndex index;

  std::vector<std::string> patterns(words.size());
#ifdef _OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (size_t i = 0; i < words.size(); ++i) {
    patterns[i] = Pattern(words[i]);
  }

  for (size_t i = 0; i < words.size(); ++i) {
    Bucket& bucket = index.buckets_[patterns[i]];
    bucket.length = words[i].size();
    bucket.block.append(words[i]);
    ++bucket.count;
  }
  index.word_count_ = words.size();

#if defined(CRYPTEX_USE_HWY)
  for (auto& entry : index.buckets_) {
    entry.second.block.append(kBlockPadding, '\0');
  }
#endif
  return index;
}

bool PatternIndex::LoadFromFile(const std::string& path, PatternIndex* out,
                                std::string* error_out) {
  std::ifstream infile(path);
  if (!infile) {
    if (error_out) {
      *error_out = "cannot open corpus file: " + path;
    }
    return false;
  }
  std::vector<std::string> words;
  std::string line;
  while (std::getline(infile, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    words.push_back(line);
  }
  if (infile.bad()) {
    if (error_out) {
      *error_out = "error while reading corpus file: " + path;
    }
    return false;
  }
  if (words.empty()) {
    if (error_out) {
      *error_out = "corpus file is empty: " + path;
    }
    return false;
  }
  if (out) {
    *out = Build(words);
  }
  return true;
}

bool PatternIndex::IsCompatible(std::string_view probe,
                                std::string_view word) {
  if (probe.size() != word.size()) {
    return false;
  }
  for (size_t i = 0; i < probe.size(); ++i) {
    char p = probe[i];
    char w = word[i];
    if ((IsLowerAscii(p) || p == '\'' || w == '\'') && p != w) {
      return false;
    }
  }
  return true;
}

std::vector<std::string_view> PatternIndex::Candidates(
    std::string_view probe) const {
  std::vector<std::string_view> out;
  if (probe.empty()) {
    return out;
  }
  auto it = buckets_.find(Pattern(probe));
  if (it == buckets_.end()) {
    return out;
  }
  FilterBucket(it->second, probe, &out);
  return out;
}

void PatternIndex::FilterBucket(const Bucket& bucket, std::string_view probe,
                                std::vector<std::string_view>* out) const {
#if defined(CRYPTEX_USE_HWY)
  namespace hn = hwy::HWY_NAMESPACE;

  const size_t length = bucket.length;
  const hn::ScalableTag<uint8_t> d;
  const size_t lanes = hn::Lanes(d);
  if (lanes > 1 && length > 0 && lanes <= kBlockPadding) {
    // Fixed probe positions as a byte mask plus the bytes expected there.
    const size_t padded = (length + lanes - 1) / lanes * lanes;
    std::vector<uint8_t> mask(padded, 0);
    std::vector<uint8_t> expected(padded, 0);
    bool any_fixed = false;
    for (size_t i = 0; i < length; ++i) {
      if (IsLowerAscii(probe[i]) || probe[i] == '\'') {
        mask[i] = 0xFF;
        expected[i] = static_cast<uint8_t>(probe[i]);
        any_fixed = true;
      }
    }

    if (any_fixed) {
      const uint8_t* base =
          reinterpret_cast<const uint8_t*>(bucket.block.data());
      for (size_t w = 0; w < bucket.count; ++w) {
        const uint8_t* word = base + w * length;
        bool pass = true;
        for (size_t offset = 0; offset < length && pass; offset += lanes) {
          auto v = hn::LoadU(d, word + offset);
          auto m = hn::LoadU(d, mask.data() + offset);
          auto e = hn::LoadU(d, expected.data() + offset);
          // Bytes past |length| belong to the next word but are masked out.
          pass = hn::AllTrue(d, hn::Eq(hn::And(v, m), e));
        }
        if (!pass) {
          continue;
        }
        std::string_view candidate = bucket.WordAt(w);
        if (IsCompatible(probe, candidate)) {
          out->push_back(candidate);
        }
      }
      return;
    }
  }
#endif

  for (size_t w = 0; w < bucket.count; ++w) {
    std::string_view candidate = bucket.WordAt(w);
    if (IsCompatible(probe, candidate)) {
      out->push_back(candidate);
    }
  }
}

}  // namespace cryptex
