#pragma once

#include <array>
#include <bitset>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cryptex {

// Ranks each character by first occurrence: "MXM" -> "010", "ASDF" -> "0123".
// One output character per input character ('0' + rank).
std::string Pattern(std::string_view word);

class PatternIndex {
 public:
  PatternIndex() = default;

  static PatternIndex Build(const std::vector<std::string>& words);
  static bool LoadFromFile(const std::string& path, PatternIndex* out,
                           std::string* error_out);

  // Corpus words sharing the probe's pattern whose fixed positions agree
  // with it. Lowercase letters and apostrophes in the probe are fixed,
  // uppercase letters are still-unknown ciphertext letters. The views stay
  // valid for the lifetime of the index.
  std::vector<std::string_view> Candidates(std::string_view probe) const;

  static bool IsCompatible(std::string_view probe, std::string_view word);

  size_t size() const { return word_count_; }
  size_t bucket_count() const { return buckets_.size(); }
  bool empty() const { return word_count_ == 0; }

 private:
  // Words of one pattern share a length and live back to back in |block|.
  struct Bucket {
    size_t length = 0;
    size_t count = 0;
    std::string block;

    std::string_view WordAt(size_t i) const {
      return std::string_view(block.data() + i * length, length);
    }
  };

  void FilterBucket(const Bucket& bucket, std::string_view probe,
                    std::vector<std::string_view>* out) const;

  std::unordered_map<std::string, Bucket> buckets_;
  size_t word_count_ = 0;
};

// Partial injective mapping from ciphertext characters to plaintext
// characters. Fixed size, so copying one per search frame is cheap.
class Translation {
 public:
  static constexpr int kSlots = 256;

  bool Contains(char cipher) const { return mapped_[Slot(cipher)]; }
  char Get(char cipher) const { return forward_[Slot(cipher)]; }
  bool IsTarget(char plain) const { return targets_[Slot(plain)]; }
  // Maps `cipher` to `plain`. Returns false, leaving the map unchanged, when
  // `plain` is already the target of another ciphertext character.
  bool Set(char cipher, char plain);

  size_t size() const { return mapped_.count(); }
  bool empty() const { return mapped_.none(); }

  std::map<char, char> ToMap() const;

 private:
  static size_t Slot(char c) { return static_cast<unsigned char>(c); }

  std::array<char, kSlots> forward_{};
  std::bitset<kSlots> mapped_;
  std::bitset<kSlots> targets_;
};

class SubstitutionSolver {
 public:
  struct Options {
    // Tolerance levels tried in order. Empty means DefaultToleranceSchedule.
    std::vector<int> tolerance_schedule;
    // Per tolerance level; zero disables the limit.
    size_t max_nodes = 0;
    std::chrono::milliseconds time_budget{0};
    // When set, every visited node prints the ciphertext rendered under that
    // node's translation.
    std::ostream* trace = nullptr;
  };

  struct Solution {
    std::map<char, char> translation;
    std::string ciphertext;
    std::string decoded_text;
    int tolerance = 0;
    size_t words_skipped = 0;
    size_t nodes = 0;
    size_t levels_aborted = 0;
  };

  enum class SearchStatus { kSolved, kExhausted, kBudgetExceeded };

  struct SearchStats {
    size_t nodes = 0;
    size_t words_skipped = 0;
  };

  explicit SubstitutionSolver(const PatternIndex& index);

  bool Solve(const std::string& ciphertext, Solution* out) const;
  bool Solve(const std::string& ciphertext, const Options& options,
             Solution* out) const;

  // Depth-first search over |words| (already ordered) for one tolerance
  // level. Runs on an explicit frame stack.
  SearchStatus SearchAtTolerance(const std::vector<std::string>& words,
                                 int tolerance, const Options& options,
                                 Translation* translation_out,
                                 SearchStats* stats) const;

  static std::string Normalize(std::string_view ciphertext);
  static std::vector<std::string> ExtractWords(std::string_view normalized);
  static void OrderWords(std::vector<std::string>* words);
  static std::vector<int> DefaultToleranceSchedule(size_t word_count);

  static bool ExtendTranslation(const Translation& current,
                                std::string_view cipher_word,
                                std::string_view candidate,
                                Translation* out);
  static std::string Render(std::string_view word,
                            const Translation& translation);
  static std::string Decode(std::string_view text,
                            const Translation& translation);

 private:
  struct Frame {
    size_t word_index = 0;
    size_t skipped = 0;
    Translation translation;
    std::vector<std::string_view> candidates;
    size_t next_candidate = 0;
    bool expanded = false;
    bool skip_tried = false;
  };

  SearchStatus Search(const std::vector<std::string>& words, int tolerance,
                      const Options& options, std::string_view trace_text,
                      Translation* translation_out, SearchStats* stats) const;

  const PatternIndex& index_;
};

// Collects (rank, word) rows from ranked word-frequency listing pages and
// turns them into a corpus ordered by rank.
class CorpusExtractor {
 public:
  struct RankedWord {
    int64_t rank = 0;
    std::string word;
  };

  // Returns the number of rows found in |page|.
  size_t AddPage(const std::string& page);
  bool AddPageFile(const std::string& path);

  // Words ordered by ascending rank; equal ranks keep discovery order.
  std::vector<std::string> Words() const;
  bool WriteCorpus(const std::string& path) const;

  const std::vector<RankedWord>& entries() const { return entries_; }

 private:
  std::vector<RankedWord> entries_;
};

}  // namespace cryptex
