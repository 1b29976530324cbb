#include "Solver.hpp"

#include <algorithm>
#include <utility>

namespace cryptex {
namespace {
bool IsWordChar(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '\'';
}

std::string JoinWords(const std::vector<std::string>& words) {
  std::string out;
  for (const auto& word : words) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += word;
  }
  return out;
}
}  // namespace

bool Translation::Set(char cipher, char plain) {
  const size_t slot = Slot(cipher);
  if (mapped_[slot] && forward_[slot] == plain) {
    return true;
  }
  if (targets_[Slot(plain)]) {
    return false;
  }
  if (mapped_[slot]) {
    targets_.reset(Slot(forward_[slot]));
  }
  forward_[slot] = plain;
  mapped_.set(slot);
  targets_.set(Slot(plain));
  return true;
}

std::map<char, char> Translation::ToMap() const {
  std::map<char, char> out;
  for (int i = 0; i < kSlots; ++i) {
    if (mapped_[i]) {
      out[static_cast<char>(i)] = forward_[i];
    }
  }
  return out;
}

SubstitutionSolver::SubstitutionSolver(const PatternIndex& index)
    : index_(index) {}

std::string SubstitutionSolver::Normalize(std::string_view ciphertext) {
  std::string out;
  out.reserve(ciphertext.size());
  for (char c : ciphertext) {
    if (c >= 'a' && c <= 'z') {
      out.push_back(static_cast<char>(c - 'a' + 'A'));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::vector<std::string> SubstitutionSolver::ExtractWords(
    std::string_view normalized) {
  std::vector<std::string> words;
  std::string current;
  bool has_alnum = false;
  for (char c : normalized) {
    if (IsWordChar(c)) {
      current.push_back(c);
      has_alnum = has_alnum || c != '\'';
    } else if (!current.empty()) {
      if (has_alnum) {
        words.push_back(std::move(current));
      }
      current.clear();
      has_alnum = false;
    }
  }
  if (has_alnum) {
    words.push_back(std::move(current));
  }
  return words;
}

void SubstitutionSolver::OrderWords(std::vector<std::string>* words) {
  if (!words) {
    return;
  }
  std::stable_sort(words->begin(), words->end(),
                   [](const std::string& a, const std::string& b) {
                     return a.size() > b.size();
                   });
}

std::vector<int> SubstitutionSolver::DefaultToleranceSchedule(
    size_t word_count) {
  const int levels = std::max(3, static_cast<int>(word_count / 10));
  std::vector<int> schedule(levels);
  for (int i = 0; i < levels; ++i) {
    schedule[i] = i;
  }
  return schedule;
}

bool SubstitutionSolver::ExtendTranslation(const Translation& current,
                                           std::string_view cipher_word,
                                           std::string_view candidate,
                                           Translation* out) {
  if (cipher_word.size() != candidate.size()) {
    return false;
  }
  Translation next = current;
  for (size_t i = 0; i < cipher_word.size(); ++i) {
    char cipher = cipher_word[i];
    char plain = candidate[i];
    if (cipher == '\'') {
      continue;
    }
    if (next.Contains(cipher)) {
      if (next.Get(cipher) != plain) {
        return false;
      }
      continue;
    }
    // A new ciphertext letter may not take a plaintext letter that is
    // already spoken for.
    if (!next.Set(cipher, plain)) {
      return false;
    }
  }
  if (out) {
    *out = next;
  }
  return true;
}

std::string SubstitutionSolver::Render(std::string_view word,
                                       const Translation& translation) {
  std::string out;
  out.reserve(word.size());
  for (char c : word) {
    if (c != '\'' && translation.Contains(c)) {
      out.push_back(translation.Get(c));
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string SubstitutionSolver::Decode(std::string_view text,
                                       const Translation& translation) {
  return Render(text, translation);
}

SubstitutionSolver::SearchStatus SubstitutionSolver::SearchAtTolerance(
    const std::vector<std::string>& words, int tolerance,
    const Options& options, Translation* translation_out,
    SearchStats* stats) const {
  std::string trace_text;
  if (options.trace) {
    trace_text = JoinWords(words);
  }
  return Search(words, tolerance, options, trace_text, translation_out,
                stats);
}

SubstitutionSolver::SearchStatus SubstitutionSolver::Search(
    const std::vector<std::string>& words, int tolerance,
    const Options& options, std::string_view trace_text,
    Translation* translation_out, SearchStats* stats) const {
  using Clock = std::chrono::steady_clock;
  const auto start = Clock::now();
  const bool timed = options.time_budget.count() > 0;

  size_t nodes = 0;
  auto finish = [&](SearchStatus status, const Frame* solved) {
    if (stats) {
      stats->nodes = nodes;
      stats->words_skipped = solved ? solved->skipped : 0;
    }
    if (solved && translation_out) {
      *translation_out = solved->translation;
    }
    return status;
  };

  // Depth never exceeds words.size() + 1, so references into the stack stay
  // valid until the next push.
  std::vector<Frame> stack;
  stack.reserve(words.size() + 1);
  stack.emplace_back();

  while (!stack.empty()) {
    Frame& frame = stack.back();

    if (!frame.expanded) {
      frame.expanded = true;
      ++nodes;
      if (options.max_nodes > 0 && nodes > options.max_nodes) {
        return finish(SearchStatus::kBudgetExceeded, nullptr);
      }
      if (timed && Clock::now() - start > options.time_budget) {
        return finish(SearchStatus::kBudgetExceeded, nullptr);
      }
      if (options.trace) {
        *options.trace << Decode(trace_text, frame.translation) << "\n";
      }

      if (frame.word_index == words.size()) {
        // A branch that skipped every word decoded nothing.
        if (!frame.translation.empty() || words.empty()) {
          return finish(SearchStatus::kSolved, &frame);
        }
        stack.pop_back();
        continue;
      }
      if (static_cast<long long>(frame.skipped) > tolerance) {
        stack.pop_back();
        continue;
      }
      frame.candidates = index_.Candidates(
          Render(words[frame.word_index], frame.translation));
    }

    const std::string& word = words[frame.word_index];

    if (frame.next_candidate < frame.candidates.size()) {
      std::string_view candidate = frame.candidates[frame.next_candidate++];
      Frame child;
      if (!ExtendTranslation(frame.translation, word, candidate,
                             &child.translation)) {
        continue;
      }
      child.word_index = frame.word_index + 1;
      child.skipped = frame.skipped;
      stack.push_back(std::move(child));
      continue;
    }

    // Out of candidates: the word may be a proper noun or a typo.
    if (!frame.skip_tried) {
      frame.skip_tried = true;
      Frame child;
      child.word_index = frame.word_index + 1;
      child.skipped = frame.skipped + 1;
      child.translation = frame.translation;
      stack.push_back(std::move(child));
      continue;
    }

    stack.pop_back();
  }

  return finish(SearchStatus::kExhausted, nullptr);
}

bool SubstitutionSolver::Solve(const std::string& ciphertext,
                               Solution* out) const {
  return Solve(ciphertext, Options(), out);
}

bool SubstitutionSolver::Solve(const std::string& ciphertext,
                               const Options& options,
                               Solution* out) const {
  Solution solution;
  solution.ciphertext = Normalize(ciphertext);

  std::vector<std::string> words = ExtractWords(solution.ciphertext);
  if (words.empty()) {
    if (out) {
      *out = std::move(solution);
    }
    return true;
  }
  OrderWords(&words);

  const std::vector<int> schedule =
      options.tolerance_schedule.empty()
          ? DefaultToleranceSchedule(words.size())
          : options.tolerance_schedule;

  for (int tolerance : schedule) {
    Translation translation;
    SearchStats stats;
    SearchStatus status = Search(words, tolerance, options,
                                 solution.ciphertext, &translation, &stats);
    solution.nodes += stats.nodes;
    if (status == SearchStatus::kBudgetExceeded) {
      ++solution.levels_aborted;
      continue;
    }
    if (status == SearchStatus::kSolved) {
      solution.translation = translation.ToMap();
      solution.decoded_text = Decode(solution.ciphertext, translation);
      solution.tolerance = tolerance;
      solution.words_skipped = stats.words_skipped;
      if (out) {
        *out = std::move(solution);
      }
      return true;
    }
  }

  if (out) {
    *out = std::move(solution);
  }
  return false;
}

}  // namespace cryptex
