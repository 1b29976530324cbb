#include "Solver.hpp"

#include <chrono>
#include <iostream>
#include <set>
#include <sstream>

namespace {
int g_failures = 0;

void ExpectTrue(bool condition, const char* message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    ++g_failures;
  }
}

void ExpectFalse(bool condition, const char* message) {
  ExpectTrue(!condition, message);
}

const char kKey[] = "QWERTYUIOPASDFGHJKLZXCVBNM";

std::string Encrypt(const std::string& plain) {
  std::string out = plain;
  for (char& c : out) {
    if (c >= 'a' && c <= 'z') {
      c = kKey[c - 'a'];
    }
  }
  return out;
}

bool IsInjective(const std::map<char, char>& translation) {
  std::set<char> targets;
  for (const auto& entry : translation) {
    if (!targets.insert(entry.second).second) {
      return false;
    }
  }
  return true;
}

const std::vector<std::string>& PangramCorpus() {
  static const std::vector<std::string> words = {
      "the",  "quick", "brown", "fox", "jumps", "over",
      "lazy", "dog",   "again", "cat", "bat",   "wow"};
  return words;
}
}  // namespace

int main() {
  using cryptex::SubstitutionSolver;

  {
    ExpectTrue(SubstitutionSolver::Normalize("Hi there!") == "HI THERE!",
               "normalize uppercases ASCII letters only");
    auto words = SubstitutionSolver::ExtractWords("HELLO, WORLD! IT'S 4AM");
    ExpectTrue(words.size() == 4, "four tokens");
    ExpectTrue(words[0] == "HELLO" && words[1] == "WORLD" &&
                   words[2] == "IT'S" && words[3] == "4AM",
               "apostrophes and digits stay inside tokens");
    ExpectTrue(SubstitutionSolver::ExtractWords("well-known").size() == 2,
               "hyphen separates");
    ExpectTrue(SubstitutionSolver::ExtractWords("!!! ...").empty(),
               "punctuation only has no words");
    ExpectTrue(SubstitutionSolver::ExtractWords("' '' X'").size() == 1,
               "apostrophe-only tokens are not words");
  }

  {
    std::vector<std::string> words = {"AB", "CDE", "FG", "HIJ", "K"};
    SubstitutionSolver::OrderWords(&words);
    ExpectTrue(words[0] == "CDE" && words[1] == "HIJ" && words[2] == "AB" &&
                   words[3] == "FG" && words[4] == "K",
               "longest first, ties keep text order");
  }

  {
    auto small = SubstitutionSolver::DefaultToleranceSchedule(9);
    ExpectTrue(small.size() == 3 && small[0] == 0 && small[2] == 2,
               "at least three tolerance levels");
    auto large = SubstitutionSolver::DefaultToleranceSchedule(57);
    ExpectTrue(large.size() == 5 && large[4] == 4,
               "one level per ten words");
  }

  {
    cryptex::Translation translation;
    translation.Set('A', 'c');
    ExpectTrue(SubstitutionSolver::Render("AB'C", translation) == "cB'C",
               "render substitutes decoded letters only");

    cryptex::Translation extended;
    ExpectTrue(SubstitutionSolver::ExtendTranslation(translation, "AB", "ca",
                                                     &extended),
               "new letter to a free target");
    ExpectTrue(extended.Get('B') == 'a' && extended.size() == 2,
               "extension adds the new pair");
    ExpectTrue(translation.size() == 1, "extension leaves the input alone");

    ExpectFalse(SubstitutionSolver::ExtendTranslation(translation, "B", "c",
                                                      &extended),
                "two ciphertext letters cannot share a target");
    ExpectFalse(SubstitutionSolver::ExtendTranslation(translation, "A", "d",
                                                      &extended),
                "known letter cannot change its target");

    cryptex::Translation remapped;
    ExpectTrue(remapped.Set('A', 'c'), "first target is free");
    ExpectFalse(remapped.Set('B', 'c'), "target in use is refused");
    ExpectFalse(remapped.Contains('B'), "refused letter stays unmapped");
    ExpectTrue(remapped.Set('A', 'd'), "letter moves to a free target");
    ExpectFalse(remapped.IsTarget('c'), "old target is released");
    ExpectTrue(remapped.IsTarget('d') && remapped.size() == 1,
               "one pair after the move");
    ExpectTrue(remapped.Set('B', 'c'), "released target can be reused");

    cryptex::Translation with_apostrophe;
    ExpectTrue(SubstitutionSolver::ExtendTranslation(
                   cryptex::Translation(), "A'B", "o'k", &with_apostrophe),
               "apostrophes extend");
    ExpectTrue(with_apostrophe.size() == 2 &&
                   !with_apostrophe.Contains('\''),
               "apostrophes are not part of the translation");
  }

  {
    cryptex::PatternIndex index = cryptex::PatternIndex::Build(PangramCorpus());
    SubstitutionSolver solver(index);
    const std::string plain = "the quick brown fox jumps over the lazy dog";
    SubstitutionSolver::Solution solution;
    ExpectTrue(solver.Solve(Encrypt(plain), &solution), "pangram solves");
    ExpectTrue(solution.decoded_text == plain, "round trip recovers text");
    ExpectTrue(solution.translation.size() == 26, "all letters translated");
    ExpectTrue(IsInjective(solution.translation), "translation is injective");
    bool key_matches = true;
    for (int i = 0; i < 26; ++i) {
      auto it = solution.translation.find(kKey[i]);
      if (it == solution.translation.end() || it->second != 'a' + i) {
        key_matches = false;
      }
    }
    ExpectTrue(key_matches, "translation inverts the key");
    ExpectTrue(solution.tolerance == 0 && solution.words_skipped == 0,
               "no words skipped");
  }

  {
    cryptex::PatternIndex index = cryptex::PatternIndex::Build(PangramCorpus());
    SubstitutionSolver solver(index);
    SubstitutionSolver::Solution solution;
    ExpectTrue(solver.Solve(Encrypt("the lazy dog, again!"), &solution),
               "punctuated text solves");
    ExpectTrue(solution.decoded_text == "the lazy dog, again!",
               "separators survive decoding");
    ExpectTrue(solution.translation.count('J') == 0,
               "letters absent from the ciphertext stay untranslated");
  }

  {
    cryptex::PatternIndex index = cryptex::PatternIndex::Build(PangramCorpus());
    SubstitutionSolver solver(index);
    SubstitutionSolver::Solution solution;
    ExpectTrue(solver.Solve("!!! ...", &solution), "no words is solved");
    ExpectTrue(solution.translation.empty(), "empty translation");
    ExpectTrue(solution.decoded_text.empty(), "empty decoded output");
    ExpectTrue(solver.Solve("", &solution), "empty text is solved");
    ExpectTrue(solver.Solve("'", &solution), "lone apostrophe is solved");
    ExpectTrue(solver.Solve("'' ' !!", &solution) &&
                   solution.translation.empty(),
               "apostrophe-only text has no words");
  }

  {
    const std::string plain =
        "zanzibar the quick brown fox jumps over the lazy dog again";
    const std::string cipher = Encrypt(plain);
    cryptex::PatternIndex index = cryptex::PatternIndex::Build(PangramCorpus());
    SubstitutionSolver solver(index);

    std::vector<std::string> words = SubstitutionSolver::ExtractWords(
        SubstitutionSolver::Normalize(cipher));
    SubstitutionSolver::OrderWords(&words);
    ExpectTrue(words.size() == 11, "ten words plus a proper noun");

    SubstitutionSolver::Options options;
    cryptex::Translation translation;
    SubstitutionSolver::SearchStats stats;
    ExpectTrue(solver.SearchAtTolerance(words, 0, options, &translation,
                                        &stats) ==
                   SubstitutionSolver::SearchStatus::kExhausted,
               "unknown word fails at tolerance 0");
    ExpectTrue(solver.SearchAtTolerance(words, 1, options, &translation,
                                        &stats) ==
                   SubstitutionSolver::SearchStatus::kSolved,
               "unknown word is skipped at tolerance 1");
    ExpectTrue(stats.words_skipped == 1, "exactly one word skipped");

    SubstitutionSolver::Solution solution;
    ExpectTrue(solver.Solve(cipher, &solution), "escalation solves");
    ExpectTrue(solution.tolerance == 1, "solved at the second level");
    ExpectTrue(solution.decoded_text == plain,
               "skipped word decodes from the other words");
    ExpectTrue(IsInjective(solution.translation),
               "escalated translation is injective");
  }

  {
    cryptex::PatternIndex first = cryptex::PatternIndex::Build({"cat", "dog"});
    cryptex::PatternIndex second =
        cryptex::PatternIndex::Build({"dog", "cat"});
    SubstitutionSolver::Solution a;
    SubstitutionSolver::Solution b;
    ExpectTrue(SubstitutionSolver(first).Solve("XYZ", &a), "first solves");
    ExpectTrue(SubstitutionSolver(second).Solve("XYZ", &b), "second solves");
    ExpectTrue(a.decoded_text == "cat", "first corpus word wins");
    ExpectTrue(b.decoded_text == "dog", "reordered corpus changes result");
  }

  {
    cryptex::PatternIndex index = cryptex::PatternIndex::Build({"the", "cat"});
    SubstitutionSolver solver(index);
    SubstitutionSolver::Solution solution;
    ExpectFalse(solver.Solve("XQZV", &solution),
                "unmatchable word is unsolved");
    ExpectTrue(solution.translation.empty(), "unsolved has no translation");
    ExpectFalse(solver.Solve("XQZV PLMKO WWW", &solution),
                "nothing matches at any tolerance");
  }

  {
    cryptex::PatternIndex index = cryptex::PatternIndex::Build(PangramCorpus());
    SubstitutionSolver solver(index);
    SubstitutionSolver::Options options;
    options.max_nodes = 1;
    SubstitutionSolver::Solution solution;
    ExpectFalse(solver.Solve(Encrypt("the quick brown fox"), options,
                             &solution),
                "tiny node budget gives up");
    ExpectTrue(solution.levels_aborted == 3, "every level aborted");

    options.max_nodes = 0;
    options.tolerance_schedule = {0};
    ExpectTrue(solver.Solve(Encrypt("the quick brown fox"), options,
                            &solution),
               "custom schedule solves");
    ExpectTrue(solution.levels_aborted == 0, "no level aborted");
  }

  {
    std::string plain;
    for (int i = 0; i < 3000; ++i) {
      plain += "the quick brown fox jumps over the lazy dog ";
    }
    const std::string cipher = Encrypt(plain);
    cryptex::PatternIndex index = cryptex::PatternIndex::Build(PangramCorpus());
    SubstitutionSolver solver(index);
    SubstitutionSolver::Options options;
    options.tolerance_schedule = {0, 1};
    options.time_budget = std::chrono::milliseconds(1);
    SubstitutionSolver::Solution solution;
    ExpectFalse(solver.Solve(cipher, options, &solution),
                "one millisecond is too short for long text");
    ExpectTrue(solution.levels_aborted == options.tolerance_schedule.size(),
               "every timed level aborted");

    options.time_budget = std::chrono::milliseconds(0);
    ExpectTrue(solver.Solve(cipher, options, &solution),
               "zero time budget is unlimited");
    ExpectTrue(solution.levels_aborted == 0, "untimed level not aborted");
    ExpectTrue(solution.decoded_text == plain, "untimed solve round trips");
  }

  {
    cryptex::PatternIndex index = cryptex::PatternIndex::Build({"cat"});
    SubstitutionSolver solver(index);
    std::ostringstream trace;
    SubstitutionSolver::Options options;
    options.trace = &trace;
    SubstitutionSolver::Solution solution;
    ExpectTrue(solver.Solve("xyz.", options, &solution), "traced solve");
    ExpectTrue(trace.str() == "XYZ.\ncat.\n", "trace shows every node");
  }

  {
    std::string plain;
    for (int i = 0; i < 600; ++i) {
      plain += "the quick brown fox jumps over the lazy dog ";
    }
    cryptex::PatternIndex index = cryptex::PatternIndex::Build(PangramCorpus());
    SubstitutionSolver solver(index);
    SubstitutionSolver::Options options;
    options.tolerance_schedule = {0};
    SubstitutionSolver::Solution solution;
    ExpectTrue(solver.Solve(Encrypt(plain), options, &solution),
               "thousands of words solve without deep recursion");
    ExpectTrue(solution.decoded_text == plain, "long text round trips");
  }

  if (g_failures > 0) {
    std::cerr << g_failures << " test(s) failed.\n";
    return 1;
  }
  std::cout << "All tests passed.\n";
  return 0;
}
