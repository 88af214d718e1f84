#include <sstream>
#include <stdexcept>
#include "opener.hpp"
#include "solver.hpp"

using std::cerr;
using std::endl;
using Solver::SolveResult;

std::map<std::string, SolveResult> Opener::cache;
int Opener::computed = 0;

const SolveResult& Opener::get(const Dictionary& dictionary, bool debug_output) {
    auto it = cache.find(dictionary.fingerprint());
    if (it != cache.end()) return it->second;

    if (debug_output) cerr << "Computing opener over " << dictionary.size() << " words..." << endl;
    SolveResult r = Solver::solve(dictionary.words(), true);
    if (!r.found()) {
        throw std::runtime_error("No opener for an empty dictionary");
    }
    computed++;
    if (debug_output) {
        cerr << "Opener is " << r.best_guess << " with score " << r.best_score
             << ", took " << r.perf_microseconds / 1e6 << "s" << endl;
    }
    return cache.insert({dictionary.fingerprint(), r}).first->second;
}

bool Opener::is_cached(const Dictionary& dictionary) {
    return cache.count(dictionary.fingerprint()) > 0;
}

int Opener::num_computed() {
    return computed;
}

void Opener::test() {
    Alphabet en(Alphabet::english);
    Dictionary d1({"CRANE", "ERASE", "SLATE", "TRAIN"}, en, 5);
    Dictionary d2({"TRAIN", "ERASE", "SLATE", "CRANE"}, en, 5);

    int before = num_computed();
    bool was_cached = is_cached(d1);
    const SolveResult& a = get(d1, false);
    const SolveResult& b = get(d1, false);
    Dictionary d1_again({"CRANE", "ERASE", "SLATE", "TRAIN"}, en, 5);
    const SolveResult& c = get(d1_again, false);
    int after_d1 = num_computed();
    bool d2_was_cached = is_cached(d2);
    const SolveResult& d = get(d2, false);
    int after_d2 = num_computed();

    std::stringstream output;
    std::stringstream expected;
    output << (after_d1 - before) << " "
           << (&a == &b) << (&a == &c) << " "
           << a.best_index << " " << a.best_guess << " " << a.best_score << " "
           << (after_d2 - after_d1) << " " << d.best_index << " " << d.best_guess << " "
           << is_cached(d1) << is_cached(d2) << endl;
    expected << (was_cached ? 0 : 1) << " 11 0 CRANE 0.75 " << (d2_was_cached ? 0 : 1) << " 0 TRAIN 11" << endl;

    // same letters run together, different word lengths
    Dictionary long_words({"ABCD"}, en, 4);
    Dictionary short_words({"AB", "CD"}, en, 2);
    const SolveResult& opener4 = get(long_words, false);
    const SolveResult& opener2 = get(short_words, false);
    output << (long_words.fingerprint() == short_words.fingerprint()) << " "
           << opener4.best_guess << " " << opener2.best_guess << " "
           << short_words.contains(Word(opener2.best_guess)) << endl;
    expected << "0 ABCD AB 1" << endl;

    std::string output_str = output.str();
    std::string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Opener::test() failed, got " + output_str + ", but expected " + expected_str);
    }
}
