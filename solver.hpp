#pragma once
#include <array>
#include <vector>
#include "word.hpp"
#include "result.hpp"
#include "dictionary.hpp"
#include "solveresult.hpp"

namespace Solver {
    // Per position letter frequencies over a candidate list. Built from the candidates as they
    // are right now, so build a fresh one after every reduction.
    class LetterStats {
    public:
        LetterStats(const std::vector<Word>& candidates);

        // fraction of candidates with [letter] at [pos]
        double probability(char letter, int pos) const;
        // p(1-p), highest for letters that split the candidates in half
        double entropy(char letter, int pos) const;

        size_t size() const { return num_candidates; }
    private:
        std::vector<std::array<int, 256>> counts;
        size_t num_candidates;
    };

    // Sum of entropy over the positions of [w]. Words with a repeated letter get 10% off.
    double score(const Word& w, const LetterStats& stats);

    // scores [words] against [stats]
    std::vector<double> calculate_scores(const std::vector<Word>& words, const LetterStats& stats);
    // scores every candidate against the candidate list itself
    std::vector<double> calculate_scores(const std::vector<Word>& candidates);

    // index of the first max score, -1 if [scores] is empty
    int best_index(const std::vector<double>& scores);

    // the first best candidate, ranked against the candidates
    SolveResult solve(const std::vector<Word>& candidates, bool track_time);

    // number of positions marked correct
    int green_counter(const Result& feedback);

    // Used when all but one position is known and several words still fit, e.g. _RAIN with
    // BRAIN, DRAIN, TRAIN left. Collects the letters the candidates have in the unknown
    // position and picks the dictionary word that tests the most of them at once (DOUBT).
    // Words with a repeated letter keep only 10% of their score. best_index points into
    // [dictionary].
    SolveResult smart_guess(const std::vector<Word>& candidates, const Dictionary& dictionary, const Result& feedback);

    void test();
}
