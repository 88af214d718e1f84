#pragma once
#include <string>
#include <iostream>

namespace Solver {
    /* The outcome of ranking a list of words: the first highest scoring one. */

    class SolveResult {
    public:
        SolveResult();
        int best_index;        // index into the list that was ranked, -1 if nothing was ranked
        std::string best_guess;
        double best_score;

        // performance stats
        float perf_calls;      // number of words scored
        float perf_microseconds;

        bool found() const { return best_index >= 0; }
        std::string to_string() const;

        static void test();
    };

    std::ostream& operator<<(std::ostream& os, const SolveResult& s);
}
