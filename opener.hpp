/* The best first guess only depends on the dictionary, and scoring a whole dictionary against
   itself is by far the slowest thing we do. So it's computed once per process and shared by
   every game (and every Agent) afterwards.

   Keyed by Dictionary::fingerprint so a process that holds several dictionaries still gets the
   right opener for each. Not thread safe, we only ever play one game at a time.
*/

#pragma once
#include <map>
#include <string>
#include "dictionary.hpp"
#include "solveresult.hpp"

/* All static members here. */
class Opener {
public:
    // computes on first use, best_index points into [dictionary]
    static const Solver::SolveResult& get(const Dictionary& dictionary, bool debug_output);

    // true if the opener for [dictionary] is already known
    static bool is_cached(const Dictionary& dictionary);

    // how many times this process actually scored a full dictionary
    static int num_computed();

    static void test();
private:
    static std::map<std::string, Solver::SolveResult> cache;
    static int computed;
};
