/********

Narrows the candidate list using the feedback for one guess. A candidate is dropped as soon as one
position of the feedback rules it out, checking positions left to right:

  correct at i   the candidate must have the guessed letter at i.
  present at i   the candidate must contain the guessed letter, but not at i.
  absent at i    if the guessed letter occurs once in the guess, the candidate must not contain it
                 at all. If it occurs more than once we only know it's not at i (the other copies
                 may have come back green or yellow).

The absent rule is deliberately weaker than what the game guarantees: when unsure we keep the word
and let a later turn rule it out.

*******/

#pragma once
#include <string>
#include <vector>
#include "word.hpp"
#include "result.hpp"
#include "alphabet.hpp"

namespace Reducer {
    // position of the first feedback state that rules [candidate] out, or -1
    int first_conflict(const Word& candidate, const Word& guess, const std::vector<State>& states);

    bool keep(const Word& candidate, const Word& guess, const std::vector<State>& states);

    // slow, but explains to a human why [candidate] is ruled out. Empty if it isn't.
    std::string reason(const Word& candidate, const Word& guess, const std::vector<State>& states);

    // Builds the new candidate list, keeping order. Never grows the list.
    std::vector<Word> reduce(const std::vector<Word>& candidates, const Result& feedback, const Alphabet& alphabet);

    void test();
}
