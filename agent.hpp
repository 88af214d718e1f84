/* Plays one game at a time: gets the feedback for its previous guess and answers with the
   next guess.

   Turn 0 always answers with the opener. After that the candidate list is narrowed by the
   feedback and the best scoring candidate is guessed. Two twists:

   - The game may reject a guess without counting it (e.g. hard mode rules). It then sends the
     same turn number again, which we notice because our own counter ran ahead. The guess we
     made was the top candidate, so we drop it and pick again.
   - In easy mode, with one position left unknown and several candidates that fill it, we
     spend a guess on a (possibly wrong) dictionary word that tests as many of the possible
     letters for that position as it can. See Solver::smart_guess.
*/

#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include <iostream>
#include "word.hpp"
#include "result.hpp"
#include "dictionary.hpp"

enum class Mode
    { easy = 0,
      hard = 1 };

Mode mode_of_string(const std::string& str);
std::ostream& operator<<(std::ostream& os, Mode m);

// Nothing in the dictionary fits the feedback seen so far this game.
class NoCandidatesError : public std::runtime_error {
public:
    NoCandidatesError(const std::string& what) : std::runtime_error(what) {}
};

class Agent {
public:
    // [dictionary] must outlive the agent. throws if num_guesses isn't positive.
    Agent(const Dictionary& dictionary, int num_guesses, Mode mode, bool debug_output);

    // Returns the guess for this turn. A guess counter of 0 starts a new game.
    // Throws NoCandidatesError if the feedback leaves nothing to guess.
    std::string next_guess(const Result& percepts);

    const std::vector<Word>& get_candidates() const { return candidates; }
    int get_guess_counter() const { return last_guess_counter; }
    Mode get_mode() const { return mode; }

    static void test();
private:
    std::string start_game();
    void drop_rejected_guess(int guess_counter);
    bool should_smart_guess(const Result& percepts) const;
    void log_discards(const Result& percepts) const;

    const Dictionary& dictionary;
    int num_guesses;
    Mode mode;
    bool debug_output;

    std::vector<Word> candidates;
    // turns we think the game accepted so far
    int last_guess_counter;
};
