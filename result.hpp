/* What the game tells us after a guess: which turn this is, the letters of the previous
   guess (as indexes into the Alphabet) and, per position, whether that letter was absent,
   present somewhere else, or correct.

   On the first turn nothing has been guessed yet, the letter indexes are all -1.

   The usual input representation is a guess followed by one feedback char per letter:
   CRANE _~._.
   means R is yellow, A and E are green.
*/

#pragma once
#include <string>
#include <vector>
#include <iostream>
#include "word.hpp"
#include "alphabet.hpp"

// values match what the game sends
enum class State : int
    { present = -1,
      absent = 0,
      correct = 1 };

class Result {
public:
    Result(int guess_counter, const std::vector<int>& letter_indexes, const std::vector<State>& states);

    // format is CRANE _~._.
    Result(const std::string& r, const Alphabet& alphabet, int guess_counter);

    // the feedback the game gives for [guess] when the solution is [answer]
    Result(const Word& answer, const Word& guess, const Alphabet& alphabet, int guess_counter);

    // what the game sends on turn 0
    static Result initial(int word_length);

    int get_guess_counter() const { return guess_counter; }
    const std::vector<int>& get_letter_indexes() const { return letter_indexes; }
    const std::vector<State>& get_states() const { return states; }
    State get_state(int i) const { return states[i]; }
    int length() const { return states.size(); }

    // decodes the guess this is feedback for, throws on turn 0
    Word get_guess(const Alphabet& alphabet) const;

    int num_yellow() const;
    int num_green() const;
    int num_black() const;
    bool is_win() const { return num_green() == length(); }

    // first position not marked correct, or -1
    int first_unresolved() const;

    void output(std::ostream& os, const Alphabet& alphabet, bool ansi_escapes) const;
    std::string to_string(const Alphabet& alphabet) const;

    static const char black_char;
    static const char yellow_char;
    static const char green_char;

    static void test();
private:
    int guess_counter;
    std::vector<int> letter_indexes;
    std::vector<State> states;
};
