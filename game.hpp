/* Referee for one game against a known answer. Hands out the feedback an Agent expects,
   checks every guess against the rules, and keeps the rows of the board.

   A guess that breaks the rules (not in the dictionary, or in hard mode not reusing what
   was revealed) doesn't use up a turn: the previous feedback is sent again with the same
   turn number.
*/

#pragma once
#include <string>
#include <vector>
#include "word.hpp"
#include "result.hpp"
#include "dictionary.hpp"
#include "agent.hpp"

class GameRecord {
public:
    GameRecord() : won(false), gave_up(false), rejected(0) {}
    bool won;
    bool gave_up;          // agent ran out of candidates
    int rejected;
    std::vector<std::string> guesses;  // accepted guesses only

    int num_guesses() const { return guesses.size(); }
};

class Game {
public:
    // throws if [answer] isn't in [dictionary]
    Game(const Dictionary& dictionary, const Word& answer, int num_guesses, Mode mode);

    // what the player is shown before their next guess
    const Result& get_percepts() const { return percepts; }
    const std::vector<Result>& get_rows() const { return rows; }

    // empty if [guess] would be accepted, otherwise what's wrong with it
    std::string check_guess(const Word& guess) const;

    // returns true if the guess was accepted (and used up a turn)
    bool submit(const Word& guess);

    bool is_won() const;
    bool is_over() const;

    // plays until the game is over or the agent gives up
    GameRecord play(Agent& agent, bool debug_output);

    static void test();
private:
    const Dictionary& dictionary;
    Word answer;
    int num_guesses;
    Mode mode;
    Result percepts;
    std::vector<Result> rows;
};
