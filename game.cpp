#include <sstream>
#include <stdexcept>
#include "game.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::endl;

Game::Game(const Dictionary& dictionary_, const Word& answer_, int num_guesses_, Mode mode_) :
    dictionary(dictionary_),
    answer(answer_),
    num_guesses(num_guesses_),
    mode(mode_),
    percepts(Result::initial(dictionary_.get_word_length()))
{
    if (!dictionary.contains(answer)) {
        throw std::runtime_error("Answer not in dictionary: " + answer.str());
    }
    if (num_guesses <= 0) {
        throw std::runtime_error("Number of guesses must be positive, not " + std::to_string(num_guesses));
    }
}

string Game::check_guess(const Word& guess) const {
    if (!dictionary.contains(guess)) {
        return "Not in the dictionary: " + guess.str() + ".";
    }
    if (mode == Mode::easy) return string();

    const Alphabet& alphabet = dictionary.get_alphabet();
    std::stringstream problems;
    for (const Result& row : rows) {
        Word prev = row.get_guess(alphabet);
        for (int i = 0; i < row.length(); i++) {
            if (row.get_state(i) == State::correct && guess[i] != prev[i]) {
                if (!problems.str().empty()) problems << " ";
                problems << "Spot #" << (i+1) << " must be letter " << prev[i] << ".";
            } else if (row.get_state(i) == State::present && !guess.contains(prev[i])) {
                if (!problems.str().empty()) problems << " ";
                problems << "You need letter " << prev[i] << ".";
            }
        }
    }
    return problems.str();
}

bool Game::submit(const Word& guess) {
    if (is_over()) {
        throw std::runtime_error("Game is already over");
    }
    if (!check_guess(guess).empty()) return false;

    percepts = Result(answer, guess, dictionary.get_alphabet(), static_cast<int>(rows.size()) + 1);
    rows.push_back(percepts);
    return true;
}

bool Game::is_won() const {
    return !rows.empty() && rows.back().is_win();
}

bool Game::is_over() const {
    return is_won() || static_cast<int>(rows.size()) >= num_guesses;
}

GameRecord Game::play(Agent& agent, bool debug_output) {
    GameRecord rec;
    // each rejection shrinks the agent's candidates, so this is only hit if something is very wrong
    const int max_rejections = static_cast<int>(dictionary.size()) + 1;

    while (!is_over()) {
        string g;
        try {
            g = agent.next_guess(percepts);
        } catch (const NoCandidatesError& e) {
            if (debug_output) cerr << "Agent gave up: " << e.what() << endl;
            rec.gave_up = true;
            break;
        }

        Word guess(g);
        string problems = check_guess(guess);
        if (!problems.empty()) {
            if (debug_output) cerr << "Rejected " << guess << ": " << problems << endl;
            if (++rec.rejected > max_rejections) {
                throw std::runtime_error("Too many rejected guesses, last was " + g);
            }
            continue;
        }
        submit(guess);
        rec.guesses.push_back(g);
    }
    rec.won = is_won();
    return rec;
}

namespace {
    string join(const vector<string>& v) {
        string rv;
        for (const string& s : v) {
            if (!rv.empty()) rv += ",";
            rv += s;
        }
        return rv;
    }
}

void Game::test() {
    Alphabet en(Alphabet::english);
    Dictionary dictionary({"GRAIN", "DRAIN", "TRAIN", "BRAIN", "DOUBT", "TABBY", "BATCH"}, en, 5);
    Word answer("BRAIN");

    std::stringstream output;
    std::stringstream expected;

    Agent easy(dictionary, 6, Mode::easy, false);
    Game g1(dictionary, answer, 6, Mode::easy);
    GameRecord r1 = g1.play(easy, false);
    output << r1.won << " " << r1.num_guesses() << " " << r1.rejected << " " << join(r1.guesses) << " "
           << g1.get_rows()[1].to_string(en) << endl;
    expected << "1 3 0 DRAIN,DOUBT,BRAIN DOUBT ___~_" << endl;

    Agent hard(dictionary, 6, Mode::hard, false);
    Game g2(dictionary, answer, 6, Mode::hard);
    GameRecord r2 = g2.play(hard, false);
    output << r2.won << " " << r2.num_guesses() << " " << r2.rejected << " " << join(r2.guesses) << endl;
    expected << "1 4 0 DRAIN,GRAIN,TRAIN,BRAIN" << endl;

    // an easy mode agent in a hard mode game: DOUBT is refused, the agent notices and moves on
    Agent mismatched(dictionary, 6, Mode::easy, false);
    Game g3(dictionary, answer, 6, Mode::hard);
    GameRecord r3 = g3.play(mismatched, false);
    output << r3.won << " " << r3.num_guesses() << " " << r3.rejected << " " << join(r3.guesses) << endl;
    expected << "1 3 1 DRAIN,TRAIN,BRAIN" << endl;

    // out of guesses
    Agent short_agent(dictionary, 2, Mode::hard, false);
    Game g4(dictionary, answer, 2, Mode::hard);
    GameRecord r4 = g4.play(short_agent, false);
    output << r4.won << " " << r4.num_guesses() << " " << g4.is_over() << endl;
    expected << "0 2 1" << endl;

    Game g5(dictionary, answer, 6, Mode::hard);
    g5.submit(Word("DRAIN"));
    output << g5.check_guess(Word("DOUBT")) << endl
           << "[" << g5.check_guess(Word("GRAIN")) << "]" << endl
           << g5.check_guess(Word("ABCDE")) << endl
           << g5.submit(Word("DOUBT")) << " " << g5.get_percepts().get_guess_counter() << endl;
    expected << "Spot #2 must be letter R. Spot #3 must be letter A. Spot #4 must be letter I. Spot #5 must be letter N." << endl
             << "[]" << endl
             << "Not in the dictionary: ABCDE." << endl
             << "0 1" << endl;

    string output_str = output.str();
    string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Game::test() 1 failed, got\n" + output_str + ", but expected\n" + expected_str);
    }

    bool threw = false;
    try { Game(dictionary, Word("CRANE"), 6, Mode::easy); } catch (const std::runtime_error&) { threw = true; }
    if (!threw) {
        throw std::runtime_error("Game::test() 2 failed, accepted an answer outside the dictionary");
    }
}
