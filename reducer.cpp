#include <sstream>
#include <stdexcept>
#include "reducer.hpp"

using std::string;
using std::vector;
using std::endl;

namespace Reducer {
    int first_conflict(const Word& candidate, const Word& guess, const vector<State>& states) {
        for (int i = 0; i < guess.length(); i++) {
            char g = guess[i];
            if (states[i] == State::absent) {
                if (candidate.contains(g)) {
                    if (guess.count(g) == 1) return i;
                    if (candidate[i] == g) return i;
                }
            } else if (states[i] == State::correct) {
                if (candidate[i] != g) return i;
            } else if (states[i] == State::present) {
                if (!candidate.contains(g) || candidate[i] == g) return i;
            }
        }
        return -1;
    }

    bool keep(const Word& candidate, const Word& guess, const vector<State>& states) {
        return first_conflict(candidate, guess, states) < 0;
    }

    string reason(const Word& candidate, const Word& guess, const vector<State>& states) {
        int i = first_conflict(candidate, guess, states);
        if (i < 0) return string();

        std::stringstream problems;
        char g = guess[i];
        if (states[i] == State::correct) {
            problems << "Spot #" << (i+1) << " must be letter " << g << ".";
        } else if (states[i] == State::present && !candidate.contains(g)) {
            problems << "You need letter " << g << ".";
        } else if (states[i] == State::absent && guess.count(g) == 1) {
            problems << "You know letter " << g << " is absent.";
        } else {
            problems << "You can't have letter " << g << " in spot #" << (i+1) << ".";
        }
        return problems.str();
    }

    vector<Word> reduce(const vector<Word>& candidates, const Result& feedback, const Alphabet& alphabet) {
        Word guess = feedback.get_guess(alphabet);
        const vector<State>& states = feedback.get_states();
        if (guess.length() != static_cast<int>(states.size())) {
            throw std::runtime_error("Feedback for " + guess.str() + " has the wrong number of states");
        }

        vector<Word> r;
        r.reserve(candidates.size());
        for (const Word& w : candidates) {
            if (w.length() != guess.length()) {
                throw std::runtime_error("Candidate " + w.str() + " doesn't match the guess length");
            }
            if (keep(w, guess, states)) r.push_back(w);
        }
        return r;
    }

    string to_string(const vector<Word>& words) {
        std::stringstream ss;
        for (size_t i = 0; i < words.size(); i++) {
            if (i > 0) ss << ",";
            ss << words[i];
        }
        return ss.str();
    }

    void test() {
        Alphabet en(Alphabet::english);
        vector<Word> four = { Word("CRANE"), Word("SLATE"), Word("TRAIN"), Word("BRAIN") };
        vector<Word> slate = { Word("CRANE"), Word("SLATE"), Word("TRAIN") };
        vector<Word> scour = { Word("CRANE"), Word("SLATE"), Word("TRAIN"), Word("SCOUR") };
        vector<Word> robot = { Word("BRINK"), Word("ROBOT"), Word("MOTTO"), Word("CRANE") };
        vector<Word> speed = { Word("ABIDE"), Word("EDGED"), Word("DELVE"), Word("SIDLE") };

        Result all_green("TRAIN .....", en, 1);
        Result s_only("SLATE .____", en, 1);
        Result r_yellow("CRANE _~___", en, 1);
        Result speed_abide(Word("ABIDE"), Word("SPEED"), en, 1);

        std::stringstream output;
        std::stringstream expected;
        output << to_string(reduce(four, all_green, en)) << endl
               << "[" << to_string(reduce(slate, s_only, en)) << "]" << endl
               << to_string(reduce(scour, s_only, en)) << endl
               << to_string(reduce(robot, r_yellow, en)) << endl
               << speed_abide.to_string(en) << " " << to_string(reduce(speed, speed_abide, en)) << endl
               << reason(Word("CRANE"), Word("SLATE"), s_only.get_states()) << endl
               << reason(Word("SLATE"), Word("SLATE"), s_only.get_states()) << endl
               << reason(Word("MOTTO"), Word("CRANE"), r_yellow.get_states()) << endl
               << reason(Word("BRINK"), Word("CRANE"), r_yellow.get_states()) << endl
               << reason(Word("EDGED"), Word("SPEED"), speed_abide.get_states()) << endl
               << "[" << reason(Word("DELVE"), Word("SPEED"), speed_abide.get_states()) << "]" << endl;

        expected << "TRAIN" << endl
                 << "[]" << endl
                 << "SCOUR" << endl
                 << "ROBOT" << endl
                 << "SPEED __~_~ ABIDE,DELVE" << endl
                 << "Spot #1 must be letter S." << endl
                 << "You know letter L is absent." << endl
                 << "You need letter R." << endl
                 << "You can't have letter R in spot #2." << endl
                 << "You can't have letter E in spot #4." << endl
                 << "[]" << endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Reducer::test() 1 failed, got\n" + output_str + ", but expected\n" + expected_str);
        }

        // the list never grows and the real answer is never dropped
        vector<Word> candidates = { Word("CRANE"), Word("SLATE"), Word("TRAIN"), Word("BRAIN"), Word("DRAIN"), Word("GRAIN") };
        const vector<Word> guesses = { Word("SLATE"), Word("CRANE"), Word("GRAIN"), Word("DRAIN") };
        for (const Word& guess : guesses) {
            size_t before = candidates.size();
            candidates = reduce(candidates, Result(Word("BRAIN"), guess, en, 1), en);
            if (candidates.size() > before) {
                throw std::runtime_error("Reducer::test() 2 failed, candidates grew after " + guess.str());
            }
            bool has_answer = false;
            for (const Word& w : candidates) has_answer |= (w == Word("BRAIN"));
            if (!has_answer) {
                throw std::runtime_error("Reducer::test() 2 failed, dropped the answer after " + guess.str());
            }
        }
        if (to_string(candidates) != "BRAIN") {
            throw std::runtime_error("Reducer::test() 2 failed, left with " + to_string(candidates));
        }
    }
}
