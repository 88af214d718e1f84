#include <sstream>
#include "agent.hpp"
#include "solver.hpp"
#include "reducer.hpp"
#include "opener.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::endl;
using Solver::SolveResult;

Mode mode_of_string(const string& str) {
    if (str == "easy") return Mode::easy;
    if (str == "hard") return Mode::hard;
    throw std::runtime_error("mode_of_string: " + str + " (expected easy or hard)");
}

std::ostream& operator<<(std::ostream& os, Mode m) {
    return os << (m == Mode::easy ? "easy" : "hard");
}

Agent::Agent(const Dictionary& dictionary_, int num_guesses_, Mode mode_, bool debug_output_) :
    dictionary(dictionary_),
    num_guesses(num_guesses_),
    mode(mode_),
    debug_output(debug_output_),
    candidates(dictionary_.words()),
    last_guess_counter(0)
{
    if (num_guesses <= 0) {
        throw std::runtime_error("Number of guesses must be positive, not " + std::to_string(num_guesses));
    }
}

string Agent::start_game() {
    last_guess_counter = 0;
    candidates = dictionary.words();
    const SolveResult& opener = Opener::get(dictionary, debug_output);
    if (debug_output) cerr << "New game, opening with " << opener.best_guess << endl;
    return opener.best_guess;
}

void Agent::drop_rejected_guess(int guess_counter) {
    if (debug_output) {
        cerr << "Game is on guess #" << guess_counter << " but we counted " << last_guess_counter
             << ", last guess was rejected" << endl;
    }
    SolveResult top = Solver::solve(candidates, false);
    if (top.found()) {
        if (debug_output) cerr << "Dropping " << top.best_guess << endl;
        candidates.erase(candidates.begin() + top.best_index);
    }
    last_guess_counter = guess_counter;
}

void Agent::log_discards(const Result& percepts) const {
    Word guess = percepts.get_guess(dictionary.get_alphabet());
    int shown = 0;
    for (const Word& w : candidates) {
        string why = Reducer::reason(w, guess, percepts.get_states());
        if (why.empty()) continue;
        if (shown++ < 20) {
            cerr << " Discarding " << w << ": " << why << endl;
        }
    }
    if (shown > 20) cerr << " ... and " << (shown - 20) << " more" << endl;
}

bool Agent::should_smart_guess(const Result& percepts) const {
    return mode == Mode::easy
        && candidates.size() > 2
        && percepts.get_guess_counter() != num_guesses - 1
        && Solver::green_counter(percepts) == dictionary.get_word_length() - 1;
}

string Agent::next_guess(const Result& percepts) {
    if (percepts.length() != dictionary.get_word_length()) {
        throw std::runtime_error("Expected feedback for " + std::to_string(dictionary.get_word_length())
                                 + " letters, got " + std::to_string(percepts.length()));
    }

    int guess_counter = percepts.get_guess_counter();
    if (guess_counter == 0) return start_game();

    last_guess_counter++;
    if (debug_output) log_discards(percepts);
    candidates = Reducer::reduce(candidates, percepts, dictionary.get_alphabet());

    if (guess_counter != last_guess_counter) {
        drop_rejected_guess(guess_counter);
    }

    if (candidates.empty()) {
        throw NoCandidatesError("No candidates left after " + percepts.to_string(dictionary.get_alphabet()));
    }

    if (debug_output) {
        cerr << "Guess #" << guess_counter << ": " << candidates.size() << " candidates left" << endl;
        if (candidates.size() < 20) {
            for (const Word& w : candidates) {
                cerr << " Valid answer: " << w << endl;
            }
        }
    }

    if (should_smart_guess(percepts)) {
        SolveResult r = Solver::smart_guess(candidates, dictionary, percepts);
        if (debug_output) cerr << "One spot left, testing letters with " << r.best_guess << " (" << r.best_score << ")" << endl;
        return r.best_guess;
    }

    SolveResult r = Solver::solve(candidates, debug_output);
    if (debug_output) {
        cerr << "Best candidate " << r.best_guess << " with score " << r.best_score
             << ", took " << r.perf_microseconds / 1e6 << "s" << endl;
    }
    return r.best_guess;
}

namespace {
    bool contains(const vector<Word>& words, const string& w) {
        for (const Word& x : words) {
            if (x.str() == w) return true;
        }
        return false;
    }
}

void Agent::test() {
    Alphabet en(Alphabet::english);
    Dictionary dictionary({"GRAIN", "DRAIN", "TRAIN", "BRAIN", "DOUBT", "TABBY", "BATCH"}, en, 5);
    Word answer("BRAIN");

    std::stringstream output;
    std::stringstream expected;

    // easy mode, runs into _RAIN and spends a guess on DOUBT
    Agent easy(dictionary, 6, Mode::easy, false);
    string g0 = easy.next_guess(Result::initial(5));
    string g1 = easy.next_guess(Result(answer, Word(g0), en, 1));
    size_t left1 = easy.get_candidates().size();
    string g2 = easy.next_guess(Result(answer, Word(g1), en, 2));
    output << g0 << " " << g1 << " " << left1 << " " << g2 << " " << easy.get_guess_counter() << endl;
    expected << "DRAIN DOUBT 3 BRAIN 2" << endl;

    // a new game starts over from the whole dictionary with the same opener
    string again = easy.next_guess(Result::initial(5));
    output << again << " " << easy.get_candidates().size() << " " << easy.get_guess_counter() << endl;
    expected << "DRAIN 7 0" << endl;

    // hard mode never uses the one-spot-left guess
    Agent hard(dictionary, 6, Mode::hard, false);
    string h0 = hard.next_guess(Result::initial(5));
    string h1 = hard.next_guess(Result(answer, Word(h0), en, 1));
    string h2 = hard.next_guess(Result(answer, Word(h1), en, 2));
    string h3 = hard.next_guess(Result(answer, Word(h2), en, 3));
    output << h0 << " " << h1 << " " << h2 << " " << h3 << endl;
    expected << "DRAIN GRAIN TRAIN BRAIN" << endl;

    // ... and neither does easy mode on the last allowed guess
    Agent last(dictionary, 2, Mode::easy, false);
    string l0 = last.next_guess(Result::initial(5));
    string l1 = last.next_guess(Result(answer, Word(l0), en, 1));
    output << l1 << " " << contains(last.get_candidates(), l1) << endl;
    expected << "GRAIN 1" << endl;

    // GRAIN is rejected, the game asks for guess #1 again
    Agent desync(dictionary, 6, Mode::hard, false);
    string d0 = desync.next_guess(Result::initial(5));
    Result first(answer, Word(d0), en, 1);
    string d1 = desync.next_guess(first);
    string d1_retry = desync.next_guess(first);
    bool dropped = !contains(desync.get_candidates(), d1);
    int counter_after_retry = desync.get_guess_counter();
    string d2 = desync.next_guess(Result(answer, Word(d1_retry), en, 2));
    output << d1 << " " << d1_retry << " " << dropped << " " << counter_after_retry << " "
           << d2 << " " << desync.get_candidates().size() << endl;
    expected << "GRAIN TRAIN 1 1 BRAIN 1" << endl;

    output << mode_of_string("easy") << " " << mode_of_string("hard") << endl;
    expected << "easy hard" << endl;

    string output_str = output.str();
    string expected_str = expected.str();
    if (output_str != expected_str) {
        throw std::runtime_error("Agent::test() 1 failed, got\n" + output_str + ", but expected\n" + expected_str);
    }

    // one spot left but only two candidates: guess one of them rather than a tester word
    Dictionary with_begot({"GRAIN", "DRAIN", "TRAIN", "BRAIN", "DOUBT", "TABBY", "BATCH", "BEGOT"}, en, 5);
    Agent two_left(with_begot, 6, Mode::easy, false);
    two_left.next_guess(Result::initial(5));
    string t1 = two_left.next_guess(Result("DRAIN _....", en, 1));
    string t2 = two_left.next_guess(Result("TRAIN _....", en, 2));
    std::stringstream output2;
    output2 << t1 << " " << two_left.get_candidates().size() << " " << t2 << " "
            << contains(two_left.get_candidates(), t2) << endl;
    if (output2.str() != "BEGOT 2 GRAIN 1\n") {
        throw std::runtime_error("Agent::test() 4 failed, got " + output2.str() + ", but expected BEGOT 2 GRAIN 1");
    }

    // debug output explains each discarded candidate
    std::stringstream log;
    std::streambuf* old_cerr = std::cerr.rdbuf(log.rdbuf());
    try {
        Agent verbose(dictionary, 6, Mode::hard, true);
        verbose.next_guess(Result::initial(5));
        verbose.next_guess(Result("DRAIN _....", en, 1));
    } catch (const std::runtime_error&) {
        std::cerr.rdbuf(old_cerr);
        throw;
    }
    std::cerr.rdbuf(old_cerr);
    string log_str = log.str();
    if (log_str.find(" Discarding DRAIN: You know letter D is absent.") == string::npos
        || log_str.find(" Discarding TABBY: Spot #2 must be letter R.") == string::npos
        || log_str.find(" Discarding GRAIN") != string::npos) {
        throw std::runtime_error("Agent::test() 5 failed, debug output was\n" + log_str);
    }

    // feedback nothing in the dictionary agrees with
    Agent stuck(dictionary, 6, Mode::easy, false);
    stuck.next_guess(Result::initial(5));
    bool threw = false;
    try {
        stuck.next_guess(Result("DRAIN _____", en, 1));
    } catch (const NoCandidatesError&) {
        threw = true;
    }
    if (!threw) {
        throw std::runtime_error("Agent::test() 2 failed, expected NoCandidatesError");
    }

    int failures = 0;
    try { Agent(dictionary, 0, Mode::easy, false); } catch (const std::runtime_error&) { failures++; }
    try { mode_of_string("medium"); } catch (const std::runtime_error&) { failures++; }
    try { Agent(dictionary, 6, Mode::easy, false).next_guess(Result::initial(4)); } catch (const std::runtime_error&) { failures++; }
    if (failures != 3) {
        throw std::runtime_error("Agent::test() 3 failed, expected 3 rejected inputs, got " + std::to_string(failures));
    }
}
