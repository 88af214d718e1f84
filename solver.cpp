#include <iostream>
#include <sstream>
#include <set>
#include <algorithm>
#include <stdexcept>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "solver.hpp"

using std::string;
using std::vector;
using std::set;
using std::endl;
typedef boost::posix_time::ptime ptime;

namespace Solver {
    const double double_letter_penalty = 0.9;
    const double smart_double_letter_penalty = 0.1;

    ptime now() {
        return boost::posix_time::microsec_clock::local_time();
    }

    LetterStats::LetterStats(const vector<Word>& candidates) : num_candidates(candidates.size()) {
        if (candidates.empty()) {
            throw std::runtime_error("LetterStats: no candidates to count");
        }
        std::array<int, 256> zero;
        zero.fill(0);
        counts.assign(candidates[0].length(), zero);
        for (const Word& w : candidates) {
            for (int pos = 0; pos < w.length() && pos < static_cast<int>(counts.size()); pos++) {
                counts[pos][static_cast<unsigned char>(w[pos])]++;
            }
        }
    }

    double LetterStats::probability(char letter, int pos) const {
        if (pos < 0 || pos >= static_cast<int>(counts.size())) return 0;
        int freq = counts[pos][static_cast<unsigned char>(letter)];
        return static_cast<double>(freq) / num_candidates;
    }

    double LetterStats::entropy(char letter, int pos) const {
        double p = probability(letter, pos);
        return p * (1 - p);
    }

    double score(const Word& w, const LetterStats& stats) {
        double s = 0;
        for (int i = 0; i < w.length(); i++) {
            s += stats.entropy(w[i], i);
        }
        if (w.has_repeated_letter()) {
            s *= double_letter_penalty;
        }
        return s;
    }

    vector<double> calculate_scores(const vector<Word>& words, const LetterStats& stats) {
        vector<double> scores;
        scores.reserve(words.size());
        for (const Word& w : words) {
            scores.push_back(score(w, stats));
        }
        return scores;
    }

    vector<double> calculate_scores(const vector<Word>& candidates) {
        if (candidates.empty()) return vector<double>();
        return calculate_scores(candidates, LetterStats(candidates));
    }

    int best_index(const vector<double>& scores) {
        if (scores.empty()) return -1;
        return std::max_element(scores.begin(), scores.end()) - scores.begin();
    }

    SolveResult solve(const vector<Word>& candidates, bool track_time) {
        SolveResult rv;
        ptime start;
        if (track_time) start = now();

        vector<double> scores = calculate_scores(candidates);
        rv.best_index = best_index(scores);
        if (rv.found()) {
            rv.best_guess = candidates[rv.best_index].str();
            rv.best_score = scores[rv.best_index];
        }
        rv.perf_calls = scores.size();
        if (track_time) rv.perf_microseconds = (now() - start).total_microseconds();
        return rv;
    }

    int green_counter(const Result& feedback) {
        return feedback.num_green();
    }

    SolveResult smart_guess(const vector<Word>& candidates, const Dictionary& dictionary, const Result& feedback) {
        SolveResult rv;
        int grey_pos = feedback.first_unresolved();
        if (grey_pos < 0) {
            throw std::runtime_error("smart_guess: every position is already correct");
        }

        set<char> possible_letters;
        for (const Word& w : candidates) {
            possible_letters.insert(w[grey_pos]);
        }

        vector<double> scores;
        scores.reserve(dictionary.size());
        for (const Word& w : dictionary.words()) {
            double s = 0;
            for (int i = 0; i < w.length(); i++) {
                if (possible_letters.count(w[i])) s += 1;
            }
            bool double_letter = w.has_repeated_letter();
            if (double_letter) {
                s *= smart_double_letter_penalty;
            }
            scores.push_back(s);
        }

        rv.best_index = best_index(scores);
        rv.best_guess = dictionary[rv.best_index].str();
        rv.best_score = scores[rv.best_index];
        rv.perf_calls = scores.size();
        return rv;
    }

    void test1() {
        vector<Word> rain = { Word("CRANE"), Word("DRAIN"), Word("TRAIN"), Word("BRAIN") };
        LetterStats stats(rain);

        std::stringstream output;
        std::stringstream expected;
        output << stats.size() << " "
               << stats.probability('D', 0) << " "
               << stats.probability('R', 1) << " "
               << stats.probability('I', 3) << " "
               << stats.probability('Z', 0) << " "
               << stats.entropy('D', 0) << " "
               << stats.entropy('R', 1) << " "
               << stats.entropy('N', 4) << endl;
        vector<double> scores = calculate_scores(rain);
        for (double s : scores) output << s << " ";
        output << best_index(scores) << " " << best_index(vector<double>()) << endl;

        expected << "4 0.25 1 0.75 0 0.1875 0 0.1875" << endl;
        expected << "0.5625 0.5625 0.5625 0.5625 0 -1" << endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Solver::test1() failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
    }

    void test2() {
        vector<Word> candidates = { Word("CRANE"), Word("ERASE"), Word("SLATE"), Word("TRAIN") };
        LetterStats stats(candidates);
        Word erase("ERASE");

        double raw = 0;
        for (int i = 0; i < erase.length(); i++) raw += stats.entropy(erase[i], i);
        double s1 = score(erase, stats);
        double s2 = score(erase, stats);
        if (s1 != raw * 0.9 || s1 >= raw) {
            throw std::runtime_error("Solver::test2() failed, repeated letter penalty not applied");
        }
        if (s1 != s2) {
            throw std::runtime_error("Solver::test2() failed, same word scored differently twice");
        }

        std::stringstream output;
        std::stringstream expected;
        SolveResult r = solve(candidates, false);
        output << raw << " " << s1 << " " << r << endl;
        expected << "0.75 0.675 0,CRANE,0.75,4,0" << endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Solver::test2() failed, got\n" + output_str + ", but expected\n" + expected_str);
        }

        if (solve(vector<Word>(), false).found()) {
            throw std::runtime_error("Solver::test2() failed, found a guess among no candidates");
        }
    }

    void test3() {
        Alphabet en(Alphabet::english);
        Dictionary dictionary({"CRANE", "DRAIN", "TRAIN", "BRAIN", "GRAIN", "TABBY", "DOUBT", "BATCH"}, en, 5);
        vector<Word> candidates = { Word("CRANE"), Word("DRAIN"), Word("TRAIN"), Word("BRAIN") };
        Result feedback("GRAIN _....", en, 1);

        std::stringstream output;
        std::stringstream expected;
        SolveResult r = smart_guess(candidates, dictionary, feedback);
        output << green_counter(feedback) << " " << r << endl;
        expected << "4 6,DOUBT,3,8,0" << endl;

        string output_str = output.str();
        string expected_str = expected.str();
        if (output_str != expected_str) {
            throw std::runtime_error("Solver::test3() failed, got\n" + output_str + ", but expected\n" + expected_str);
        }
        if (!dictionary.contains(Word(r.best_guess))) {
            throw std::runtime_error("Solver::test3() failed, smart guess is not a dictionary word");
        }

        bool threw = false;
        try {
            smart_guess(candidates, dictionary, Result("GRAIN .....", en, 1));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        if (!threw) {
            throw std::runtime_error("Solver::test3() failed, smart guess accepted a solved row");
        }
    }

    void test() {
        test1();
        test2();
        test3();
    }
}
