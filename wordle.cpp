#include <string>
#include <vector>
#include <map>
#include <iostream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/program_options.hpp>
#include "alphabet.hpp"
#include "word.hpp"
#include "result.hpp"
#include "dictionary.hpp"
#include "agent.hpp"
#include "game.hpp"
#include "selftest.hpp"

using std::vector;
using std::map;
using std::cout;
using std::cerr;
using std::string;
using std::endl;
using boost::posix_time::ptime;
using boost::posix_time::microsec_clock;

namespace po = boost::program_options;

namespace {
    void print_game(const Game& game, const GameRecord& rec, const Alphabet& alphabet) {
        for (const Result& row : game.get_rows()) {
            row.output(cout, alphabet, true);
            cout << endl;
        }
        if (rec.won) {
            cout << "Solved in " << rec.num_guesses() << endl;
        } else if (rec.gave_up) {
            cout << "Ran out of candidates after " << rec.num_guesses() << endl;
        } else {
            cout << "Not solved" << endl;
        }
        if (rec.rejected > 0) cout << rec.rejected << " guesses were rejected" << endl;
    }

    void play_all(const Dictionary& dictionary, Agent& agent, int num_guesses, Mode mode) {
        ptime start = microsec_clock::local_time();
        map<int, int> distribution;
        int wins = 0;
        int gave_up = 0;
        int rejected = 0;
        long total_guesses = 0;
        for (const Word& answer : dictionary.words()) {
            Game game(dictionary, answer, num_guesses, mode);
            GameRecord rec = game.play(agent, false);
            rejected += rec.rejected;
            if (rec.won) {
                wins++;
                total_guesses += rec.num_guesses();
                distribution[rec.num_guesses()]++;
            } else if (rec.gave_up) {
                gave_up++;
            }
        }
        size_t n = dictionary.size();
        cout << "games        = " << n << endl;
        cout << "won          = " << wins << " (" << (100.0 * wins / n) << "%)" << endl;
        cout << "gave_up      = " << gave_up << endl;
        cout << "rejected     = " << rejected << endl;
        if (wins > 0) cout << "avg_guesses  = " << (static_cast<double>(total_guesses) / wins) << endl;
        for (auto const& kv : distribution) {
            cout << "  " << kv.first << ": " << kv.second << endl;
        }
        cout << "perf_seconds = " << (microsec_clock::local_time() - start).total_microseconds() / 1e6 << endl;
    }
}

int main(int argc, char* argv[]) {
    string opt_words;
    string opt_alphabet;
    int word_length = 5;
    int num_guesses = 6;
    string opt_mode;
    string opt_answer;

    po::options_description desc("Suggest wordle guesses, or play games against known answers.\n"
                                 "Positional arguments are rows like \"CRANE _~._.\" (_ absent, ~ elsewhere, . correct)");
    desc.add_options()
        ("words,w",    po::value<string>(&opt_words),                                   "dictionary, one word per line")
        ("alphabet,a", po::value<string>(&opt_alphabet)->default_value(Alphabet::english), "letters used by the game")
        ("length,l",   po::value<int>(&word_length)->default_value(5),                  "letters per word")
        ("guesses,g",  po::value<int>(&num_guesses)->default_value(6),                  "guesses allowed per game")
        ("mode,m",     po::value<string>(&opt_mode)->default_value("easy"),             "easy or hard")
        ("answer",     po::value<string>(&opt_answer),                                  "play one game against this answer")
        ("all",                                                                         "play every dictionary word as the answer")
        ("verbose,v",                                                                   "debug output")
        ("test,t",                                                                      "run self tests and exit")
        ("help,h",                                                                      "produce help message");

    try {
        po::variables_map vm;
        po::parsed_options parsed =
            po::command_line_parser(argc, argv).options(desc).allow_unregistered().run();
        po::store(parsed, vm);
        po::notify(vm);
        if (vm.count("help")) {
            cerr << desc << endl;
            return 1;
        }

        if (vm.count("test")) {
            run_self_tests();
            cout << "All tests passed" << endl;
            return 0;
        }

        if (opt_words.empty()) {
            cerr << "--words is required" << endl << desc << endl;
            return 1;
        }

        bool verbose = vm.count("verbose") > 0;
        Mode mode = mode_of_string(opt_mode);
        Alphabet alphabet(opt_alphabet);
        Dictionary dictionary = Dictionary::load_from_file(opt_words, alphabet, word_length);
        Agent agent(dictionary, num_guesses, mode, verbose);

        if (!opt_answer.empty()) {
            Game game(dictionary, Word(opt_answer), num_guesses, mode);
            GameRecord rec = game.play(agent, verbose);
            print_game(game, rec, alphabet);
            return 0;
        }

        if (vm.count("all")) {
            play_all(dictionary, agent, num_guesses, mode);
            return 0;
        }

        vector<string> rows = po::collect_unrecognized(parsed.options, po::include_positional);
        string guess = agent.next_guess(Result::initial(word_length));
        for (size_t i = 0; i < rows.size(); i++) {
            Result r(rows[i], alphabet, static_cast<int>(i) + 1);
            r.output(cout, alphabet, true);
            cout << endl;
            guess = agent.next_guess(r);
        }
        cout << "candidates   = " << agent.get_candidates().size() << endl;
        cout << "best_guess   = " << guess << endl;
    } catch (const NoCandidatesError& e) {
        cerr << e.what() << endl;
        return 1;
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }
    return 0;
}
