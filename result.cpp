#include <sstream>
#include <map>
#include <stdexcept>
#include "result.hpp"

const char Result::black_char  = '_';
const char Result::yellow_char = '~';
const char Result::green_char  = '.';

Result::Result(int guess_counter_, const std::vector<int>& letter_indexes_, const std::vector<State>& states_) :
    guess_counter(guess_counter_),
    letter_indexes(letter_indexes_),
    states(states_)
{
    if (letter_indexes.size() != states.size()) {
        throw std::runtime_error("Result has " + std::to_string(letter_indexes.size()) + " letters but "
                                 + std::to_string(states.size()) + " states");
    }
    if (guess_counter < 0) {
        throw std::runtime_error("Result has negative guess counter");
    }
}

Result::Result(const std::string& r, const Alphabet& alphabet, int guess_counter_) : guess_counter(guess_counter_) {
    for (char c : r) {
        if (c == black_char) {
            states.push_back(State::absent);
        } else if (c == yellow_char) {
            states.push_back(State::present);
        } else if (c == green_char) {
            states.push_back(State::correct);
        } else if (alphabet.contains(c)) {
            if (!states.empty()) {
                throw std::runtime_error("Letters must come before results, not: " + r);
            }
            letter_indexes.push_back(alphabet.index_of(c));
        } else if (c != ' ') {
            throw std::runtime_error("Unexpected char '" + std::string(1, c) + "' in result: " + r);
        }
    }
    if (letter_indexes.empty() || letter_indexes.size() != states.size()) {
        throw std::runtime_error("Expected a word and one result per letter, not: " + r);
    }
}

Result::Result(const Word& answer, const Word& guess, const Alphabet& alphabet, int guess_counter_) :
    guess_counter(guess_counter_),
    letter_indexes(alphabet.encode(guess.str())),
    states(guess.length(), State::absent)
{
    if (answer.length() != guess.length()) {
        throw std::runtime_error("Answer and guess lengths differ");
    }

    // letters of the answer not used up by a green
    std::map<char, int> unmatched;
    for (int i = 0; i < guess.length(); i++) {
        if (guess[i] == answer[i]) {
            states[i] = State::correct;
        } else {
            unmatched[answer[i]]++;
        }
    }

    for (int i = 0; i < guess.length(); i++) {
        if (states[i] == State::correct) continue;
        auto it = unmatched.find(guess[i]);
        if (it != unmatched.end() && it->second > 0) {
            states[i] = State::present;
            it->second--;
        }
    }
}

Result Result::initial(int word_length) {
    return Result(0, std::vector<int>(word_length, -1), std::vector<State>(word_length, State::absent));
}

Word Result::get_guess(const Alphabet& alphabet) const {
    return Word(alphabet.decode(letter_indexes));
}

int Result::num_yellow() const {
    int i = 0;
    for (State s : states) {
        if (s == State::present) i++;
    }
    return i;
}
int Result::num_black() const {
    int i = 0;
    for (State s : states) {
        if (s == State::absent) i++;
    }
    return i;
}
int Result::num_green() const {
    int i = 0;
    for (State s : states) {
        if (s == State::correct) i++;
    }
    return i;
}

int Result::first_unresolved() const {
    for (size_t i = 0; i < states.size(); i++) {
        if (states[i] != State::correct) return i;
    }
    return -1;
}

void Result::output(std::ostream& os, const Alphabet& alphabet, bool ansi_escapes) const {
    if (!ansi_escapes) {
        os << to_string(alphabet);
        return;
    }
    for (size_t i = 0; i < states.size(); i++) {
        char letter = letter_indexes[i] < 0 ? '?' : alphabet[letter_indexes[i]];
        if (states[i] == State::absent) {
            os << "\033[37;40m" << letter;
        } else if (states[i] == State::present) {
            os << "\033[30;43m" << letter;
        } else {
            os << "\033[30;42m" << letter;
        }
    }
    os << "\033[0m";
}

std::string Result::to_string(const Alphabet& alphabet) const {
    std::string rv;
    for (int i : letter_indexes) {
        rv.push_back(i < 0 ? '?' : alphabet[i]);
    }
    rv.push_back(' ');
    for (State s : states) {
        if (s == State::absent) {
            rv.push_back(black_char);
        } else if (s == State::present) {
            rv.push_back(yellow_char);
        } else {
            rv.push_back(green_char);
        }
    }
    return rv;
}

void Result::test() {
    Alphabet en(Alphabet::english);

    std::stringstream output1;
    std::stringstream expected1;
    Result r1("CRANE _~._.", en, 1);
    Result r0 = Result::initial(5);
    output1 << r1.get_guess_counter() << " " << r1.get_guess(en) << " "
            << r1.num_black() << r1.num_yellow() << r1.num_green() << " "
            << r1.first_unresolved() << " "
            << static_cast<int>(r1.get_state(1)) << " "
            << r1.to_string(en) << " "
            << r0.get_guess_counter() << " " << r0.to_string(en) << " " << r0.first_unresolved() << std::endl;
    expected1 << "1 CRANE 212 0 -1 CRANE _~._. 0 ????? _____ 0" << std::endl;

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Result::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
    }

    std::stringstream output2;
    std::stringstream expected2;
    output2   << Result(Word("JAUNT"), Word("TAUNT"), en, 1).to_string(en) << std::endl;
    output2   << Result(Word("BRINE"), Word("SWEET"), en, 1).to_string(en) << std::endl;
    output2   << Result(Word("AABBB"), Word("BBAAA"), en, 1).to_string(en) << std::endl;
    output2   << Result(Word("MUMMY"), Word("MMYYM"), en, 1).to_string(en) << std::endl;
    output2   << Result(Word("PHOTO"), Word("FLOOD"), en, 1).to_string(en) << std::endl;
    output2   << Result(Word("WROTE"), Word("FLOOD"), en, 1).to_string(en) << std::endl;
    output2   << Result(Word("BONGO"), Word("FLOOD"), en, 1).to_string(en) << std::endl;
    output2   << Result(Word("YOUTH"), Word("FLOOD"), en, 1).to_string(en) << std::endl;
    output2   << Result(Word("WORLD"), Word("FLOOD"), en, 1).to_string(en) << std::endl;
    output2   << Result(Word("TRAIN"), Word("TRAIN"), en, 1).is_win() << std::endl;

    expected2 << "TAUNT _...." << std::endl;
    expected2 << "SWEET __~__" << std::endl;
    expected2 << "BBAAA ~~~~_" << std::endl;
    expected2 << "MMYYM .~~_~" << std::endl;
    expected2 << "FLOOD __.~_" << std::endl;
    expected2 << "FLOOD __.__" << std::endl;
    expected2 << "FLOOD __~~_" << std::endl;
    expected2 << "FLOOD __~__" << std::endl;
    expected2 << "FLOOD _~~_." << std::endl;
    expected2 << "1" << std::endl;

    std::string output2_str = output2.str();
    std::string expected2_str = expected2.str();
    if (output2_str != expected2_str) {
        throw std::runtime_error("Result::test() 2 failed, got\n" + output2_str + ", but expected\n" + expected2_str);
    }

    int failures = 0;
    try { Result("slate", en, 1); } catch (const std::runtime_error&) { failures++; }
    try { Result("CRANE _~.", en, 1); } catch (const std::runtime_error&) { failures++; }
    try { Result("CR4NE _~._.", en, 1); } catch (const std::runtime_error&) { failures++; }
    try { Result(1, {0, 1}, {State::absent}); } catch (const std::runtime_error&) { failures++; }
    try { Result::initial(5).get_guess(en); } catch (const std::runtime_error&) { failures++; }
    if (failures != 5) {
        throw std::runtime_error("Result::test() 3 failed, expected 5 rejected inputs, got " + std::to_string(failures));
    }
}
