#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <cstring>
#include "word.hpp"
#include "alphabet.hpp"

Word::Word(const std::string& r) : repeated_letter(false) {
    const char* blanks = " \t\r\n";
    size_t begin = r.find_first_not_of(blanks);
    if (begin == std::string::npos) {
        throw std::runtime_error("Expected a word, not: \"" + r + "\"");
    }
    size_t end = r.find_last_not_of(blanks);
    letters.reserve(end - begin + 1);
    for (size_t i = begin; i <= end; i++) {
        if (strchr(blanks, r[i])) {
            throw std::runtime_error("Whitespace inside word: \"" + r + "\"");
        }
        letters.push_back(Alphabet::normalize(r[i]));
    }
    for (size_t i = 0; i < letters.size() && !repeated_letter; i++) {
        if (letters.find(letters[i], i + 1) != std::string::npos) repeated_letter = true;
    }
}

int Word::count(char letter) const {
    return std::count(letters.begin(), letters.end(), letter);
}

bool Word::operator==(const Word& r) const {
    return letters == r.letters;
}

bool Word::operator<(const Word& r) const {
    return letters < r.letters;
}

std::ostream& operator<<(std::ostream& os, const Word& x) {
    return os << x.letters;
}

void Word::test() {
    Word x("azZAq");
    Word y(" crane\n");
    Word z("EAAZE");
    Word w("ROROR");

    std::stringstream output1;
    std::stringstream expected1;
    output1 << x << " " << x.length() << " " << x.count('Z') << " " << x.contains('Q') << " " << x.has_repeated_letter() << std::endl
            << y << " " << y.length() << " " << y.count('E') << " " << y.contains('Q') << " " << y.has_repeated_letter() << std::endl
            << z << " " << z.count('A') << " " << z.count('E') << " " << z.has_repeated_letter() << std::endl
            << w << " " << w.count('R') << " " << w.count('O') << " " << (w < z) << " " << (z < w) << std::endl
            << (Word("crane") == y) << " " << (Word("crane") != x) << std::endl;

    expected1 << "AZZAQ 5 2 1 1" << std::endl
              << "CRANE 5 1 0 0" << std::endl
              << "EAAZE 2 2 1" << std::endl
              << "ROROR 3 2 0 1" << std::endl
              << "1 1" << std::endl;

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Word::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
    }

    bool threw = false;
    try { Word(" \n"); } catch (const std::runtime_error&) { threw = true; }
    if (!threw) {
        throw std::runtime_error("Word::test() 2 failed, blank word accepted");
    }

    threw = false;
    try { Word("cr ane"); } catch (const std::runtime_error&) { threw = true; }
    if (!threw) {
        throw std::runtime_error("Word::test() 3 failed, word with inner whitespace accepted");
    }
}
