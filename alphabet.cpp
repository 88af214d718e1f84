#include <sstream>
#include <algorithm>
#include <stdexcept>
#include "alphabet.hpp"

const std::string Alphabet::english = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

char Alphabet::normalize(char c) {
    if (c >= 'a' && c <= 'z') return c + 'A' - 'a';
    return c;
}

Alphabet::Alphabet(const std::string& r) {
    std::fill(lookup, lookup + 256, -1);
    for (char c : r) {
        char n = normalize(c);
        unsigned char u = static_cast<unsigned char>(n);
        if (lookup[u] >= 0) {
            throw std::runtime_error("Letter appears twice in alphabet: " + r);
        }
        lookup[u] = letters.size();
        letters.push_back(n);
    }
    if (letters.empty()) {
        throw std::runtime_error("Alphabet must not be empty");
    }
}

int Alphabet::index_of(char letter) const {
    return lookup[static_cast<unsigned char>(normalize(letter))];
}

std::string Alphabet::decode(const std::vector<int>& letter_indexes) const {
    std::string rv;
    rv.reserve(letter_indexes.size());
    for (int i : letter_indexes) {
        if (i < 0 || i >= static_cast<int>(letters.size())) {
            throw std::runtime_error("Letter index out of range: " + std::to_string(i));
        }
        rv.push_back(letters[i]);
    }
    return rv;
}

std::vector<int> Alphabet::encode(const std::string& word) const {
    std::vector<int> rv;
    rv.reserve(word.size());
    for (char c : word) {
        int i = index_of(c);
        if (i < 0) {
            throw std::runtime_error("Word uses a letter outside the alphabet: " + word);
        }
        rv.push_back(i);
    }
    return rv;
}

std::ostream& operator<<(std::ostream& os, const Alphabet& a) {
    return os << a.get_letters();
}

void Alphabet::test() {
    Alphabet en(english);
    Alphabet small("xyZ");

    std::stringstream output1;
    std::stringstream expected1;
    output1 << en.size() << " "
            << en.index_of('A') << " "
            << en.index_of('z') << " "
            << en.index_of('?') << " "
            << en.decode({2, 17, 0, 13, 4}) << " "
            << small << " "
            << small.index_of('Y') << " "
            << small.decode(small.encode("zzyx"))
            << std::endl;
    expected1 << "26 0 25 -1 CRANE XYZ 1 ZZYX" << std::endl;

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    if (output1_str != expected1_str) {
        throw std::runtime_error("Alphabet::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
    }

    int failures = 0;
    try { en.decode({-1, -1, -1, -1, -1}); } catch (const std::runtime_error&) { failures++; }
    try { en.decode({26}); } catch (const std::runtime_error&) { failures++; }
    try { small.encode("XYA"); } catch (const std::runtime_error&) { failures++; }
    try { Alphabet(""); } catch (const std::runtime_error&) { failures++; }
    try { Alphabet("ABa"); } catch (const std::runtime_error&) { failures++; }
    if (failures != 5) {
        throw std::runtime_error("Alphabet::test() 2 failed, expected 5 rejected inputs, got " + std::to_string(failures));
    }
}
