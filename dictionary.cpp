#include <fstream>
#include <sstream>
#include <cstdio>
#include <stdexcept>
#include "dictionary.hpp"

using std::string;
using std::vector;
using std::cerr;
using std::endl;

namespace {
    // not set externally, only used for the test.
    bool silence = false;
}

Dictionary::Dictionary(const vector<string>& words, const Alphabet& alphabet_, int word_length_) :
    alphabet(alphabet_),
    word_length(word_length_)
{
    if (word_length <= 0) {
        throw std::runtime_error("Word length must be positive, not " + std::to_string(word_length));
    }
    if (words.empty()) {
        throw std::runtime_error("Dictionary is empty");
    }

    all_words.reserve(words.size());
    // words are all word_length long, so with the length and alphabet size up front the key is unambiguous
    key = std::to_string(word_length) + ":" + std::to_string(alphabet.size()) + ":" + alphabet.get_letters() + ":";
    for (const string& s : words) {
        Word w(s);
        if (w.length() != word_length) {
            throw std::runtime_error("Expected " + std::to_string(word_length) + " letter word, not: " + s);
        }
        for (int i = 0; i < w.length(); i++) {
            if (!alphabet.contains(w[i])) {
                throw std::runtime_error("Word uses a letter outside the alphabet: " + s);
            }
        }
        // first occurrence wins for duplicates
        word_index_map.insert({w, static_cast<int>(all_words.size())});
        all_words.push_back(w);
        key += w.str();
        key += ",";
    }
}

Dictionary Dictionary::load_from_file(const string& filename, const Alphabet& alphabet, int word_length) {
    std::ifstream f(filename.c_str());
    if (!f.is_open()) {
        throw std::runtime_error("Could not open dictionary: " + filename);
    }
    vector<string> words;
    string line;
    while (std::getline(f, line)) {
        if (line.find_first_not_of(" \t\r") != string::npos) {
            words.push_back(line);
        }
    }
    Dictionary rv(words, alphabet, word_length);
    if (!silence) cerr << "Loaded " << rv.size() << " words from " << filename << endl;
    return rv;
}

bool Dictionary::contains(const Word& w) const {
    return word_index_map.count(w) > 0;
}

int Dictionary::index_of(const Word& w) const {
    auto it = word_index_map.find(w);
    if (it == word_index_map.end()) return -1;
    return it->second;
}

void Dictionary::test() {
    silence = true;
    Alphabet en(Alphabet::english);
    string tmpfile = "/tmp/tmp.dictionary.txt";
    {
        std::ofstream out(tmpfile.c_str());
        out << "crane\n\nSLATE\r\n  \ntrain\n";
    }

    Dictionary d = Dictionary::load_from_file(tmpfile, en, 5);
    remove(tmpfile.c_str());
    Dictionary same({"CRANE", "SLATE", "TRAIN"}, en, 5);
    Dictionary reordered({"SLATE", "CRANE", "TRAIN"}, en, 5);

    std::stringstream output1;
    std::stringstream expected1;
    output1 << d.size() << " " << d[0] << " " << d[1] << " " << d[2] << " "
            << d.contains(Word("train")) << " " << d.contains(Word("BRAIN")) << " "
            << d.index_of(Word("SLATE")) << " " << d.index_of(Word("BRAIN")) << " "
            << (d.fingerprint() == same.fingerprint()) << " "
            << (d.fingerprint() == reordered.fingerprint()) << std::endl;
    expected1 << "3 CRANE SLATE TRAIN 1 0 1 -1 1 0" << std::endl;

    std::string output1_str = output1.str();
    std::string expected1_str = expected1.str();
    silence = false;
    if (output1_str != expected1_str) {
        throw std::runtime_error("Dictionary::test() 1 failed, got " + output1_str + ", but expected " + expected1_str);
    }

    int failures = 0;
    try { Dictionary({}, en, 5); } catch (const std::runtime_error&) { failures++; }
    try { Dictionary({"CRANE", "CRANES"}, en, 5); } catch (const std::runtime_error&) { failures++; }
    try { Dictionary({"CRANE"}, Alphabet("CRAN"), 5); } catch (const std::runtime_error&) { failures++; }
    try { Dictionary({"CRANE"}, en, 0); } catch (const std::runtime_error&) { failures++; }
    try { Dictionary::load_from_file("/nonexistent/words.txt", en, 5); } catch (const std::runtime_error&) { failures++; }
    if (failures != 5) {
        throw std::runtime_error("Dictionary::test() 2 failed, expected 5 rejected inputs, got " + std::to_string(failures));
    }
}
