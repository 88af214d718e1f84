/* The full list of legal guesses for a game, together with the alphabet and word length
   it was checked against. Immutable once constructed: every game played by the process
   starts its candidate list as a copy of words().
*/

#pragma once
#include <map>
#include <vector>
#include <string>
#include "word.hpp"
#include "alphabet.hpp"

class Dictionary {
public:
    // throws if the list is empty or any word doesn't fit the alphabet/length
    Dictionary(const std::vector<std::string>& words, const Alphabet& alphabet, int word_length);

    // one word per line, blank lines are skipped
    static Dictionary load_from_file(const std::string& filename, const Alphabet& alphabet, int word_length);

    const Word& operator[](int i) const { return all_words[i]; }
    size_t size() const { return all_words.size(); }
    const std::vector<Word>& words() const { return all_words; }
    const Alphabet& get_alphabet() const { return alphabet; }
    int get_word_length() const { return word_length; }

    bool contains(const Word& w) const;
    // -1 if not found
    int index_of(const Word& w) const;

    // identifies the word list (and its order), used to key per-dictionary caches
    const std::string& fingerprint() const { return key; }

    static void test();
private:
    Alphabet alphabet;
    int word_length;
    std::vector<Word> all_words;
    std::map<Word, int> word_index_map;
    std::string key;
};
