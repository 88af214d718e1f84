/* The set of letters a game is played with. Guessed words arrive from the game as
   lists of indexes into this alphabet (-1 on the very first turn, before anything
   has been guessed), so the alphabet is also what turns them back into words.
*/

#pragma once
#include <string>
#include <vector>
#include <iostream>

class Alphabet {
public:
    Alphabet(const std::string& letters);

    // -1 if the letter isn't in the alphabet
    int index_of(char letter) const;
    bool contains(char letter) const { return index_of(letter) >= 0; }

    // throws if any index is out of range
    std::string decode(const std::vector<int>& letter_indexes) const;
    std::vector<int> encode(const std::string& word) const;

    size_t size() const { return letters.size(); }
    char operator[](int i) const { return letters[i]; }
    const std::string& get_letters() const { return letters; }

    static const std::string english;

    static char normalize(char c);
    static void test();
private:
    std::string letters;
    int lookup[256];
};

std::ostream& operator<<(std::ostream& os, const Alphabet& a);
