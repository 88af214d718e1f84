/* Represents a dictionary word. Words are fixed length within a game, but the length
   itself comes from the game configuration, so a Word doesn't hard code it.

   Letters are stored uppercased. We precompute whether any letter repeats because both
   scorers penalise repeats and they ask for it once per word per scoring pass.
*/

#pragma once
#include <string>
#include <iostream>

class Word {
public:
    Word(const std::string& r);
    bool operator==(const Word& r) const;
    bool operator!=(const Word& r) const { return !(*this == r); }
    bool operator<(const Word& r) const;
    char operator[](int pos) const { return letters[pos]; }
    friend std::ostream& operator<<(std::ostream& os, const Word& x);

    int length() const { return letters.size(); }
    int count(char letter) const;
    bool contains(char letter) const { return letters.find(letter) != std::string::npos; }
    bool has_repeated_letter() const { return repeated_letter; }
    const std::string& str() const { return letters; }

    static void test();
private:
    std::string letters;
    bool repeated_letter;
};

std::ostream& operator<<(std::ostream& os, const Word& x);
