// © 2026 Beatrix Zselezny. All rights reserved.
// Rnd-Sequencer Token Randomness Framework

#ifndef STRINGUTILS_HPP
#define STRINGUTILS_HPP

#include <string>
#include <vector>

namespace SequencerUtils {
    /**
     * @brief Minden előfordulást lecserél a szövegben.
     */
    std::string replaceAll(std::string str, const std::string& from, const std::string& to);

    /**
     * @brief Whitespace eltávolítása a szöveg elejéről és végéről (token fájl sorok tisztítása).
     */
    std::string trim(const std::string& s);

    bool startsWith(const std::string& s, const std::string& prefix);

    // ASCII kisbetűsítés (header nevek összevetéséhez)
    std::string toLower(std::string s);

    // Rögzített tizedesjegyes formázás a riport szövegekhez (pl. 111.1)
    std::string formatFixed(double value, int precision);

    std::vector<std::string> split(const std::string& s, char delimiter);
}

#endif
