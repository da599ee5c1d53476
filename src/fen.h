#pragma once

#include <stdexcept>
#include <string>

#include "position.h"

class FenError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

namespace fen
{
    extern const std::string StartingPosition;

    std::string encode(const Position& position);

    // Throws FenError when the text is not a well-formed six-field FEN.
    Position decode(const std::string& text);
}
