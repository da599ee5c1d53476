#include "coord.h"

#include <cctype>
#include <stdexcept>

void require_on_board(Coord coord)
{
    if (!coord.on_board())
    {
        throw std::out_of_range("coordinate (" + std::to_string(coord.x) + ", " +
                                std::to_string(coord.y) + ") is off the board");
    }
}

int rank_of(Coord coord) noexcept
{
    return 8 - coord.y;
}

std::string coord_to_string(Coord coord)
{
    if (!coord.on_board())
    {
        return {};
    }

    std::string result;
    result += static_cast<char>('a' + coord.x);
    result += static_cast<char>('0' + rank_of(coord));
    return result;
}

std::optional<Coord> coord_from_string(const std::string& name)
{
    if (name.size() != 2)
    {
        return std::nullopt;
    }

    const char fileChar = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
    const char rankChar = name[1];

    if (fileChar < 'a' || fileChar > 'h' || rankChar < '1' || rankChar > '8')
    {
        return std::nullopt;
    }

    return Coord{fileChar - 'a', 8 - (rankChar - '0')};
}
