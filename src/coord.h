#pragma once

#include <optional>
#include <string>

#include "direction.h"

// x is the file (0 = a), y is the board row (0 = rank 8, 7 = rank 1).
struct Coord
{
    int x{0};
    int y{0};

    [[nodiscard]] bool on_board() const noexcept
    {
        return x >= 0 && x < 8 && y >= 0 && y < 8;
    }

    [[nodiscard]] Coord offset(Direction direction, int steps = 1) const noexcept
    {
        const Step step = step_of(direction);
        return {x + step.dx * steps, y + step.dy * steps};
    }

    bool operator==(const Coord& other) const noexcept
    {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Coord& other) const noexcept
    {
        return !(*this == other);
    }
};

// Throws std::out_of_range for coordinates outside the 8x8 board.
void require_on_board(Coord coord);

int rank_of(Coord coord) noexcept;
std::string coord_to_string(Coord coord);
std::optional<Coord> coord_from_string(const std::string& name);
