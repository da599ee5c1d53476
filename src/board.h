#pragma once

#include <array>
#include <cstddef>

#include "coord.h"
#include "piece.h"

// 8x8 grid stored row-major from rank 8 down to rank 1.
class Board
{
public:
    Board() = default;

    static Board starting_position();

    [[nodiscard]] const Square& at(Coord coord) const;
    void set(Coord coord, Square square);
    void clear(Coord coord);
    void clear_all() noexcept;

    bool operator==(const Board& other) const noexcept
    {
        return squares_ == other.squares_;
    }

    bool operator!=(const Board& other) const noexcept
    {
        return !(*this == other);
    }

private:
    static std::size_t index_of(Coord coord);

    std::array<Square, 64> squares_{};
};
