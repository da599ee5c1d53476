#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "direction.h"

enum class Color : std::uint8_t
{
    White = 0,
    Black = 1,
    None = 2
};

enum class PieceKind : std::uint8_t
{
    King,
    Queen,
    Rook,
    Bishop,
    Knight,
    Pawn,
    Empty
};

inline Color opposite_color(Color color) noexcept
{
    switch (color)
    {
    case Color::White: return Color::Black;
    case Color::Black: return Color::White;
    case Color::None:  return Color::None;
    }
    return Color::None;
}

// Index into per-side arrays; only valid for White and Black.
inline std::size_t side_index(Color color) noexcept
{
    return color == Color::Black ? 1 : 0;
}

DirectionSet move_set_of(PieceKind kind, Color color) noexcept;

bool is_promotion_choice(PieceKind kind) noexcept;

char piece_letter(PieceKind kind, Color color) noexcept;
std::optional<PieceKind> piece_kind_from_letter(char letter) noexcept;

class Square
{
public:
    Square() noexcept = default;

    static Square empty() noexcept
    {
        return Square{};
    }

    // An Empty kind always yields the colourless empty square.
    static Square make(PieceKind kind, Color color) noexcept
    {
        if (kind == PieceKind::Empty || color == Color::None)
        {
            return Square{};
        }
        return Square{kind, color};
    }

    [[nodiscard]] PieceKind piece() const noexcept
    {
        return piece_;
    }

    [[nodiscard]] Color color() const noexcept
    {
        return color_;
    }

    [[nodiscard]] bool is_empty() const noexcept
    {
        return piece_ == PieceKind::Empty;
    }

    [[nodiscard]] bool is(PieceKind kind, Color color) const noexcept
    {
        return piece_ == kind && color_ == color;
    }

    [[nodiscard]] DirectionSet move_set() const noexcept
    {
        return move_set_of(piece_, color_);
    }

    bool operator==(const Square& other) const noexcept
    {
        return piece_ == other.piece_ && color_ == other.color_;
    }

    bool operator!=(const Square& other) const noexcept
    {
        return !(*this == other);
    }

private:
    Square(PieceKind kind, Color color) noexcept
        : piece_(kind),
          color_(color)
    {
    }

    PieceKind piece_{PieceKind::Empty};
    Color color_{Color::None};
};
