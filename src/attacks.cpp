#include "position.h"

namespace
{
    constexpr int MaxRayLength = 7;

    // The diagonals along which a pawn of bySide is found when looking outward
    // from the square it attacks.
    bool is_pawn_capture_ray(Direction direction, Color bySide)
    {
        if (bySide == Color::White)
        {
            return direction == Direction::DownLeft || direction == Direction::DownRight;
        }
        return direction == Direction::UpLeft || direction == Direction::UpRight;
    }

    bool ray_hits_attacker(const Board& board, Coord square, Direction direction, Color bySide)
    {
        Coord current = square;
        for (int step = 0; step < MaxRayLength; ++step)
        {
            current = current.offset(direction);
            if (!current.on_board())
            {
                return false;
            }

            const Square& target = board.at(current);
            if (target.is_empty())
            {
                continue;
            }
            if (target.color() != bySide)
            {
                return false;
            }

            switch (target.piece())
            {
            case PieceKind::King:
            case PieceKind::Knight:
                return step == 0 && target.move_set().contains(direction);
            case PieceKind::Pawn:
                return step == 0 && is_pawn_capture_ray(direction, bySide);
            case PieceKind::Queen:
            case PieceKind::Rook:
            case PieceKind::Bishop:
                return target.move_set().contains(direction);
            case PieceKind::Empty:
                break;
            }
            return false;
        }
        return false;
    }

    // Orthogonal or diagonal direction leading from one square to another on
    // the same line, if they share one.
    std::optional<Direction> direction_between(Coord from, Coord to)
    {
        const int dx = to.x - from.x;
        const int dy = to.y - from.y;

        if (dx == 0 && dy == 0)
        {
            return std::nullopt;
        }
        if (dx == 0)
        {
            return dy < 0 ? Direction::Up : Direction::Down;
        }
        if (dy == 0)
        {
            return dx < 0 ? Direction::Left : Direction::Right;
        }
        if (dx == dy || dx == -dy)
        {
            if (dy < 0)
            {
                return dx < 0 ? Direction::UpLeft : Direction::UpRight;
            }
            return dx < 0 ? Direction::DownLeft : Direction::DownRight;
        }
        return std::nullopt;
    }
}

bool Position::is_attacked(Coord square, Color bySide) const
{
    require_on_board(square);

    for (Direction direction : AllDirections)
    {
        if (ray_hits_attacker(board_, square, direction, bySide))
        {
            return true;
        }
    }
    return false;
}

bool Position::is_in_check(Color side) const
{
    const std::optional<Coord> king = king_square(side);
    if (!king)
    {
        return false;
    }
    return is_attacked(*king, opposite_color(side));
}

std::optional<PinAxis> Position::pin_axis(Coord square) const
{
    const Square& piece = board_.at(square);
    if (piece.is_empty() || piece.piece() == PieceKind::King)
    {
        return std::nullopt;
    }

    const std::optional<Coord> king = king_square(piece.color());
    if (!king)
    {
        return std::nullopt;
    }

    const std::optional<Direction> towardKing = direction_between(square, *king);
    if (!towardKing)
    {
        return std::nullopt;
    }
    const Direction awayFromKing = opposite(*towardKing);

    Coord current = square.offset(*towardKing);
    while (current != *king)
    {
        if (!current.on_board() || !board_.at(current).is_empty())
        {
            return std::nullopt;
        }
        current = current.offset(*towardKing);
    }

    current = square.offset(awayFromKing);
    while (current.on_board())
    {
        const Square& target = board_.at(current);
        if (target.is_empty())
        {
            current = current.offset(awayFromKing);
            continue;
        }

        const bool enemySlider =
            target.color() == opposite_color(piece.color()) &&
            (target.piece() == PieceKind::Queen ||
             target.piece() == PieceKind::Rook ||
             target.piece() == PieceKind::Bishop);

        if (enemySlider && target.move_set().contains(awayFromKing))
        {
            return PinAxis{*towardKing, awayFromKing};
        }
        return std::nullopt;
    }

    return std::nullopt;
}
