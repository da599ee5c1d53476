#include "position.h"

#include <algorithm>
#include <cstddef>

namespace
{
    constexpr int MaxRayLength = 7;

    Direction forward_of(Color side)
    {
        return side == Color::Black ? Direction::Down : Direction::Up;
    }
}

std::vector<Coord> Position::legal_moves(Coord square)
{
    const Square piece = board_.at(square);
    std::vector<Coord> moves;

    if (piece.is_empty())
    {
        return moves;
    }

    const Color side = piece.color();
    const bool inCheck = is_in_check(side);
    const std::optional<PinAxis> pin = pin_axis(square);

    DirectionSet directions = piece.move_set();
    if (pin)
    {
        directions = directions.intersect(pin->directions());
    }

    switch (piece.piece())
    {
    case PieceKind::Pawn:
        generate_pawn_moves(square, directions, moves);
        if (inCheck)
        {
            filter_legal(square, moves);
        }
        else if (state_.enPassantTarget && is_en_passant_capture(square, *state_.enPassantTarget))
        {
            // Taking en passant empties two squares of one rank, which the
            // pin check cannot see.
            const auto it = std::find(moves.begin(), moves.end(), *state_.enPassantTarget);
            if (it != moves.end())
            {
                const Undo undo = simulate(square, *it);
                const bool exposed = is_in_check(side);
                revert(undo);
                if (exposed)
                {
                    moves.erase(it);
                }
            }
        }
        break;

    case PieceKind::Knight:
        if (pin)
        {
            return moves;
        }
        generate_step_moves(square, directions, moves);
        if (inCheck)
        {
            filter_legal(square, moves);
        }
        break;

    case PieceKind::King:
        generate_step_moves(square, piece.move_set(), moves);
        filter_legal(square, moves);
        generate_castling_moves(square, side, moves);
        break;

    case PieceKind::Queen:
    case PieceKind::Rook:
    case PieceKind::Bishop:
        generate_slider_moves(square, directions, moves);
        if (inCheck)
        {
            filter_legal(square, moves);
        }
        break;

    case PieceKind::Empty:
        break;
    }

    return moves;
}

void Position::generate_pawn_moves(Coord from, DirectionSet directions, std::vector<Coord>& moves) const
{
    const Color side = board_.at(from).color();
    const Direction forward = forward_of(side);

    for (Direction direction : AllDirections)
    {
        if (!directions.contains(direction))
        {
            continue;
        }

        const Coord target = from.offset(direction);
        if (!target.on_board())
        {
            continue;
        }

        const Square& occupant = board_.at(target);

        if (direction == forward)
        {
            if (!occupant.is_empty())
            {
                continue;
            }
            moves.push_back(target);

            if (from.y == pawn_start_row(side))
            {
                const Coord doubleTarget = target.offset(direction);
                if (doubleTarget.on_board() && board_.at(doubleTarget).is_empty())
                {
                    moves.push_back(doubleTarget);
                }
            }
        }
        else if (!occupant.is_empty())
        {
            if (occupant.color() != side)
            {
                moves.push_back(target);
            }
        }
        else if (is_en_passant_capture(from, target))
        {
            moves.push_back(target);
        }
    }
}

void Position::generate_step_moves(Coord from, DirectionSet directions, std::vector<Coord>& moves) const
{
    const Color side = board_.at(from).color();

    for (Direction direction : AllDirections)
    {
        if (!directions.contains(direction))
        {
            continue;
        }

        const Coord target = from.offset(direction);
        if (target.on_board() && board_.at(target).color() != side)
        {
            moves.push_back(target);
        }
    }
}

void Position::generate_slider_moves(Coord from, DirectionSet directions, std::vector<Coord>& moves) const
{
    const Color side = board_.at(from).color();

    for (Direction direction : AllDirections)
    {
        if (!directions.contains(direction))
        {
            continue;
        }

        Coord target = from;
        for (int step = 0; step < MaxRayLength; ++step)
        {
            target = target.offset(direction);
            if (!target.on_board())
            {
                break;
            }

            const Square& occupant = board_.at(target);
            if (occupant.color() == side)
            {
                break;
            }

            moves.push_back(target);
            if (!occupant.is_empty())
            {
                break;
            }
        }
    }
}

void Position::generate_castling_moves(Coord from, Color side, std::vector<Coord>& moves) const
{
    const int row = home_row(side);
    if (from != Coord{4, row})
    {
        return;
    }

    const Color enemy = opposite_color(side);
    if (!rules_.lenientCastling && is_attacked(from, enemy))
    {
        return;
    }

    if (can_castle(side, CastleSide::KingSide) &&
        board_.at({7, row}).is(PieceKind::Rook, side) &&
        castling_path_clear(from, Direction::Right, 2, side))
    {
        moves.push_back({6, row});
    }

    if (can_castle(side, CastleSide::QueenSide) &&
        board_.at({0, row}).is(PieceKind::Rook, side) &&
        castling_path_clear(from, Direction::Left, 3, side))
    {
        moves.push_back({2, row});
    }
}

bool Position::castling_path_clear(Coord kingSquare, Direction towardRook, int squares, Color side) const
{
    const Color enemy = opposite_color(side);

    for (int i = 1; i <= squares; ++i)
    {
        const Coord between = kingSquare.offset(towardRook, i);
        if (!board_.at(between).is_empty() || is_attacked(between, enemy))
        {
            return false;
        }
    }
    return true;
}

void Position::filter_legal(Coord from, std::vector<Coord>& candidates)
{
    const Color side = board_.at(from).color();

    std::size_t kept = 0;
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        const Undo undo = simulate(from, candidates[i]);
        const bool exposed = is_in_check(side);
        revert(undo);

        if (!exposed)
        {
            candidates[kept++] = candidates[i];
        }
    }
    candidates.resize(kept);
}

// The pawn that double-stepped must still stand beside the capturing pawn.
bool Position::is_en_passant_capture(Coord from, Coord to) const
{
    const Square& mover = board_.at(from);
    if (mover.piece() != PieceKind::Pawn ||
        !state_.enPassantTarget || *state_.enPassantTarget != to ||
        to.x == from.x || !board_.at(to).is_empty())
    {
        return false;
    }

    const Coord victim{to.x, from.y};
    return victim.on_board() && board_.at(victim).is(PieceKind::Pawn, opposite_color(mover.color()));
}

Position::Undo Position::simulate(Coord from, Coord to)
{
    Undo undo{from, to, board_.at(from), board_.at(to), std::nullopt, Square::empty(), std::nullopt};

    const Color side = undo.moved.color();
    undo.kingBefore = kingSquares_[side_index(side)];

    if (is_en_passant_capture(from, to))
    {
        const Coord victim{to.x, from.y};
        undo.victimSquare = victim;
        undo.victim = board_.at(victim);
        board_.clear(victim);
    }

    if (undo.moved.piece() == PieceKind::King)
    {
        kingSquares_[side_index(side)] = to;
    }

    board_.clear(from);
    board_.set(to, undo.moved);
    return undo;
}

void Position::revert(const Undo& undo)
{
    board_.set(undo.to, undo.replaced);
    board_.set(undo.from, undo.moved);

    if (undo.victimSquare)
    {
        board_.set(*undo.victimSquare, undo.victim);
    }

    kingSquares_[side_index(undo.moved.color())] = undo.kingBefore;
}
