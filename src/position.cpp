#include "position.h"

#include <cstdlib>
#include <stdexcept>

namespace
{
    std::size_t castle_index(CastleSide castleSide)
    {
        return static_cast<std::size_t>(castleSide);
    }

    std::optional<CastleSide> corner_castle_side(Coord square, Color side)
    {
        if (square.y != home_row(side))
        {
            return std::nullopt;
        }
        if (square.x == 7)
        {
            return CastleSide::KingSide;
        }
        if (square.x == 0)
        {
            return CastleSide::QueenSide;
        }
        return std::nullopt;
    }
}

int home_row(Color side) noexcept
{
    return side == Color::Black ? 0 : 7;
}

int pawn_start_row(Color side) noexcept
{
    return side == Color::Black ? 1 : 6;
}

int promotion_row(Color side) noexcept
{
    return side == Color::Black ? 7 : 0;
}

Position::Position()
    : Position(Board::starting_position(), PositionState{})
{
}

Position::Position(const Board& board, const PositionState& state)
    : board_(board),
      state_(state)
{
    for (int y = 0; y < 8; ++y)
    {
        for (int x = 0; x < 8; ++x)
        {
            const Square& square = board_.at({x, y});
            if (square.piece() != PieceKind::King)
            {
                continue;
            }

            std::optional<Coord>& king = kingSquares_[side_index(square.color())];
            if (king)
            {
                throw std::invalid_argument("board holds more than one king of a colour");
            }
            king = Coord{x, y};
        }
    }
}

Position Position::empty()
{
    PositionState state;
    state.castlingRights = {{{false, false}, {false, false}}};
    return Position(Board{}, state);
}

std::optional<Coord> Position::king_square(Color side) const noexcept
{
    if (side == Color::None)
    {
        return std::nullopt;
    }
    return kingSquares_[side_index(side)];
}

bool Position::can_castle(Color side, CastleSide castleSide) const noexcept
{
    if (side == Color::None)
    {
        return false;
    }
    return state_.castlingRights[side_index(side)][castle_index(castleSide)];
}

bool Position::has_legal_move(Color side)
{
    for (int y = 0; y < 8; ++y)
    {
        for (int x = 0; x < 8; ++x)
        {
            const Coord square{x, y};
            if (board_.at(square).color() == side && !legal_moves(square).empty())
            {
                return true;
            }
        }
    }
    return false;
}

GameStatus Position::status()
{
    const Color side = state_.sideToMove;
    if (has_legal_move(side))
    {
        return GameStatus::Ongoing;
    }
    return is_in_check(side) ? GameStatus::Checkmate : GameStatus::Stalemate;
}

bool Position::is_promotion_move(Coord from, Coord to) const
{
    const Square& piece = board_.at(from);
    require_on_board(to);
    return piece.piece() == PieceKind::Pawn && to.y == promotion_row(piece.color());
}

MoveOutcome Position::apply_move(Coord from, Coord to, std::optional<PieceKind> promotion)
{
    const Square moving = board_.at(from);
    const Square captured = board_.at(to);

    if (moving.is_empty())
    {
        throw std::invalid_argument("no piece to move on " + coord_to_string(from));
    }
    if (promotion && !is_promotion_choice(*promotion))
    {
        throw std::invalid_argument("pawns promote to a queen, rook, bishop or knight");
    }

    const Color side = moving.color();
    const std::size_t us = side_index(side);
    const bool isPawn = moving.piece() == PieceKind::Pawn;
    const bool isKing = moving.piece() == PieceKind::King;
    const bool enPassant = is_en_passant_capture(from, to);

    if (isPawn || !captured.is_empty())
    {
        state_.halfmoveClock = 0;
    }
    else if (state_.halfmoveClock < MaxMoveCounter)
    {
        ++state_.halfmoveClock;
    }

    if (enPassant)
    {
        const int behind = side == Color::White ? 1 : -1;
        board_.clear({to.x, to.y + behind});
    }

    state_.enPassantTarget.reset();
    if (isPawn && std::abs(to.y - from.y) == 2)
    {
        state_.enPassantTarget = Coord{from.x, (from.y + to.y) / 2};
    }

    if (isKing)
    {
        state_.castlingRights[us] = {false, false};
    }
    else if (moving.piece() == PieceKind::Rook)
    {
        if (const std::optional<CastleSide> corner = corner_castle_side(from, side))
        {
            state_.castlingRights[us][castle_index(*corner)] = false;
        }
    }

    if (captured.piece() == PieceKind::Rook)
    {
        if (const std::optional<CastleSide> corner = corner_castle_side(to, captured.color()))
        {
            state_.castlingRights[side_index(captured.color())][castle_index(*corner)] = false;
        }
    }
    else if (captured.piece() == PieceKind::King)
    {
        kingSquares_[side_index(captured.color())].reset();
    }

    if (isKing && std::abs(to.x - from.x) == 2)
    {
        const bool kingSide = to.x > from.x;
        const Coord rookFrom{kingSide ? 7 : 0, from.y};
        const Coord rookTo{kingSide ? to.x - 1 : to.x + 1, from.y};
        board_.set(rookTo, Square::make(PieceKind::Rook, side));
        board_.clear(rookFrom);
    }

    if (isKing)
    {
        kingSquares_[us] = to;
    }

    board_.set(to, moving);
    board_.clear(from);

    if (isPawn && to.y == promotion_row(side))
    {
        if (!promotion)
        {
            MoveOutcome outcome;
            outcome.pendingPromotion = true;
            return outcome;
        }
        return complete_promotion(to, *promotion);
    }

    return finish_turn();
}

MoveOutcome Position::complete_promotion(Coord square, PieceKind kind)
{
    const Square& pawn = board_.at(square);

    if (!is_promotion_choice(kind))
    {
        throw std::invalid_argument("pawns promote to a queen, rook, bishop or knight");
    }
    if (pawn.piece() != PieceKind::Pawn ||
        pawn.color() != state_.sideToMove ||
        square.y != promotion_row(pawn.color()))
    {
        throw std::logic_error("no pawn awaiting promotion on " + coord_to_string(square));
    }

    board_.set(square, Square::make(kind, pawn.color()));
    return finish_turn();
}

MoveOutcome Position::finish_turn()
{
    if (state_.sideToMove == Color::Black && state_.fullmoveNumber < MaxMoveCounter)
    {
        ++state_.fullmoveNumber;
    }
    state_.sideToMove = opposite_color(state_.sideToMove);

    MoveOutcome outcome;
    outcome.check = is_in_check(state_.sideToMove);
    outcome.terminal = status();
    return outcome;
}

void Position::place_piece(PieceKind kind, Color color, Coord square)
{
    if (kind == PieceKind::Empty || color == Color::None)
    {
        clear_square(square);
        return;
    }

    forget_square(square);

    if (kind == PieceKind::King)
    {
        std::optional<Coord>& king = kingSquares_[side_index(color)];
        if (king && *king != square)
        {
            board_.clear(*king);
        }
        king = square;
        state_.castlingRights[side_index(color)] = {false, false};
    }

    board_.set(square, Square::make(kind, color));
    state_.enPassantTarget.reset();
}

void Position::clear_square(Coord square)
{
    forget_square(square);
    board_.clear(square);
    state_.enPassantTarget.reset();
}

void Position::clear_board()
{
    board_.clear_all();
    kingSquares_ = {};
    state_.castlingRights = {{{false, false}, {false, false}}};
    state_.enPassantTarget.reset();
}

void Position::forget_square(Coord square)
{
    const Square old = board_.at(square);

    if (old.piece() == PieceKind::King)
    {
        kingSquares_[side_index(old.color())].reset();
    }
    else if (old.piece() == PieceKind::Rook)
    {
        if (const std::optional<CastleSide> corner = corner_castle_side(square, old.color()))
        {
            state_.castlingRights[side_index(old.color())][castle_index(*corner)] = false;
        }
    }
}
