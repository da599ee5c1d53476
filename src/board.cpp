#include "board.h"

namespace
{
    constexpr PieceKind BackRank[8] = {
        PieceKind::Rook, PieceKind::Knight, PieceKind::Bishop, PieceKind::Queen,
        PieceKind::King, PieceKind::Bishop, PieceKind::Knight, PieceKind::Rook};
}

Board Board::starting_position()
{
    Board board;

    for (int x = 0; x < 8; ++x)
    {
        board.set({x, 0}, Square::make(BackRank[x], Color::Black));
        board.set({x, 1}, Square::make(PieceKind::Pawn, Color::Black));
        board.set({x, 6}, Square::make(PieceKind::Pawn, Color::White));
        board.set({x, 7}, Square::make(BackRank[x], Color::White));
    }

    return board;
}

const Square& Board::at(Coord coord) const
{
    return squares_[index_of(coord)];
}

void Board::set(Coord coord, Square square)
{
    squares_[index_of(coord)] = square;
}

void Board::clear(Coord coord)
{
    squares_[index_of(coord)] = Square::empty();
}

void Board::clear_all() noexcept
{
    squares_.fill(Square::empty());
}

std::size_t Board::index_of(Coord coord)
{
    require_on_board(coord);
    return static_cast<std::size_t>(coord.y * 8 + coord.x);
}
