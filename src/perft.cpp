#include "perft.h"

#include <array>
#include <vector>

namespace
{
    constexpr std::array<PieceKind, 4> PromotionPieces{
        PieceKind::Queen, PieceKind::Rook, PieceKind::Bishop, PieceKind::Knight};
}

std::uint64_t perft(const Position& position, int depth)
{
    if (depth == 0)
    {
        return 1;
    }

    // legal_moves simulates on the board, so generation runs on a scratch copy.
    Position scratch = position;
    const Color side = scratch.side_to_move();
    std::uint64_t nodes = 0;

    for (int y = 0; y < 8; ++y)
    {
        for (int x = 0; x < 8; ++x)
        {
            const Coord from{x, y};
            if (scratch.board().at(from).color() != side)
            {
                continue;
            }

            const std::vector<Coord> targets = scratch.legal_moves(from);
            for (const Coord& to : targets)
            {
                if (scratch.is_promotion_move(from, to))
                {
                    for (PieceKind piece : PromotionPieces)
                    {
                        Position child = scratch;
                        child.apply_move(from, to, piece);
                        nodes += perft(child, depth - 1);
                    }
                    continue;
                }

                Position child = scratch;
                child.apply_move(from, to);
                nodes += perft(child, depth - 1);
            }
        }
    }

    return nodes;
}
