#include <cassert>
#include <cstdint>
#include <iostream>

#include "fen.h"
#include "perft.h"

namespace
{
    void test_start_position()
    {
        const Position start;
        assert(perft(start, 0) == 1ULL);
        assert(perft(start, 1) == 20ULL);
        assert(perft(start, 2) == 400ULL);
        assert(perft(start, 3) == 8902ULL);
    }

    void test_rook_and_pawn_endgame()
    {
        const Position position = fen::decode("8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1");
        assert(perft(position, 1) == 14ULL);
        assert(perft(position, 2) == 191ULL);
        assert(perft(position, 3) == 2812ULL);
    }

    void test_promotions_count_each_piece()
    {
        const Position position = fen::decode("8/P7/8/8/8/8/8/k6K w - - 0 1");
        assert(perft(position, 1) == 7ULL);
    }

    void test_perft_leaves_position_untouched()
    {
        const Position position = fen::decode("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
        const Position copy = position;
        (void)perft(position, 2);
        assert(position == copy);
    }
}

int main()
{
    test_start_position();
    test_rook_and_pawn_endgame();
    test_promotions_count_each_piece();
    test_perft_leaves_position_untouched();

    std::cout << "All perft tests passed.\n";
    return 0;
}
