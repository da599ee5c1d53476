#include <cassert>
#include <iostream>
#include <stdexcept>

#include "board.h"
#include "coord.h"
#include "direction.h"
#include "piece.h"

namespace
{
    Coord sq(const char* name)
    {
        return *coord_from_string(name);
    }

    void test_starting_layout()
    {
        const Board board = Board::starting_position();

        assert(board.at(sq("e1")).is(PieceKind::King, Color::White));
        assert(board.at(sq("d1")).is(PieceKind::Queen, Color::White));
        assert(board.at(sq("a1")).is(PieceKind::Rook, Color::White));
        assert(board.at(sq("g1")).is(PieceKind::Knight, Color::White));
        assert(board.at(sq("f1")).is(PieceKind::Bishop, Color::White));
        assert(board.at(sq("e8")).is(PieceKind::King, Color::Black));
        assert(board.at(sq("d8")).is(PieceKind::Queen, Color::Black));
        assert(board.at(sq("h8")).is(PieceKind::Rook, Color::Black));

        for (int x = 0; x < 8; ++x)
        {
            assert(board.at({x, 6}).is(PieceKind::Pawn, Color::White));
            assert(board.at({x, 1}).is(PieceKind::Pawn, Color::Black));
            for (int y = 2; y < 6; ++y)
            {
                assert(board.at({x, y}).is_empty());
                assert(board.at({x, y}).color() == Color::None);
            }
        }
    }

    void test_set_and_clear()
    {
        Board board;
        assert(board == Board{});

        board.set(sq("d4"), Square::make(PieceKind::Knight, Color::Black));
        assert(board.at(sq("d4")).is(PieceKind::Knight, Color::Black));
        assert(board != Board{});

        board.clear(sq("d4"));
        assert(board.at(sq("d4")).is_empty());

        board = Board::starting_position();
        board.clear_all();
        assert(board == Board{});
    }

    void test_off_board_access_throws()
    {
        Board board;
        bool threw = false;
        try
        {
            (void)board.at({8, 0});
        }
        catch (const std::out_of_range&)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            board.set({0, -1}, Square::make(PieceKind::Rook, Color::White));
        }
        catch (const std::out_of_range&)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_coordinate_names()
    {
        assert(coord_to_string({4, 4}) == "e4");
        assert(coord_to_string({0, 7}) == "a1");
        assert(coord_to_string({7, 0}) == "h8");
        assert(rank_of({0, 7}) == 1);

        assert(coord_from_string("e4") == (Coord{4, 4}));
        assert(coord_from_string("E4") == (Coord{4, 4}));
        assert(!coord_from_string("i1"));
        assert(!coord_from_string("a9"));
        assert(!coord_from_string("a10"));
        assert(!coord_from_string(""));
    }

    void test_directions()
    {
        assert(AllDirections.size() == DirectionCount);

        for (Direction direction : AllDirections)
        {
            const Step step = step_of(direction);
            const Step back = step_of(opposite(direction));
            assert(step.dx + back.dx == 0 && step.dy + back.dy == 0);
            assert(opposite(opposite(direction)) == direction);

            const int kinds = (is_orthogonal(direction) ? 1 : 0) +
                              (is_diagonal(direction) ? 1 : 0) +
                              (is_knight_jump(direction) ? 1 : 0);
            assert(kinds == 1);
        }

        assert((Coord{4, 4}.offset(Direction::Up) == Coord{4, 3}));
        assert((Coord{4, 4}.offset(Direction::RightUpUp) == Coord{5, 2}));
        assert((Coord{4, 6}.offset(Direction::Up, 2) == Coord{4, 4}));
    }

    void test_direction_sets()
    {
        const DirectionSet vertical{Direction::Up, Direction::Down};
        assert(vertical.size() == 2);
        assert(vertical.contains(Direction::Up));
        assert(!vertical.contains(Direction::Left));
        assert(DirectionSet{}.empty());

        const DirectionSet pawn = move_set_of(PieceKind::Pawn, Color::White);
        assert(pawn.intersect(vertical) == DirectionSet{Direction::Up});
        assert(move_set_of(PieceKind::Pawn, Color::Black).contains(Direction::DownLeft));
        assert(move_set_of(PieceKind::Knight, Color::White).size() == 8);
        assert(move_set_of(PieceKind::Queen, Color::Black).size() == 8);
        assert(move_set_of(PieceKind::Rook, Color::Black).intersect(
                   move_set_of(PieceKind::Bishop, Color::Black)).empty());
        assert(move_set_of(PieceKind::Empty, Color::None).empty());
    }

    void test_squares_and_letters()
    {
        assert(Square::make(PieceKind::Empty, Color::White) == Square::empty());
        assert(Square::make(PieceKind::King, Color::None) == Square::empty());
        assert(Square{} == Square::empty());

        assert(piece_letter(PieceKind::Knight, Color::White) == 'N');
        assert(piece_letter(PieceKind::Knight, Color::Black) == 'n');
        assert(piece_kind_from_letter('Q') == PieceKind::Queen);
        assert(piece_kind_from_letter('p') == PieceKind::Pawn);
        assert(!piece_kind_from_letter('x'));

        assert(is_promotion_choice(PieceKind::Knight));
        assert(!is_promotion_choice(PieceKind::King));
        assert(!is_promotion_choice(PieceKind::Pawn));

        assert(opposite_color(Color::White) == Color::Black);
        assert(opposite_color(Color::None) == Color::None);
    }
}

int main()
{
    test_starting_layout();
    test_set_and_clear();
    test_off_board_access_throws();
    test_coordinate_names();
    test_directions();
    test_direction_sets();
    test_squares_and_letters();

    std::cout << "All board tests passed.\n";
    return 0;
}
