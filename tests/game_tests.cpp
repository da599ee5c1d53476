#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "fen.h"
#include "game.h"

namespace
{
    Coord sq(const char* name)
    {
        return *coord_from_string(name);
    }

    MoveOutcome play(Game& game, const char* from, const char* to)
    {
        const std::optional<MoveOutcome> outcome = game.apply_move(sq(from), sq(to));
        assert(outcome);
        return *outcome;
    }

    void test_en_passant_capture()
    {
        Game game;
        play(game, "e2", "e4");
        play(game, "a7", "a6");
        play(game, "e4", "e5");
        play(game, "d7", "d5");

        assert(game.to_fen() == "rnbqkbnr/1pp1pppp/p7/3pP3/8/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 3");
        assert(game.position().en_passant_target() == sq("d6"));

        const std::vector<Coord> moves = game.legal_moves(sq("e5"));
        assert(std::find(moves.begin(), moves.end(), sq("d6")) != moves.end());

        play(game, "e5", "d6");
        assert(game.position().board().at(sq("d5")).is_empty());
        assert(game.position().board().at(sq("d6")).is(PieceKind::Pawn, Color::White));
        assert(!game.position().en_passant_target());
        assert(game.position().halfmove_clock() == 0);
    }

    void test_en_passant_window_closes()
    {
        Game game;
        play(game, "e2", "e4");
        play(game, "a7", "a6");
        play(game, "e4", "e5");
        play(game, "d7", "d5");
        play(game, "g1", "f3");
        play(game, "a6", "a5");

        const std::vector<Coord> moves = game.legal_moves(sq("e5"));
        assert(std::find(moves.begin(), moves.end(), sq("d6")) == moves.end());
        assert(!game.apply_move(sq("e5"), sq("d6")));
    }

    void test_castling_moves_the_rook()
    {
        Game game;
        game.load_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");

        play(game, "e1", "g1");
        const Position& afterWhite = game.position();
        assert(afterWhite.board().at(sq("g1")).is(PieceKind::King, Color::White));
        assert(afterWhite.board().at(sq("f1")).is(PieceKind::Rook, Color::White));
        assert(afterWhite.board().at(sq("h1")).is_empty());
        assert(afterWhite.board().at(sq("e1")).is_empty());
        assert(afterWhite.king_square(Color::White) == sq("g1"));
        assert(!afterWhite.can_castle(Color::White, CastleSide::KingSide));
        assert(!afterWhite.can_castle(Color::White, CastleSide::QueenSide));
        assert(afterWhite.can_castle(Color::Black, CastleSide::KingSide));
        assert(game.to_fen() == "r3k2r/8/8/8/8/8/8/R4RK1 b kq - 1 1");

        play(game, "e8", "c8");
        assert(game.to_fen() == "2kr3r/8/8/8/8/8/8/R4RK1 w - - 2 2");
    }

    void test_rook_moves_clear_rights()
    {
        Game game;
        game.load_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");

        play(game, "a1", "b1");
        assert(!game.position().can_castle(Color::White, CastleSide::QueenSide));
        assert(game.position().can_castle(Color::White, CastleSide::KingSide));

        // A rook that never stood on its corner leaves the rights alone.
        game.load_fen("r3k2r/8/8/8/8/8/R7/4K2R w Kkq - 0 1");
        play(game, "a2", "a3");
        assert(game.position().can_castle(Color::White, CastleSide::KingSide));
    }

    void test_capturing_a_corner_rook_clears_its_right()
    {
        Game game;
        game.load_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");

        const MoveOutcome outcome = play(game, "h1", "h8");
        assert(outcome.check);
        assert(!game.position().can_castle(Color::White, CastleSide::KingSide));
        assert(!game.position().can_castle(Color::Black, CastleSide::KingSide));
        assert(game.position().can_castle(Color::Black, CastleSide::QueenSide));
        assert(game.position().halfmove_clock() == 0);
    }

    void test_fools_mate()
    {
        Game game;
        play(game, "f2", "f3");
        play(game, "e7", "e5");
        play(game, "g2", "g4");
        const MoveOutcome outcome = play(game, "d8", "h4");

        assert(outcome.check);
        assert(outcome.terminal == GameStatus::Checkmate);
        assert(!outcome.pendingPromotion);
        assert(game.status() == GameStatus::Checkmate);
        assert(game.is_in_check(Color::White));
    }

    void test_queen_mate_and_stalemate()
    {
        Game mate;
        mate.load_fen("7k/5Q2/6K1/8/8/8/8/8 w - - 0 1");
        const MoveOutcome mated = play(mate, "f7", "g7");
        assert(mated.check);
        assert(mated.terminal == GameStatus::Checkmate);

        Game stale;
        stale.load_fen("k7/8/2Q5/8/8/8/8/7K w - - 0 1");
        const MoveOutcome stalled = play(stale, "c6", "b6");
        assert(!stalled.check);
        assert(stalled.terminal == GameStatus::Stalemate);
        assert(stale.status() == GameStatus::Stalemate);

        Game loaded;
        loaded.load_fen("k7/8/1Q6/8/8/8/8/7K b - - 0 1");
        assert(loaded.status() == GameStatus::Stalemate);
    }

    void test_clocks()
    {
        Game game;
        play(game, "g1", "f3");
        assert(game.position().halfmove_clock() == 1);
        assert(game.position().fullmove_number() == 1);

        play(game, "g8", "f6");
        assert(game.position().halfmove_clock() == 2);
        assert(game.position().fullmove_number() == 2);

        play(game, "e2", "e4");
        assert(game.position().halfmove_clock() == 0);
        assert(game.position().fullmove_number() == 2);

        play(game, "f6", "e4");
        assert(game.position().halfmove_clock() == 0);
        assert(game.position().fullmove_number() == 3);
    }

    void test_promotion_waits_for_a_choice()
    {
        Game game;
        game.load_fen("8/4P3/8/8/8/8/k7/4K3 w - - 0 1");

        const MoveOutcome pending = play(game, "e7", "e8");
        assert(pending.pendingPromotion);
        assert(game.promotion_pending());
        assert(game.side_to_move() == Color::White);
        assert(game.status() == GameStatus::Ongoing);
        assert(game.legal_moves(sq("e1")).empty());
        assert(!game.apply_move(sq("e1"), sq("d1")));

        assert(!game.promote(PieceKind::King));
        assert(!game.promote(PieceKind::Pawn));
        assert(game.promotion_pending());

        const std::optional<MoveOutcome> done = game.promote(PieceKind::Queen);
        assert(done);
        assert(!done->pendingPromotion);
        assert(!game.promotion_pending());
        assert(game.position().board().at(sq("e8")).is(PieceKind::Queen, Color::White));
        assert(game.side_to_move() == Color::Black);
        assert(!game.promote(PieceKind::Queen));
    }

    void test_promotion_with_choice()
    {
        Game game;
        game.load_fen("8/4P3/8/8/8/8/k7/4K3 w - - 0 1");

        assert(!game.apply_move(sq("e7"), sq("e8"), PieceKind::King));
        assert(game.position().board().at(sq("e7")).is(PieceKind::Pawn, Color::White));

        const std::optional<MoveOutcome> outcome = game.apply_move(sq("e7"), sq("e8"), PieceKind::Knight);
        assert(outcome);
        assert(!outcome->pendingPromotion);
        assert(game.position().board().at(sq("e8")).is(PieceKind::Knight, Color::White));
        assert(game.to_fen() == "4N3/8/8/8/8/8/k7/4K3 b - - 0 1");
    }

    void test_illegal_selections_change_nothing()
    {
        Game game;
        const std::string before = game.to_fen();

        assert(!game.apply_move(sq("e2"), sq("e5")));
        assert(!game.apply_move(sq("e7"), sq("e5")));
        assert(!game.apply_move(sq("e4"), sq("e5")));
        assert(game.legal_moves(sq("e7")).empty());
        assert(game.legal_moves(sq("e4")).empty());
        assert(game.to_fen() == before);

        bool threw = false;
        try
        {
            (void)game.legal_moves({8, 0});
        }
        catch (const std::out_of_range&)
        {
            threw = true;
        }
        assert(threw);
        assert(game.to_fen() == before);
    }

    void test_board_editing()
    {
        Game game;

        game.place_piece(PieceKind::King, Color::White, sq("d4"));
        assert(game.position().board().at(sq("e1")).is_empty());
        assert(game.position().king_square(Color::White) == sq("d4"));
        assert(!game.position().can_castle(Color::White, CastleSide::KingSide));
        assert(!game.position().can_castle(Color::White, CastleSide::QueenSide));
        assert(game.position().can_castle(Color::Black, CastleSide::QueenSide));

        game.clear_square(sq("a8"));
        assert(!game.position().can_castle(Color::Black, CastleSide::QueenSide));
        assert(game.position().can_castle(Color::Black, CastleSide::KingSide));

        game.place_piece(PieceKind::Queen, Color::White, sq("e8"));
        assert(!game.position().king_square(Color::Black));
        assert(!game.is_in_check(Color::Black));

        game.clear_board();
        assert(game.to_fen() == "8/8/8/8/8/8/8/8 w - - 0 1");
        assert(!game.position().king_square(Color::White));

        game.reset();
        assert(game.to_fen() == fen::StartingPosition);
    }

    void test_editing_drops_pending_promotion()
    {
        Game game;
        game.load_fen("8/4P3/8/8/8/8/k7/4K3 w - - 0 1");
        play(game, "e7", "e8");
        assert(game.promotion_pending());

        game.place_piece(PieceKind::Rook, Color::Black, sq("h8"));
        assert(!game.promotion_pending());
        assert(!game.promote(PieceKind::Queen));
    }

    void test_lenient_rules_reach_the_position()
    {
        RuleOptions rules;
        rules.lenientCastling = true;
        Game game(rules);
        game.load_fen("4r2k/8/8/8/8/8/8/R3K2R w KQ - 0 1");

        const std::vector<Coord> moves = game.legal_moves(sq("e1"));
        assert(std::find(moves.begin(), moves.end(), sq("g1")) != moves.end());

        Game strict;
        strict.load_fen("4r2k/8/8/8/8/8/8/R3K2R w KQ - 0 1");
        const std::vector<Coord> strictMoves = strict.legal_moves(sq("e1"));
        assert(std::find(strictMoves.begin(), strictMoves.end(), sq("g1")) == strictMoves.end());
    }
}

int main()
{
    test_en_passant_capture();
    test_en_passant_window_closes();
    test_castling_moves_the_rook();
    test_rook_moves_clear_rights();
    test_capturing_a_corner_rook_clears_its_right();
    test_fools_mate();
    test_queen_mate_and_stalemate();
    test_clocks();
    test_promotion_waits_for_a_choice();
    test_promotion_with_choice();
    test_illegal_selections_change_nothing();
    test_board_editing();
    test_editing_drops_pending_promotion();
    test_lenient_rules_reach_the_position();

    std::cout << "All game tests passed.\n";
    return 0;
}
