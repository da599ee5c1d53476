#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "board.h"
#include "coord.h"
#include "direction.h"
#include "piece.h"

enum class CastleSide : std::uint8_t
{
    KingSide = 0,
    QueenSide = 1
};

enum class GameStatus : std::uint8_t
{
    Ongoing,
    Checkmate,
    Stalemate
};

// Largest value either move counter reaches; increments stop there.
constexpr int MaxMoveCounter = 999999;

struct PositionState
{
    Color sideToMove{Color::White};
    // Indexed [side][CastleSide].
    std::array<std::array<bool, 2>, 2> castlingRights{{{true, true}, {true, true}}};
    std::optional<Coord> enPassantTarget{};
    int halfmoveClock{0};
    int fullmoveNumber{1};

    bool operator==(const PositionState& other) const noexcept
    {
        return sideToMove == other.sideToMove &&
               castlingRights == other.castlingRights &&
               enPassantTarget == other.enPassantTarget &&
               halfmoveClock == other.halfmoveClock &&
               fullmoveNumber == other.fullmoveNumber;
    }
};

struct RuleOptions
{
    // Allows castling while the king stands in check.
    bool lenientCastling{false};
};

// The line a pinned piece is restricted to.
struct PinAxis
{
    Direction towardKing{Direction::Up};
    Direction awayFromKing{Direction::Down};

    [[nodiscard]] DirectionSet directions() const noexcept
    {
        return {towardKing, awayFromKing};
    }
};

struct MoveOutcome
{
    bool check{false};
    GameStatus terminal{GameStatus::Ongoing};
    bool pendingPromotion{false};
};

class Position
{
public:
    // Standard starting position.
    Position();

    // King squares are derived from the board; throws std::invalid_argument
    // when a side has more than one king.
    Position(const Board& board, const PositionState& state);

    static Position empty();

    [[nodiscard]] const Board& board() const noexcept { return board_; }
    [[nodiscard]] const PositionState& state() const noexcept { return state_; }
    [[nodiscard]] Color side_to_move() const noexcept { return state_.sideToMove; }
    [[nodiscard]] std::optional<Coord> king_square(Color side) const noexcept;
    [[nodiscard]] bool can_castle(Color side, CastleSide castleSide) const noexcept;
    [[nodiscard]] std::optional<Coord> en_passant_target() const noexcept { return state_.enPassantTarget; }
    [[nodiscard]] int halfmove_clock() const noexcept { return state_.halfmoveClock; }
    [[nodiscard]] int fullmove_number() const noexcept { return state_.fullmoveNumber; }

    [[nodiscard]] const RuleOptions& rules() const noexcept { return rules_; }
    void set_rules(const RuleOptions& rules) noexcept { rules_ = rules; }

    // Attack and pin detection (attacks.cpp).
    [[nodiscard]] bool is_attacked(Coord square, Color bySide) const;
    [[nodiscard]] bool is_in_check(Color side) const;
    [[nodiscard]] std::optional<PinAxis> pin_axis(Coord square) const;

    // Legal destinations for the piece on square, for that piece's colour.
    // Simulates candidates on the board and restores it before returning.
    [[nodiscard]] std::vector<Coord> legal_moves(Coord square);

    [[nodiscard]] bool has_legal_move(Color side);
    [[nodiscard]] GameStatus status();

    // Applies an already validated move. Without a promotion choice a pawn
    // reaching its last rank leaves the turn with the mover and the outcome
    // reports pendingPromotion; complete_promotion finishes that move.
    MoveOutcome apply_move(Coord from, Coord to, std::optional<PieceKind> promotion = std::nullopt);
    MoveOutcome complete_promotion(Coord square, PieceKind kind);

    [[nodiscard]] bool is_promotion_move(Coord from, Coord to) const;

    // Board editing; bypasses legality but keeps king squares and castling
    // rights consistent with the board.
    void place_piece(PieceKind kind, Color color, Coord square);
    void clear_square(Coord square);
    void clear_board();

    bool operator==(const Position& other) const noexcept
    {
        return board_ == other.board_ && state_ == other.state_ && kingSquares_ == other.kingSquares_;
    }

    bool operator!=(const Position& other) const noexcept
    {
        return !(*this == other);
    }

private:
    struct Undo
    {
        Coord from;
        Coord to;
        Square moved;
        Square replaced;
        std::optional<Coord> victimSquare;
        Square victim;
        std::optional<Coord> kingBefore;
    };

    Undo simulate(Coord from, Coord to);
    void revert(const Undo& undo);
    void filter_legal(Coord from, std::vector<Coord>& candidates);
    [[nodiscard]] bool is_en_passant_capture(Coord from, Coord to) const;

    void generate_pawn_moves(Coord from, DirectionSet directions, std::vector<Coord>& moves) const;
    void generate_step_moves(Coord from, DirectionSet directions, std::vector<Coord>& moves) const;
    void generate_slider_moves(Coord from, DirectionSet directions, std::vector<Coord>& moves) const;
    void generate_castling_moves(Coord from, Color side, std::vector<Coord>& moves) const;
    [[nodiscard]] bool castling_path_clear(Coord kingSquare, Direction towardRook, int squares, Color side) const;

    MoveOutcome finish_turn();
    void forget_square(Coord square);

    Board board_;
    PositionState state_;
    std::array<std::optional<Coord>, 2> kingSquares_{};
    RuleOptions rules_{};
};

int home_row(Color side) noexcept;
int pawn_start_row(Color side) noexcept;
int promotion_row(Color side) noexcept;
