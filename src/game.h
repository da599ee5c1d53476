#pragma once

#include <optional>
#include <string>
#include <vector>

#include "coord.h"
#include "piece.h"
#include "position.h"

// A game as seen by the front-end: the position plus the promotion that may
// be pending between a pawn's arrival and the choice of its new piece.
class Game
{
public:
    explicit Game(const RuleOptions& rules = {});

    void reset();

    // Empty for an empty square, a piece of the side not to move, or while a
    // promotion is pending.
    [[nodiscard]] std::vector<Coord> legal_moves(Coord square);

    // std::nullopt rejects the request without touching the game.
    std::optional<MoveOutcome> apply_move(Coord from, Coord to, std::optional<PieceKind> promotion = std::nullopt);
    std::optional<MoveOutcome> promote(PieceKind kind);

    [[nodiscard]] bool promotion_pending() const noexcept { return pendingPromotion_.has_value(); }
    [[nodiscard]] bool is_in_check(Color side) const { return position_.is_in_check(side); }
    [[nodiscard]] GameStatus status();

    [[nodiscard]] std::string to_fen() const;
    // Throws FenError and leaves the game untouched on malformed text.
    void load_fen(const std::string& text);

    void place_piece(PieceKind kind, Color color, Coord square);
    void clear_square(Coord square);
    void clear_board();

    [[nodiscard]] const Position& position() const noexcept { return position_; }
    [[nodiscard]] Color side_to_move() const noexcept { return position_.side_to_move(); }
    [[nodiscard]] const RuleOptions& rules() const noexcept { return rules_; }

private:
    RuleOptions rules_;
    Position position_;
    std::optional<Coord> pendingPromotion_;
};
