#include "game.h"

#include <algorithm>

#include "fen.h"

Game::Game(const RuleOptions& rules)
    : rules_(rules)
{
    position_.set_rules(rules_);
}

void Game::reset()
{
    position_ = Position();
    position_.set_rules(rules_);
    pendingPromotion_.reset();
}

std::vector<Coord> Game::legal_moves(Coord square)
{
    require_on_board(square);

    if (pendingPromotion_ || position_.board().at(square).color() != position_.side_to_move())
    {
        return {};
    }
    return position_.legal_moves(square);
}

std::optional<MoveOutcome> Game::apply_move(Coord from, Coord to, std::optional<PieceKind> promotion)
{
    require_on_board(to);

    const std::vector<Coord> moves = legal_moves(from);
    if (std::find(moves.begin(), moves.end(), to) == moves.end())
    {
        return std::nullopt;
    }

    const bool promoting = position_.is_promotion_move(from, to);
    if (promoting && promotion && !is_promotion_choice(*promotion))
    {
        return std::nullopt;
    }

    const MoveOutcome outcome = position_.apply_move(from, to, promoting ? promotion : std::nullopt);
    if (outcome.pendingPromotion)
    {
        pendingPromotion_ = to;
    }
    return outcome;
}

std::optional<MoveOutcome> Game::promote(PieceKind kind)
{
    if (!pendingPromotion_ || !is_promotion_choice(kind))
    {
        return std::nullopt;
    }

    const Coord square = *pendingPromotion_;
    pendingPromotion_.reset();
    return position_.complete_promotion(square, kind);
}

GameStatus Game::status()
{
    if (pendingPromotion_)
    {
        return GameStatus::Ongoing;
    }
    return position_.status();
}

std::string Game::to_fen() const
{
    return fen::encode(position_);
}

void Game::load_fen(const std::string& text)
{
    Position decoded = fen::decode(text);
    decoded.set_rules(rules_);
    position_ = decoded;
    pendingPromotion_.reset();
}

void Game::place_piece(PieceKind kind, Color color, Coord square)
{
    position_.place_piece(kind, color, square);
    pendingPromotion_.reset();
}

void Game::clear_square(Coord square)
{
    position_.clear_square(square);
    pendingPromotion_.reset();
}

void Game::clear_board()
{
    position_.clear_board();
    pendingPromotion_.reset();
}
