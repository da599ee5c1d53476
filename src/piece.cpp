#include "piece.h"

#include <cctype>

namespace
{
    const DirectionSet SliderDirections{
        Direction::Up, Direction::Down, Direction::Left, Direction::Right,
        Direction::UpRight, Direction::UpLeft, Direction::DownRight, Direction::DownLeft};

    const DirectionSet RookDirections{
        Direction::Up, Direction::Down, Direction::Left, Direction::Right};

    const DirectionSet BishopDirections{
        Direction::UpRight, Direction::UpLeft, Direction::DownRight, Direction::DownLeft};

    const DirectionSet KnightDirections{
        Direction::RightRightUp, Direction::RightUpUp, Direction::RightRightDown, Direction::RightDownDown,
        Direction::LeftLeftUp, Direction::LeftUpUp, Direction::LeftLeftDown, Direction::LeftDownDown};

    const DirectionSet WhitePawnDirections{Direction::Up, Direction::UpLeft, Direction::UpRight};
    const DirectionSet BlackPawnDirections{Direction::Down, Direction::DownLeft, Direction::DownRight};
}

DirectionSet move_set_of(PieceKind kind, Color color) noexcept
{
    switch (kind)
    {
    case PieceKind::King:
    case PieceKind::Queen:  return SliderDirections;
    case PieceKind::Rook:   return RookDirections;
    case PieceKind::Bishop: return BishopDirections;
    case PieceKind::Knight: return KnightDirections;
    case PieceKind::Pawn:
        return color == Color::Black ? BlackPawnDirections : WhitePawnDirections;
    case PieceKind::Empty:  return {};
    }
    return {};
}

bool is_promotion_choice(PieceKind kind) noexcept
{
    switch (kind)
    {
    case PieceKind::Queen:
    case PieceKind::Rook:
    case PieceKind::Bishop:
    case PieceKind::Knight:
        return true;
    case PieceKind::King:
    case PieceKind::Pawn:
    case PieceKind::Empty:
        return false;
    }
    return false;
}

char piece_letter(PieceKind kind, Color color) noexcept
{
    char letter = ' ';
    switch (kind)
    {
    case PieceKind::King:   letter = 'k'; break;
    case PieceKind::Queen:  letter = 'q'; break;
    case PieceKind::Rook:   letter = 'r'; break;
    case PieceKind::Bishop: letter = 'b'; break;
    case PieceKind::Knight: letter = 'n'; break;
    case PieceKind::Pawn:   letter = 'p'; break;
    case PieceKind::Empty:  return ' ';
    }
    return color == Color::White ? static_cast<char>(std::toupper(static_cast<unsigned char>(letter))) : letter;
}

std::optional<PieceKind> piece_kind_from_letter(char letter) noexcept
{
    switch (std::tolower(static_cast<unsigned char>(letter)))
    {
    case 'k': return PieceKind::King;
    case 'q': return PieceKind::Queen;
    case 'r': return PieceKind::Rook;
    case 'b': return PieceKind::Bishop;
    case 'n': return PieceKind::Knight;
    case 'p': return PieceKind::Pawn;
    default:  return std::nullopt;
    }
}
