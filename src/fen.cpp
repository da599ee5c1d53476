#include "fen.h"

#include <array>
#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>
#include <vector>

namespace
{
    std::vector<std::string> tokenize(const std::string& line)
    {
        std::istringstream stream(line);
        std::vector<std::string> tokens;
        std::string token;
        while (stream >> token)
        {
            tokens.push_back(token);
        }
        return tokens;
    }

    int parse_counter(const std::string& token, const char* field)
    {
        int value = 0;
        const char* first = token.data();
        const char* last = token.data() + token.size();
        const auto result = std::from_chars(first, last, value);
        if (result.ec != std::errc() || result.ptr != last || value < 0)
        {
            throw FenError(std::string(field) + " is not a non-negative integer: '" + token + "'");
        }
        if (value > MaxMoveCounter)
        {
            throw FenError(std::string(field) + " exceeds " + std::to_string(MaxMoveCounter));
        }
        return value;
    }

    Board parse_placement(const std::string& field)
    {
        Board board;
        std::array<int, 2> kings{0, 0};
        int y = 0;
        int x = 0;

        for (char symbol : field)
        {
            if (symbol == '/')
            {
                if (x != 8)
                {
                    throw FenError("rank " + std::to_string(8 - y) + " does not describe 8 files");
                }
                if (++y > 7)
                {
                    throw FenError("placement describes more than 8 ranks");
                }
                x = 0;
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(symbol)))
            {
                const int run = symbol - '0';
                if (run < 1 || x + run > 8)
                {
                    throw FenError("rank " + std::to_string(8 - y) + " does not describe 8 files");
                }
                x += run;
                continue;
            }

            const std::optional<PieceKind> kind = piece_kind_from_letter(symbol);
            if (!kind)
            {
                throw FenError(std::string("unknown piece letter '") + symbol + "'");
            }
            if (x >= 8)
            {
                throw FenError("rank " + std::to_string(8 - y) + " does not describe 8 files");
            }

            const Color color = std::isupper(static_cast<unsigned char>(symbol)) ? Color::White : Color::Black;
            if (*kind == PieceKind::King && ++kings[side_index(color)] > 1)
            {
                throw FenError("more than one king of a colour");
            }

            board.set({x, y}, Square::make(*kind, color));
            ++x;
        }

        if (y != 7 || x != 8)
        {
            throw FenError("placement does not describe 8 ranks of 8 files");
        }

        return board;
    }

    Color parse_active_color(const std::string& field)
    {
        if (field == "w")
        {
            return Color::White;
        }
        if (field == "b")
        {
            return Color::Black;
        }
        throw FenError("active colour must be 'w' or 'b', got '" + field + "'");
    }

    std::array<std::array<bool, 2>, 2> parse_castling(const std::string& field)
    {
        std::array<std::array<bool, 2>, 2> rights{{{false, false}, {false, false}}};
        if (field == "-")
        {
            return rights;
        }

        for (char symbol : field)
        {
            switch (symbol)
            {
            case 'K': rights[0][0] = true; break;
            case 'Q': rights[0][1] = true; break;
            case 'k': rights[1][0] = true; break;
            case 'q': rights[1][1] = true; break;
            default:
                throw FenError(std::string("unexpected castling character '") + symbol + "'");
            }
        }
        return rights;
    }

    // The target lies behind a pawn that just moved two squares, so it is on
    // rank 6 when White moves next and on rank 3 when Black does.
    std::optional<Coord> parse_en_passant(const std::string& field, Color sideToMove)
    {
        if (field == "-")
        {
            return std::nullopt;
        }

        const std::optional<Coord> target = coord_from_string(field);
        if (!target)
        {
            throw FenError("en passant target must be '-' or a square, got '" + field + "'");
        }

        const int expectedRank = sideToMove == Color::White ? 6 : 3;
        if (rank_of(*target) != expectedRank)
        {
            throw FenError("en passant target " + field + " is not on rank " + std::to_string(expectedRank));
        }
        return target;
    }
}

namespace fen
{
    const std::string StartingPosition =
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

    std::string encode(const Position& position)
    {
        std::ostringstream stream;
        const Board& board = position.board();

        for (int y = 0; y < 8; ++y)
        {
            int emptyCount = 0;
            for (int x = 0; x < 8; ++x)
            {
                const Square& square = board.at({x, y});
                if (square.is_empty())
                {
                    ++emptyCount;
                    continue;
                }
                if (emptyCount > 0)
                {
                    stream << emptyCount;
                    emptyCount = 0;
                }
                stream << piece_letter(square.piece(), square.color());
            }
            if (emptyCount > 0)
            {
                stream << emptyCount;
            }
            if (y < 7)
            {
                stream << '/';
            }
        }

        stream << ' ' << (position.side_to_move() == Color::White ? 'w' : 'b') << ' ';

        std::string castling;
        if (position.can_castle(Color::White, CastleSide::KingSide)) castling += 'K';
        if (position.can_castle(Color::White, CastleSide::QueenSide)) castling += 'Q';
        if (position.can_castle(Color::Black, CastleSide::KingSide)) castling += 'k';
        if (position.can_castle(Color::Black, CastleSide::QueenSide)) castling += 'q';
        stream << (castling.empty() ? "-" : castling);

        stream << ' ';
        if (const std::optional<Coord> target = position.en_passant_target())
        {
            stream << coord_to_string(*target);
        }
        else
        {
            stream << '-';
        }

        stream << ' ' << position.halfmove_clock() << ' ' << position.fullmove_number();
        return stream.str();
    }

    Position decode(const std::string& text)
    {
        const std::vector<std::string> fields = tokenize(text);
        if (fields.size() < 6)
        {
            throw FenError("expected 6 fields, found " + std::to_string(fields.size()));
        }

        const Board board = parse_placement(fields[0]);

        PositionState state;
        state.sideToMove = parse_active_color(fields[1]);
        state.castlingRights = parse_castling(fields[2]);
        state.enPassantTarget = parse_en_passant(fields[3], state.sideToMove);
        state.halfmoveClock = parse_counter(fields[4], "halfmove clock");
        state.fullmoveNumber = parse_counter(fields[5], "fullmove number");

        return Position(board, state);
    }
}
