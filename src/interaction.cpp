#include "interaction.h"

namespace interaction
{
    namespace
    {
        Event make_event(EventKind kind, PieceKind piece = PieceKind::Empty, Color color = Color::None)
        {
            Event event;
            event.kind = kind;
            event.piece = piece;
            event.color = color;
            return event;
        }
    }

    State next(const State& state, const Event& event) noexcept
    {
        State result = state;

        switch (state.mode)
        {
        case Mode::Gameplay:
            if (event.kind == EventKind::QuitRequested)
            {
                result.mode = Mode::ExitGame;
            }
            else if (event.kind == EventKind::EditRequested)
            {
                result.mode = Mode::EditBoard;
            }
            else if (event.kind == EventKind::MoveApplied && event.pendingPromotion)
            {
                result.mode = Mode::PromotePawn;
            }
            break;

        case Mode::EditBoard:
            if (event.kind == EventKind::EditFinished)
            {
                result.mode = Mode::Gameplay;
                result.pieceToPlace = PieceKind::Empty;
            }
            else if (event.kind == EventKind::PieceChosen && event.piece != PieceKind::Empty)
            {
                result.mode = Mode::ChooseColour;
                result.pieceToPlace = event.piece;
            }
            break;

        case Mode::ChooseColour:
            if ((event.kind == EventKind::ColourChosen && event.color != Color::None) ||
                event.kind == EventKind::EditFinished)
            {
                result.mode = Mode::EditBoard;
                result.pieceToPlace = PieceKind::Empty;
            }
            break;

        case Mode::PromotePawn:
            if (event.kind == EventKind::PromotionChosen && is_promotion_choice(event.piece))
            {
                result.mode = Mode::Gameplay;
            }
            break;

        case Mode::ExitGame:
            break;
        }

        return result;
    }

    std::optional<Event> key_event(Mode mode, char key) noexcept
    {
        switch (mode)
        {
        case Mode::Gameplay:
            if (key == 'q') return make_event(EventKind::QuitRequested);
            if (key == 'e') return make_event(EventKind::EditRequested);
            return std::nullopt;

        case Mode::EditBoard:
            if (key == EscapeKey) return make_event(EventKind::EditFinished);
            if (const std::optional<PieceKind> kind = piece_kind_from_letter(key))
            {
                return make_event(EventKind::PieceChosen, *kind);
            }
            return std::nullopt;

        case Mode::ChooseColour:
            if (key == 'w') return make_event(EventKind::ColourChosen, PieceKind::Empty, Color::White);
            if (key == 'b') return make_event(EventKind::ColourChosen, PieceKind::Empty, Color::Black);
            if (key == EscapeKey) return make_event(EventKind::EditFinished);
            return std::nullopt;

        case Mode::PromotePawn:
            if (const std::optional<PieceKind> kind = piece_kind_from_letter(key))
            {
                if (is_promotion_choice(*kind))
                {
                    return make_event(EventKind::PromotionChosen, *kind);
                }
            }
            return std::nullopt;

        case Mode::ExitGame:
            return std::nullopt;
        }
        return std::nullopt;
    }

    const char* mode_hint(Mode mode) noexcept
    {
        switch (mode)
        {
        case Mode::Gameplay:     return "q:Quit e:Edit f:FEN c:Copy v:Paste";
        case Mode::EditBoard:    return "ESC:Exit c:Clear d:Delete s:Start k q r n b p:Place";
        case Mode::ChooseColour: return "w:White b:Black";
        case Mode::PromotePawn:  return "q:Queen r:Rook n:Knight b:Bishop";
        case Mode::ExitGame:     return "";
        }
        return "";
    }
}
