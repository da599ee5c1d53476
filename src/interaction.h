#pragma once

#include <cstdint>
#include <optional>

#include "piece.h"

// Front-end modes and their transitions. Nothing here touches the game; the
// window feeds in key presses and move outcomes and acts on the result.
namespace interaction
{
    constexpr char EscapeKey = '\x1b';

    enum class Mode : std::uint8_t
    {
        Gameplay,
        EditBoard,
        ChooseColour,
        PromotePawn,
        ExitGame
    };

    enum class EventKind : std::uint8_t
    {
        QuitRequested,
        EditRequested,
        EditFinished,
        PieceChosen,
        ColourChosen,
        MoveApplied,
        PromotionChosen
    };

    struct Event
    {
        EventKind kind{EventKind::QuitRequested};
        PieceKind piece{PieceKind::Empty};
        Color color{Color::None};
        bool pendingPromotion{false};
    };

    struct State
    {
        Mode mode{Mode::Gameplay};
        PieceKind pieceToPlace{PieceKind::Empty};

        bool operator==(const State& other) const noexcept
        {
            return mode == other.mode && pieceToPlace == other.pieceToPlace;
        }
    };

    // Events that are not meaningful in the current mode leave it unchanged.
    State next(const State& state, const Event& event) noexcept;

    // Mode-changing meaning of a key press, if it has one in this mode.
    std::optional<Event> key_event(Mode mode, char key) noexcept;

    const char* mode_hint(Mode mode) noexcept;
}
