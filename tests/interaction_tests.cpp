#include <cassert>
#include <cstring>
#include <initializer_list>
#include <iostream>
#include <optional>

#include "interaction.h"

using interaction::Event;
using interaction::EventKind;
using interaction::Mode;
using interaction::State;

namespace
{
    State in_mode(Mode mode, PieceKind piece = PieceKind::Empty)
    {
        State state;
        state.mode = mode;
        state.pieceToPlace = piece;
        return state;
    }

    Event event_of(EventKind kind)
    {
        Event event;
        event.kind = kind;
        return event;
    }

    State press(const State& state, char key)
    {
        const std::optional<Event> event = interaction::key_event(state.mode, key);
        assert(event);
        return interaction::next(state, *event);
    }

    void test_gameplay_transitions()
    {
        const State start;
        assert(start.mode == Mode::Gameplay);

        assert(press(start, 'q').mode == Mode::ExitGame);
        assert(press(start, 'e').mode == Mode::EditBoard);
        assert(!interaction::key_event(Mode::Gameplay, 'x'));

        Event quiet = event_of(EventKind::MoveApplied);
        assert(interaction::next(start, quiet) == start);

        Event promoting = event_of(EventKind::MoveApplied);
        promoting.pendingPromotion = true;
        assert(interaction::next(start, promoting).mode == Mode::PromotePawn);
    }

    void test_editing_round()
    {
        State state = press(State{}, 'e');
        assert(state.mode == Mode::EditBoard);

        state = press(state, 'r');
        assert(state == in_mode(Mode::ChooseColour, PieceKind::Rook));

        const std::optional<Event> colour = interaction::key_event(state.mode, 'b');
        assert(colour && colour->kind == EventKind::ColourChosen && colour->color == Color::Black);

        state = interaction::next(state, *colour);
        assert(state == in_mode(Mode::EditBoard));

        state = press(state, 'K');
        assert(state == in_mode(Mode::ChooseColour, PieceKind::King));
        state = press(state, interaction::EscapeKey);
        assert(state == in_mode(Mode::EditBoard));

        state = press(state, interaction::EscapeKey);
        assert(state == in_mode(Mode::Gameplay));
    }

    void test_edit_mode_ignores_other_keys()
    {
        assert(!interaction::key_event(Mode::EditBoard, 'x'));
        // Board-wide edits (clear, delete, start position) are window commands, not mode changes.
        assert(!interaction::key_event(Mode::EditBoard, 'c'));
        assert(!interaction::key_event(Mode::EditBoard, 'd'));
        assert(!interaction::key_event(Mode::EditBoard, 's'));
        assert(!interaction::key_event(Mode::ChooseColour, 'q'));

        // Gameplay events do not leak into edit mode.
        const State editing = in_mode(Mode::EditBoard);
        assert(interaction::next(editing, event_of(EventKind::QuitRequested)) == editing);

        Event emptyPiece = event_of(EventKind::PieceChosen);
        emptyPiece.piece = PieceKind::Empty;
        assert(interaction::next(editing, emptyPiece) == editing);

        const State choosing = in_mode(Mode::ChooseColour, PieceKind::Pawn);
        Event noColour = event_of(EventKind::ColourChosen);
        assert(interaction::next(choosing, noColour) == choosing);
    }

    void test_promotion_choices()
    {
        const State promoting = in_mode(Mode::PromotePawn);

        for (char key : {'q', 'r', 'n', 'b'})
        {
            const std::optional<Event> event = interaction::key_event(Mode::PromotePawn, key);
            assert(event && event->kind == EventKind::PromotionChosen);
            assert(interaction::next(promoting, *event).mode == Mode::Gameplay);
        }

        assert(interaction::key_event(Mode::PromotePawn, 'q')->piece == PieceKind::Queen);
        assert(interaction::key_event(Mode::PromotePawn, 'n')->piece == PieceKind::Knight);
        assert(!interaction::key_event(Mode::PromotePawn, 'k'));
        assert(!interaction::key_event(Mode::PromotePawn, 'p'));
        assert(!interaction::key_event(Mode::PromotePawn, interaction::EscapeKey));

        Event king = event_of(EventKind::PromotionChosen);
        king.piece = PieceKind::King;
        assert(interaction::next(promoting, king) == promoting);
        assert(interaction::next(promoting, event_of(EventKind::QuitRequested)) == promoting);
    }

    void test_exit_is_final()
    {
        const State done = in_mode(Mode::ExitGame);
        assert(interaction::next(done, event_of(EventKind::EditRequested)) == done);
        assert(!interaction::key_event(Mode::ExitGame, 'e'));
    }

    void test_hints()
    {
        assert(std::strlen(interaction::mode_hint(Mode::Gameplay)) > 0);
        assert(std::strlen(interaction::mode_hint(Mode::EditBoard)) > 0);
        assert(std::strlen(interaction::mode_hint(Mode::ChooseColour)) > 0);
        assert(std::strlen(interaction::mode_hint(Mode::PromotePawn)) > 0);
        assert(std::strlen(interaction::mode_hint(Mode::ExitGame)) == 0);
    }
}

int main()
{
    test_gameplay_transitions();
    test_editing_round();
    test_edit_mode_ignores_other_keys();
    test_promotion_choices();
    test_exit_is_final();
    test_hints();

    std::cout << "All interaction tests passed.\n";
    return 0;
}
