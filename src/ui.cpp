#include "ui.h"

#include <SDL.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "coord.h"
#include "fen.h"
#include "game.h"
#include "interaction.h"

namespace ui
{
    namespace
    {
        constexpr int SquareSize = 80;
        constexpr int BoardPixels = SquareSize * 8;
        constexpr int LabelMargin = 24;
        constexpr int StatusHeight = 96;
        constexpr int WindowWidth = LabelMargin + BoardPixels;
        constexpr int WindowHeight = BoardPixels + LabelMargin + StatusHeight;
        constexpr int StatusPadding = 8;
        constexpr int TextScale = 2;
        constexpr int PieceScale = 6;
        constexpr std::uint32_t StatusDurationMs = 2000;

        const SDL_Color LightSquare{200, 200, 200, 255};
        const SDL_Color DarkSquare{144, 238, 144, 255};
        const SDL_Color LabelBg{40, 60, 160, 255};
        const SDL_Color PanelBg{40, 40, 45, 255};
        const SDL_Color TextColor{235, 235, 240, 255};
        const SDL_Color AlertColor{230, 80, 80, 255};
        const SDL_Color SelectedFill{200, 100, 0, 150};
        const SDL_Color MoveFill{200, 100, 0, 90};
        const SDL_Color CursorOutline{250, 220, 0, 255};
        const SDL_Color CheckOutline{210, 30, 30, 255};
        const SDL_Color WhitePiece{250, 250, 250, 255};
        const SDL_Color BlackPiece{20, 20, 20, 255};

        struct ViewState
        {
            interaction::State modeState{};
            std::optional<Coord> selected;
            std::vector<Coord> moves;
            Coord cursor{4, 7};
            bool showFen{false};
            std::string resultText;
            std::string statusText;
            std::uint32_t statusExpireMs{0};
        };

        // 5x7 bitmap font; each row byte holds the glyph's columns in its low bits.
        struct Glyph
        {
            char symbol;
            int width;
            std::array<std::uint8_t, 7> rows;
        };

        const std::array<Glyph, 56> Font{{
            {'0', 5, {0x0E, 0x11, 0x13, 0x15, 0x19, 0x11, 0x0E}},
            {'1', 5, {0x04, 0x0C, 0x04, 0x04, 0x04, 0x04, 0x0E}},
            {'2', 5, {0x0E, 0x11, 0x01, 0x02, 0x04, 0x08, 0x1F}},
            {'3', 5, {0x1E, 0x01, 0x01, 0x0E, 0x01, 0x01, 0x1E}},
            {'4', 5, {0x02, 0x06, 0x0A, 0x12, 0x1F, 0x02, 0x02}},
            {'5', 5, {0x1F, 0x10, 0x1E, 0x01, 0x01, 0x11, 0x0E}},
            {'6', 5, {0x0E, 0x10, 0x1E, 0x11, 0x11, 0x11, 0x0E}},
            {'7', 5, {0x1F, 0x01, 0x02, 0x04, 0x08, 0x08, 0x08}},
            {'8', 5, {0x0E, 0x11, 0x11, 0x0E, 0x11, 0x11, 0x0E}},
            {'9', 5, {0x0E, 0x11, 0x11, 0x0F, 0x01, 0x01, 0x0E}},
            {'A', 5, {0x0E, 0x11, 0x11, 0x1F, 0x11, 0x11, 0x11}},
            {'B', 5, {0x1E, 0x11, 0x11, 0x1E, 0x11, 0x11, 0x1E}},
            {'C', 5, {0x0E, 0x11, 0x10, 0x10, 0x10, 0x11, 0x0E}},
            {'D', 5, {0x1C, 0x12, 0x11, 0x11, 0x11, 0x12, 0x1C}},
            {'E', 5, {0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x1F}},
            {'F', 5, {0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x10}},
            {'G', 5, {0x0E, 0x11, 0x10, 0x17, 0x11, 0x11, 0x0F}},
            {'H', 5, {0x11, 0x11, 0x11, 0x1F, 0x11, 0x11, 0x11}},
            {'I', 3, {0x07, 0x02, 0x02, 0x02, 0x02, 0x02, 0x07}},
            {'J', 5, {0x07, 0x02, 0x02, 0x02, 0x02, 0x12, 0x0C}},
            {'K', 5, {0x11, 0x12, 0x14, 0x18, 0x14, 0x12, 0x11}},
            {'L', 5, {0x10, 0x10, 0x10, 0x10, 0x10, 0x10, 0x1F}},
            {'M', 5, {0x11, 0x1B, 0x15, 0x15, 0x11, 0x11, 0x11}},
            {'N', 5, {0x11, 0x19, 0x15, 0x13, 0x11, 0x11, 0x11}},
            {'O', 5, {0x0E, 0x11, 0x11, 0x11, 0x11, 0x11, 0x0E}},
            {'P', 5, {0x1E, 0x11, 0x11, 0x1E, 0x10, 0x10, 0x10}},
            {'Q', 5, {0x0E, 0x11, 0x11, 0x11, 0x15, 0x12, 0x0D}},
            {'R', 5, {0x1E, 0x11, 0x11, 0x1E, 0x14, 0x12, 0x11}},
            {'S', 5, {0x0F, 0x10, 0x10, 0x0E, 0x01, 0x01, 0x1E}},
            {'T', 5, {0x1F, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04}},
            {'U', 5, {0x11, 0x11, 0x11, 0x11, 0x11, 0x11, 0x0E}},
            {'V', 5, {0x11, 0x11, 0x11, 0x0A, 0x0A, 0x04, 0x04}},
            {'W', 5, {0x11, 0x11, 0x11, 0x15, 0x15, 0x15, 0x0A}},
            {'X', 5, {0x11, 0x11, 0x0A, 0x04, 0x0A, 0x11, 0x11}},
            {'Y', 5, {0x11, 0x11, 0x0A, 0x04, 0x04, 0x04, 0x04}},
            {'Z', 5, {0x1F, 0x01, 0x02, 0x04, 0x08, 0x10, 0x1F}},
            {'a', 5, {0x00, 0x0E, 0x01, 0x0F, 0x11, 0x11, 0x0F}},
            {'b', 5, {0x10, 0x10, 0x1E, 0x11, 0x11, 0x11, 0x1E}},
            {'c', 5, {0x00, 0x0E, 0x11, 0x10, 0x10, 0x11, 0x0E}},
            {'d', 5, {0x01, 0x01, 0x0F, 0x11, 0x11, 0x11, 0x0F}},
            {'e', 5, {0x00, 0x0E, 0x11, 0x1F, 0x10, 0x10, 0x0E}},
            {'f', 5, {0x06, 0x09, 0x08, 0x1C, 0x08, 0x08, 0x08}},
            {'g', 5, {0x00, 0x0F, 0x11, 0x11, 0x0F, 0x01, 0x1E}},
            {'h', 5, {0x10, 0x10, 0x1E, 0x11, 0x11, 0x11, 0x11}},
            {'k', 5, {0x10, 0x10, 0x12, 0x14, 0x18, 0x14, 0x12}},
            {'n', 5, {0x00, 0x00, 0x16, 0x19, 0x11, 0x11, 0x11}},
            {'p', 5, {0x00, 0x1E, 0x11, 0x11, 0x1E, 0x10, 0x10}},
            {'q', 5, {0x00, 0x0F, 0x11, 0x11, 0x0F, 0x01, 0x01}},
            {'r', 5, {0x00, 0x00, 0x16, 0x19, 0x10, 0x10, 0x10}},
            {'w', 5, {0x00, 0x00, 0x11, 0x11, 0x15, 0x15, 0x0A}},
            {'-', 5, {0x00, 0x00, 0x00, 0x0E, 0x00, 0x00, 0x00}},
            {'/', 5, {0x01, 0x02, 0x04, 0x08, 0x10, 0x00, 0x00}},
            {':', 3, {0x00, 0x02, 0x00, 0x00, 0x02, 0x00, 0x00}},
            {'!', 3, {0x02, 0x02, 0x02, 0x02, 0x02, 0x00, 0x02}},
            {'?', 5, {0x0E, 0x11, 0x02, 0x04, 0x04, 0x00, 0x04}},
            {' ', 3, {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}},
        }};

        const Glyph& glyph_for_char(char ch)
        {
            const auto it = std::find_if(Font.begin(), Font.end(), [ch](const Glyph& glyph) { return glyph.symbol == ch; });
            if (it != Font.end())
            {
                return *it;
            }
            return glyph_for_char('?');
        }

        std::string to_upper_copy(const std::string& text)
        {
            std::string upper;
            upper.reserve(text.size());
            for (char ch : text)
            {
                upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
            }
            return upper;
        }

        void fill_rect(SDL_Renderer* renderer, const SDL_Rect& rect, SDL_Color color)
        {
            SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
            SDL_RenderFillRect(renderer, &rect);
        }

        void outline_rect(SDL_Renderer* renderer, const SDL_Rect& rect, SDL_Color color, int thickness)
        {
            SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
            for (int i = 0; i < thickness; ++i)
            {
                const SDL_Rect inset{rect.x + i, rect.y + i, rect.w - 2 * i, rect.h - 2 * i};
                SDL_RenderDrawRect(renderer, &inset);
            }
        }

        void draw_glyph(SDL_Renderer* renderer, int x, int y, int scale, const Glyph& glyph, SDL_Color color)
        {
            SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
            for (int row = 0; row < 7; ++row)
            {
                const std::uint8_t bits = glyph.rows[static_cast<std::size_t>(row)];
                for (int col = 0; col < glyph.width; ++col)
                {
                    if ((bits >> (glyph.width - 1 - col)) & 1U)
                    {
                        SDL_Rect pixel{x + col * scale, y + row * scale, scale, scale};
                        SDL_RenderFillRect(renderer, &pixel);
                    }
                }
            }
        }

        void draw_text(SDL_Renderer* renderer,
                       int x,
                       int y,
                       int scale,
                       const std::string& text,
                       SDL_Color color)
        {
            int cursorX = x;
            for (char ch : text)
            {
                const Glyph& glyph = glyph_for_char(ch);
                draw_glyph(renderer, cursorX, y, scale, glyph, color);
                cursorX += (glyph.width + 1) * scale;
            }
        }

        std::optional<Coord> screen_to_coord(int x, int y)
        {
            const int boardX = x - LabelMargin;
            if (boardX < 0 || boardX >= BoardPixels || y < 0 || y >= BoardPixels)
            {
                return std::nullopt;
            }
            return Coord{boardX / SquareSize, y / SquareSize};
        }

        SDL_Rect square_rect(Coord coord)
        {
            return SDL_Rect{LabelMargin + coord.x * SquareSize, coord.y * SquareSize, SquareSize, SquareSize};
        }

        void set_status(ViewState& view, const std::string& text)
        {
            view.statusText = text;
            view.statusExpireMs = SDL_GetTicks() + StatusDurationMs;
        }

        void clear_selection(ViewState& view)
        {
            view.selected.reset();
            view.moves.clear();
        }

        void refresh_result(ViewState& view, Game& game)
        {
            switch (game.status())
            {
            case GameStatus::Checkmate: view.resultText = "Checkmate!"; break;
            case GameStatus::Stalemate: view.resultText = "Stalemate!"; break;
            case GameStatus::Ongoing:   view.resultText.clear(); break;
            }
        }

        void announce(ViewState& view, Game& game, const MoveOutcome& outcome)
        {
            if (outcome.pendingPromotion)
            {
                view.resultText.clear();
                return;
            }
            refresh_result(view, game);
            if (outcome.terminal == GameStatus::Ongoing && outcome.check)
            {
                set_status(view, "Check");
            }
        }

        void activate_square(ViewState& view, Game& game, Coord square)
        {
            if (view.selected &&
                std::find(view.moves.begin(), view.moves.end(), square) != view.moves.end())
            {
                const Coord from = *view.selected;
                clear_selection(view);

                const std::optional<MoveOutcome> outcome = game.apply_move(from, square);
                if (!outcome)
                {
                    return;
                }

                interaction::Event event;
                event.kind = interaction::EventKind::MoveApplied;
                event.pendingPromotion = outcome->pendingPromotion;
                view.modeState = interaction::next(view.modeState, event);
                announce(view, game, *outcome);
                return;
            }

            const Square& occupant = game.position().board().at(square);
            if (occupant.is_empty() || occupant.color() != game.side_to_move())
            {
                clear_selection(view);
                return;
            }

            view.selected = square;
            view.moves = game.legal_moves(square);
        }

        void copy_fen(ViewState& view, const Game& game)
        {
            const std::string fenText = game.to_fen();
            if (SDL_SetClipboardText(fenText.c_str()) != 0)
            {
                std::cerr << "SDL_SetClipboardText failed: " << SDL_GetError() << '\n';
                set_status(view, "Clipboard unavailable");
                return;
            }
            set_status(view, "Copied FEN string to clipboard!");
        }

        void paste_fen(ViewState& view, Game& game)
        {
            if (!SDL_HasClipboardText())
            {
                set_status(view, "Clipboard is empty");
                return;
            }

            char* raw = SDL_GetClipboardText();
            const std::string text = raw ? raw : "";
            SDL_free(raw);

            try
            {
                game.load_fen(text);
            }
            catch (const FenError& error)
            {
                std::cerr << "Invalid FEN: " << error.what() << '\n';
                set_status(view, "Invalid FEN");
                return;
            }

            clear_selection(view);
            refresh_result(view, game);
            set_status(view, "Loaded FEN from clipboard");
        }

        void move_cursor(ViewState& view, SDL_Keycode key)
        {
            Coord next = view.cursor;
            switch (key)
            {
            case SDLK_LEFT:  next = view.cursor.offset(Direction::Left); break;
            case SDLK_RIGHT: next = view.cursor.offset(Direction::Right); break;
            case SDLK_UP:    next = view.cursor.offset(Direction::Up); break;
            case SDLK_DOWN:  next = view.cursor.offset(Direction::Down); break;
            default: break;
            }
            if (next.on_board())
            {
                view.cursor = next;
            }
        }

        std::optional<char> key_char(SDL_Keycode key)
        {
            if (key == SDLK_ESCAPE)
            {
                return interaction::EscapeKey;
            }
            if (key >= SDLK_a && key <= SDLK_z)
            {
                return static_cast<char>(key);
            }
            return std::nullopt;
        }

        void handle_key(ViewState& view, Game& game, SDL_Keycode key)
        {
            if (key == SDLK_LEFT || key == SDLK_RIGHT || key == SDLK_UP || key == SDLK_DOWN)
            {
                move_cursor(view, key);
                return;
            }

            const interaction::Mode mode = view.modeState.mode;

            if (key == SDLK_RETURN || key == SDLK_KP_ENTER)
            {
                if (mode == interaction::Mode::Gameplay)
                {
                    activate_square(view, game, view.cursor);
                }
                return;
            }

            const std::optional<char> ch = key_char(key);
            if (!ch)
            {
                return;
            }

            if (mode == interaction::Mode::Gameplay)
            {
                switch (*ch)
                {
                case 'f':
                    view.showFen = !view.showFen;
                    return;
                case 'c':
                    if (view.showFen)
                    {
                        copy_fen(view, game);
                    }
                    return;
                case 'v':
                    paste_fen(view, game);
                    return;
                default:
                    break;
                }
            }
            else if (mode == interaction::Mode::EditBoard)
            {
                if (*ch == 'c')
                {
                    game.clear_board();
                    refresh_result(view, game);
                    return;
                }
                if (*ch == 'd')
                {
                    game.clear_square(view.cursor);
                    refresh_result(view, game);
                    return;
                }
                if (*ch == 's')
                {
                    game.reset();
                    clear_selection(view);
                    refresh_result(view, game);
                    return;
                }
            }

            const std::optional<interaction::Event> event = interaction::key_event(mode, *ch);
            if (!event)
            {
                return;
            }

            if (event->kind == interaction::EventKind::ColourChosen)
            {
                game.place_piece(view.modeState.pieceToPlace, event->color, view.cursor);
            }
            else if (event->kind == interaction::EventKind::PromotionChosen)
            {
                const std::optional<MoveOutcome> outcome = game.promote(event->piece);
                if (!outcome)
                {
                    return;
                }
                announce(view, game, *outcome);
            }
            else if (event->kind == interaction::EventKind::EditRequested)
            {
                clear_selection(view);
            }

            view.modeState = interaction::next(view.modeState, *event);

            if (view.modeState.mode == interaction::Mode::Gameplay && mode == interaction::Mode::EditBoard)
            {
                refresh_result(view, game);
            }
        }

        void draw_piece(SDL_Renderer* renderer, Coord coord, const Square& square)
        {
            const char letter = piece_letter(square.piece(), Color::White);
            const Glyph& glyph = glyph_for_char(letter);
            const SDL_Rect rect = square_rect(coord);
            const int x = rect.x + (SquareSize - glyph.width * PieceScale) / 2;
            const int y = rect.y + (SquareSize - 7 * PieceScale) / 2;

            const bool white = square.color() == Color::White;
            const SDL_Color body = white ? WhitePiece : BlackPiece;
            const SDL_Color shadow = white ? BlackPiece : WhitePiece;

            draw_glyph(renderer, x + 2, y + 2, PieceScale, glyph, shadow);
            draw_glyph(renderer, x, y, PieceScale, glyph, body);
        }

        void render_board(SDL_Renderer* renderer, const ViewState& view, const Game& game)
        {
            const Position& position = game.position();

            for (int y = 0; y < 8; ++y)
            {
                for (int x = 0; x < 8; ++x)
                {
                    const Coord coord{x, y};
                    fill_rect(renderer, square_rect(coord), (x + y) % 2 == 0 ? LightSquare : DarkSquare);
                }
            }

            if (view.selected)
            {
                fill_rect(renderer, square_rect(*view.selected), SelectedFill);
            }
            for (const Coord& target : view.moves)
            {
                fill_rect(renderer, square_rect(target), MoveFill);
            }

            for (int y = 0; y < 8; ++y)
            {
                for (int x = 0; x < 8; ++x)
                {
                    const Coord coord{x, y};
                    const Square& square = position.board().at(coord);
                    if (!square.is_empty())
                    {
                        draw_piece(renderer, coord, square);
                    }
                }
            }

            const Color side = position.side_to_move();
            if (const std::optional<Coord> king = position.king_square(side))
            {
                if (position.is_in_check(side))
                {
                    outline_rect(renderer, square_rect(*king), CheckOutline, 4);
                }
            }

            outline_rect(renderer, square_rect(view.cursor), CursorOutline, 3);

            fill_rect(renderer, SDL_Rect{0, 0, LabelMargin, BoardPixels + LabelMargin}, LabelBg);
            fill_rect(renderer, SDL_Rect{0, BoardPixels, WindowWidth, LabelMargin}, LabelBg);
            for (int i = 0; i < 8; ++i)
            {
                const std::string rankLabel(1, static_cast<char>('8' - i));
                draw_text(renderer, 7, i * SquareSize + (SquareSize - 14) / 2, TextScale, rankLabel, TextColor);

                const std::string fileLabel(1, static_cast<char>('A' + i));
                draw_text(renderer,
                          LabelMargin + i * SquareSize + (SquareSize - 10) / 2,
                          BoardPixels + 5,
                          TextScale,
                          fileLabel,
                          TextColor);
            }
        }

        void render_status(SDL_Renderer* renderer, const ViewState& view, const Game& game)
        {
            const int top = BoardPixels + LabelMargin;
            fill_rect(renderer, SDL_Rect{0, top, WindowWidth, StatusHeight}, PanelBg);

            std::string headline = game.side_to_move() == Color::White ? "White to move" : "Black to move";
            SDL_Color headlineColor = TextColor;
            if (!view.resultText.empty())
            {
                headline = view.resultText;
                headlineColor = AlertColor;
            }
            else if (!view.statusText.empty())
            {
                headline += "  " + view.statusText;
            }

            draw_text(renderer, StatusPadding, top + StatusPadding, TextScale, to_upper_copy(headline), headlineColor);
            draw_text(renderer,
                      StatusPadding,
                      top + StatusPadding + 26,
                      TextScale,
                      to_upper_copy(interaction::mode_hint(view.modeState.mode)),
                      AlertColor);

            if (view.showFen)
            {
                draw_text(renderer, StatusPadding, top + StatusPadding + 56, 1, game.to_fen(), TextColor);
            }
        }
    }

    int run(Game& game)
    {
        if (SDL_Init(SDL_INIT_VIDEO) != 0)
        {
            std::cerr << "SDL_Init failed: " << SDL_GetError() << '\n';
            return 1;
        }

        SDL_Window* window = SDL_CreateWindow(
            "Chess Rules",
            SDL_WINDOWPOS_CENTERED,
            SDL_WINDOWPOS_CENTERED,
            WindowWidth,
            WindowHeight,
            SDL_WINDOW_SHOWN);

        if (!window)
        {
            std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << '\n';
            SDL_Quit();
            return 1;
        }

        SDL_Renderer* renderer = SDL_CreateRenderer(
            window,
            -1,
            SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);

        if (!renderer)
        {
            std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << '\n';
            SDL_DestroyWindow(window);
            SDL_Quit();
            return 1;
        }

        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

        ViewState view;
        refresh_result(view, game);

        while (view.modeState.mode != interaction::Mode::ExitGame)
        {
            SDL_Event event;
            while (SDL_PollEvent(&event))
            {
                if (event.type == SDL_QUIT)
                {
                    view.modeState.mode = interaction::Mode::ExitGame;
                }
                else if (event.type == SDL_KEYDOWN)
                {
                    handle_key(view, game, event.key.keysym.sym);
                }
                else if (event.type == SDL_MOUSEBUTTONUP && event.button.button == SDL_BUTTON_LEFT)
                {
                    const std::optional<Coord> square = screen_to_coord(event.button.x, event.button.y);
                    if (!square)
                    {
                        continue;
                    }
                    view.cursor = *square;
                    if (view.modeState.mode == interaction::Mode::Gameplay)
                    {
                        activate_square(view, game, *square);
                    }
                }
            }

            if (!view.statusText.empty() && SDL_GetTicks() > view.statusExpireMs)
            {
                view.statusText.clear();
            }

            SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
            SDL_RenderClear(renderer);
            render_board(renderer, view, game);
            render_status(renderer, view, game);
            SDL_RenderPresent(renderer);
        }

        SDL_DestroyRenderer(renderer);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 0;
    }
}
