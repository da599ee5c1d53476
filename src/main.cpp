#include "fen.h"
#include "game.h"
#include "options.h"
#include "ui.h"

#include <iostream>
#include <string>

int main(int argc, char* argv[])
{
    const std::string program = argc > 0 ? argv[0] : "chess_rules";

    const std::optional<AppOptions> options = parse_options(argc, argv, std::cerr);
    if (!options)
    {
        print_usage(std::cerr, program);
        return 2;
    }

    if (options->showHelp)
    {
        print_usage(std::cout, program);
        return 0;
    }

    Game game(options->rules);

    if (options->startFen)
    {
        try
        {
            game.load_fen(*options->startFen);
        }
        catch (const FenError& error)
        {
            std::cerr << "Invalid FEN: " << error.what() << '\n';
            return 2;
        }
    }

    return ui::run(game);
}
