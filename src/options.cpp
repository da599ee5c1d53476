#include "options.h"

#include <ostream>

std::optional<AppOptions> parse_options(int argc, const char* const argv[], std::ostream& errors)
{
    AppOptions options;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg(argv[i]);

        if (arg == "--fen")
        {
            if (i + 1 >= argc)
            {
                errors << "--fen expects a FEN string\n";
                return std::nullopt;
            }
            options.startFen = std::string(argv[++i]);
        }
        else if (arg == "--lenient-castling")
        {
            options.rules.lenientCastling = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            options.showHelp = true;
        }
        else
        {
            errors << "Unknown option: " << arg << '\n';
            return std::nullopt;
        }
    }

    return options;
}

void print_usage(std::ostream& out, const std::string& program)
{
    out << "Usage: " << program << " [--fen \"<FEN>\"] [--lenient-castling]\n"
        << "  --fen <FEN>          start from the given position\n"
        << "  --lenient-castling   allow castling while the king is in check\n"
        << "  --help               show this message\n";
}
