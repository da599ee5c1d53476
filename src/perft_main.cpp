#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "fen.h"
#include "perft.h"

int main(int argc, char* argv[])
{
    int maxDepth = 4;
    if (argc > 1)
    {
        char* end = nullptr;
        const long parsed = std::strtol(argv[1], &end, 10);
        if (end == argv[1] || *end != '\0' || parsed < 0)
        {
            std::cerr << "Usage: " << argv[0] << " [depth] [fen]\n";
            return 2;
        }
        maxDepth = static_cast<int>(parsed);
    }

    std::string fenText = fen::StartingPosition;
    if (argc > 2)
    {
        // The FEN may arrive unquoted, spread over the remaining arguments.
        fenText = argv[2];
        for (int i = 3; i < argc; ++i)
        {
            fenText += ' ';
            fenText += argv[i];
        }
    }

    Position position;
    try
    {
        position = fen::decode(fenText);
    }
    catch (const FenError& error)
    {
        std::cerr << "Invalid FEN: " << error.what() << '\n';
        return 2;
    }

    std::cout << "Perft for " << fenText << ":\n";
    for (int depth = 1; depth <= maxDepth; ++depth)
    {
        const std::uint64_t nodes = perft(position, depth);
        std::cout << "Depth " << depth << ": " << nodes << '\n';
    }

    return 0;
}
