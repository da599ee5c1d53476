#pragma once

class Game;

namespace ui
{
    // Runs the board window until the player quits; returns the process exit status.
    int run(Game& game);
}
