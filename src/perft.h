#pragma once

#include <cstdint>

#include "position.h"

// Counts leaf positions reachable in exactly depth plies. A promotion counts
// once per promotion piece.
std::uint64_t perft(const Position& position, int depth);
