#pragma once
#include <cstdint>
#include <utility>
#include <vector>

#include "game_state.hpp"

namespace tetra::model {

// Leaf count of the legal move tree of the given depth. The game is restored on return.
// Throws std::logic_error if a generated move is rejected by applyMove.
std::uint64_t perft(GameState& game, int depth);

// perft(depth - 1) below every legal root move, in generation order.
std::vector<std::pair<Move, std::uint64_t>> perftDivide(GameState& game, int depth);

}  // namespace tetra::model
