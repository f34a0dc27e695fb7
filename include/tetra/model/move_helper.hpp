#pragma once
#include <optional>
#include <utility>

#include "board.hpp"
#include "move.hpp"

namespace tetra::model {

// ---------------- Make/Unmake on a bare board ----------------
// Used for the canonical board as well as for scratch copies during legality checks.

// Applies m (which must have been produced by the generator for this board).
// Returns the square of the pawn whose en-passant flag was cleared, if any.
std::optional<core::Position> makeMove(Board& b, const Move& m);

// Exact inverse of makeMove; clearedEnPassant is the value makeMove returned.
void unmakeMove(Board& b, const Move& m, std::optional<core::Position> clearedEnPassant);

// Rook (from, to) for a castling move.
std::pair<core::Position, core::Position> castleRookSquares(const Move& m) noexcept;

}  // namespace tetra::model
