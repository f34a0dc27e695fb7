#pragma once

#include <vector>

#include "board.hpp"
#include "move.hpp"

namespace tetra::model {

// Pseudo-legal move templates per piece type. Nothing here looks at king safety; that is
// the MoveGenerator's job (including the "castling squares not attacked" condition).
class PieceRules {
 public:
  // All pseudo-legal moves of the piece standing on `from` (no-op on an empty square).
  // King captures are emitted like any other capture.
  static void pseudoLegalMoves(const Board& b, core::Position from, std::vector<Move>& out);

  // Squares the piece on `from` threatens: empty or enemy-occupied, pawns diagonal only.
  static void attackTargets(const Board& b, core::Position from,
                            std::vector<core::Position>& out);

  static const std::vector<core::Position>& knightOffsets() noexcept;
  static const std::vector<core::Position>& kingOffsets() noexcept;
  static const std::vector<core::Position>& rookDirections() noexcept;
  static const std::vector<core::Position>& bishopDirections() noexcept;

 private:
  static void pawnMoves(const Board& b, core::Position from, const Piece& pawn,
                        std::vector<Move>& out);
  static void castlingMoves(const Board& b, core::Position from, const Piece& king,
                            std::vector<Move>& out);
};

}  // namespace tetra::model
