#pragma once

#include "chess_types.hpp"

namespace tetra::core {

enum GameResult { ONGOING, LAST_STANDING, STALEMATE, MOVERULE, REPETITION };

// captured-material score, King is never captured
constexpr int PIECE_VALUE[6] = {1, 3, 5, 5, 9, 0};

constexpr inline int pieceValue(PieceType t) noexcept {
  return t == PieceType::None ? 0 : PIECE_VALUE[static_cast<int>(t)];
}

struct Outcome {
  GameResult result = ONGOING;
  PlayerColor winner = PlayerColor::Red;  // only meaningful for LAST_STANDING

  bool finished() const noexcept { return result != ONGOING; }
};

constexpr inline bool operator==(const Outcome& a, const Outcome& b) noexcept {
  if (a.result != b.result) return false;
  return a.result != LAST_STANDING || a.winner == b.winner;
}
constexpr inline bool operator!=(const Outcome& a, const Outcome& b) noexcept {
  return !(a == b);
}

}  // namespace tetra::core
