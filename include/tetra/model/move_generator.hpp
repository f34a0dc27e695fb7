#pragma once

#include <vector>

#include "board.hpp"
#include "move.hpp"
#include "player.hpp"

namespace tetra::model {

class MoveGenerator {
 public:
  // Pseudo-legal moves of every piece of `side` (PieceRules output, king captures included).
  void generatePseudoLegalMoves(const Board& b, core::PlayerColor side,
                                std::vector<Move>& out) const;

  // Legal moves: the pseudo-legal set minus king captures, castling through or out of an
  // attacked square, and anything that leaves our king attacked by one of the remaining
  // opponents. An eliminated player has none. The board is never modified.
  void generateLegalMoves(const Board& b, const Roster& players, core::PlayerColor side,
                          std::vector<Move>& out) const;

  // Legal moves of the piece on `from` (empty if the square is empty or its owner is out).
  void generateLegalMovesFrom(const Board& b, const Roster& players, core::Position from,
                              std::vector<Move>& out) const;

  bool hasLegalMove(const Board& b, const Roster& players, core::PlayerColor side) const;

  // Legality of a generator-produced pseudo-legal move.
  bool isLegal(const Board& b, const Roster& players, const Move& m) const;

  // Which legality condition a pseudo-legal candidate fails (None if legal).
  enum class Rejection { None, KingCapture, CastlesThroughCheck, LeavesKingInCheck };
  Rejection classify(const Board& b, const Roster& players, const Move& m) const;
};

}  // namespace tetra::model
