#include "tetra/model/attack_map.hpp"

#include <vector>

#include "tetra/model/piece_rules.hpp"

namespace tetra::model {

namespace {

using core::Position;
using PT = core::PieceType;

inline bool hasPiece(const Board& b, Position p, core::PlayerColor owner, PT type) {
  auto occ = b.pieceAt(p);
  return occ && occ->owner == owner && occ->type == type;
}

bool sliderHits(const Board& b, Position sq, core::PlayerColor by,
                const std::vector<Position>& dirs, PT slider) {
  for (const auto& d : dirs) {
    for (Position cur = sq + d; Board::onBoard(cur); cur = cur + d) {
      auto occ = b.pieceAt(cur);
      if (!occ) continue;
      if (occ->owner == by && (occ->type == slider || occ->type == PT::Queen)) return true;
      break;
    }
  }
  return false;
}

}  // namespace

SquareSet attackedSquares(const Board& b, core::PlayerColor attacker) {
  SquareSet out;
  std::vector<Position> targets;
  targets.reserve(32);
  for (const auto& [pos, piece] : b.pieces()) {
    if (piece.owner != attacker) continue;
    targets.clear();
    PieceRules::attackTargets(b, pos, targets);
    out.insert(targets.begin(), targets.end());
  }
  return out;
}

bool isSquareAttacked(const Board& b, Position sq, core::PlayerColor by) {
  if (!Board::onBoard(sq)) return false;
  if (auto occ = b.pieceAt(sq); occ && occ->owner == by) return false;

  const Orientation& o = orientation(by);
  if (hasPiece(b, sq - o.diagLeft(), by, PT::Pawn)) return true;
  if (hasPiece(b, sq - o.diagRight(), by, PT::Pawn)) return true;

  for (const auto& d : PieceRules::knightOffsets())
    if (hasPiece(b, sq + d, by, PT::Knight)) return true;

  if (sliderHits(b, sq, by, PieceRules::bishopDirections(), PT::Bishop)) return true;
  if (sliderHits(b, sq, by, PieceRules::rookDirections(), PT::Rook)) return true;

  for (const auto& d : PieceRules::kingOffsets())
    if (hasPiece(b, sq + d, by, PT::King)) return true;
  return false;
}

bool isAttackedByOpponents(const Board& b, const Roster& players, Position sq,
                           core::PlayerColor defender) {
  for (const Player& p : players) {
    if (p.color == defender || p.eliminated) continue;
    if (isSquareAttacked(b, sq, p.color)) return true;
  }
  return false;
}

}  // namespace tetra::model
