#include "tetra/model/move_generator.hpp"

#include "tetra/model/attack_map.hpp"
#include "tetra/model/move_helper.hpp"
#include "tetra/model/piece_rules.hpp"

namespace tetra::model {

namespace {

using PT = core::PieceType;

inline bool isEliminated(const Roster& players, core::PlayerColor c) noexcept {
  return players[core::pi(c)].eliminated;
}

}  // namespace

void MoveGenerator::generatePseudoLegalMoves(const Board& b, core::PlayerColor side,
                                             std::vector<Move>& out) const {
  for (const auto& [pos, piece] : b.pieces())
    if (piece.owner == side) PieceRules::pseudoLegalMoves(b, pos, out);
}

MoveGenerator::Rejection MoveGenerator::classify(const Board& b, const Roster& players,
                                                 const Move& m) const {
  const core::PlayerColor us = m.piece.owner;

  if (m.captured && m.captured->type == PT::King) return Rejection::KingCapture;

  if (m.castle != CastleSide::None) {
    // start and transit square; the destination is covered by the simulation below
    const core::Position transit = Board::squaresBetween(m.from, m.to).front();
    if (isAttackedByOpponents(b, players, m.from, us) ||
        isAttackedByOpponents(b, players, transit, us))
      return Rejection::CastlesThroughCheck;
  }

  Board scratch = b;
  makeMove(scratch, m);
  const auto king = scratch.kingPosition(us);
  if (king && isAttackedByOpponents(scratch, players, *king, us)) {
    return m.castle != CastleSide::None ? Rejection::CastlesThroughCheck
                                        : Rejection::LeavesKingInCheck;
  }
  return Rejection::None;
}

bool MoveGenerator::isLegal(const Board& b, const Roster& players, const Move& m) const {
  return classify(b, players, m) == Rejection::None;
}

void MoveGenerator::generateLegalMoves(const Board& b, const Roster& players,
                                       core::PlayerColor side, std::vector<Move>& out) const {
  if (isEliminated(players, side)) return;

  std::vector<Move> pseudo;
  pseudo.reserve(64);
  generatePseudoLegalMoves(b, side, pseudo);
  for (const auto& m : pseudo)
    if (isLegal(b, players, m)) out.push_back(m);
}

void MoveGenerator::generateLegalMovesFrom(const Board& b, const Roster& players,
                                           core::Position from, std::vector<Move>& out) const {
  auto occ = b.pieceAt(from);
  if (!occ || isEliminated(players, occ->owner)) return;

  std::vector<Move> pseudo;
  PieceRules::pseudoLegalMoves(b, from, pseudo);
  for (const auto& m : pseudo)
    if (isLegal(b, players, m)) out.push_back(m);
}

bool MoveGenerator::hasLegalMove(const Board& b, const Roster& players,
                                 core::PlayerColor side) const {
  if (isEliminated(players, side)) return false;

  std::vector<Move> pseudo;
  pseudo.reserve(64);
  generatePseudoLegalMoves(b, side, pseudo);
  for (const auto& m : pseudo)
    if (isLegal(b, players, m)) return true;
  return false;
}

}  // namespace tetra::model
