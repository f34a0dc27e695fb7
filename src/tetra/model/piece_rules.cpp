#include "tetra/model/piece_rules.hpp"

#include "tetra/model/player.hpp"

namespace tetra::model {

namespace {

using core::PieceType;
using core::Position;
using PT = core::PieceType;

const std::vector<Position> kKnight = {{1, 2},  {2, 1},  {2, -1}, {1, -2},
                                       {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
const std::vector<Position> kKing = {{1, 0},  {1, 1},   {0, 1},  {-1, 1},
                                     {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
const std::vector<Position> kRook = {{1, 0}, {0, 1}, {-1, 0}, {0, -1}};
const std::vector<Position> kBishop = {{1, 1}, {-1, 1}, {-1, -1}, {1, -1}};

constexpr PieceType kPromoOrder[4] = {PT::Queen, PT::Rook, PT::Bishop, PT::Knight};

// own piece blocks, anything else (empty or enemy) is a target
inline bool enterable(const Board& b, Position to, core::PlayerColor us) {
  if (!Board::onBoard(to)) return false;
  auto occ = b.pieceAt(to);
  return !occ || occ->owner != us;
}

inline Move makeQuietOrCapture(const Board& b, Position from, Position to, const Piece& mover,
                               PieceType promo = PT::None) {
  Move m(from, to, promo);
  m.piece = mover;
  m.captured = b.pieceAt(to);
  return m;
}

void slide(const Board& b, Position from, const Piece& mover, const std::vector<Position>& dirs,
           std::vector<Move>& out) {
  for (const auto& d : dirs) {
    for (Position to = from + d; Board::onBoard(to); to = to + d) {
      auto occ = b.pieceAt(to);
      if (occ && occ->owner == mover.owner) break;
      out.push_back(makeQuietOrCapture(b, from, to, mover));
      if (occ) break;
    }
  }
}

void leap(const Board& b, Position from, const Piece& mover, const std::vector<Position>& offs,
          std::vector<Move>& out) {
  for (const auto& d : offs) {
    const Position to = from + d;
    if (enterable(b, to, mover.owner)) out.push_back(makeQuietOrCapture(b, from, to, mover));
  }
}

void slideTargets(const Board& b, Position from, core::PlayerColor us,
                  const std::vector<Position>& dirs, std::vector<Position>& out) {
  for (const auto& d : dirs) {
    for (Position to = from + d; Board::onBoard(to); to = to + d) {
      auto occ = b.pieceAt(to);
      if (occ && occ->owner == us) break;
      out.push_back(to);
      if (occ) break;
    }
  }
}

void leapTargets(const Board& b, Position from, core::PlayerColor us,
                 const std::vector<Position>& offs, std::vector<Position>& out) {
  for (const auto& d : offs) {
    const Position to = from + d;
    if (enterable(b, to, us)) out.push_back(to);
  }
}

void emitPawnMove(Move m, bool promotes, std::vector<Move>& out) {
  if (!promotes) {
    out.push_back(m);
    return;
  }
  for (PieceType pt : kPromoOrder) {
    m.promotion = pt;
    out.push_back(m);
  }
}

}  // namespace

const std::vector<Position>& PieceRules::knightOffsets() noexcept {
  return kKnight;
}
const std::vector<Position>& PieceRules::kingOffsets() noexcept {
  return kKing;
}
const std::vector<Position>& PieceRules::rookDirections() noexcept {
  return kRook;
}
const std::vector<Position>& PieceRules::bishopDirections() noexcept {
  return kBishop;
}

void PieceRules::pseudoLegalMoves(const Board& b, Position from, std::vector<Move>& out) {
  auto occ = b.pieceAt(from);
  if (!occ) return;
  const Piece& p = *occ;

  switch (p.type) {
    case PT::Pawn:
      pawnMoves(b, from, p, out);
      break;
    case PT::Knight:
      leap(b, from, p, kKnight, out);
      break;
    case PT::Bishop:
      slide(b, from, p, kBishop, out);
      break;
    case PT::Rook:
      slide(b, from, p, kRook, out);
      break;
    case PT::Queen:
      slide(b, from, p, kRook, out);
      slide(b, from, p, kBishop, out);
      break;
    case PT::King:
      leap(b, from, p, kKing, out);
      castlingMoves(b, from, p, out);
      break;
    case PT::None:
      break;
  }
}

void PieceRules::attackTargets(const Board& b, Position from, std::vector<Position>& out) {
  auto occ = b.pieceAt(from);
  if (!occ) return;
  const core::PlayerColor us = occ->owner;

  switch (occ->type) {
    case PT::Pawn: {
      const Orientation& o = orientation(us);
      for (const Position d : {o.diagLeft(), o.diagRight()}) {
        const Position to = from + d;
        if (enterable(b, to, us)) out.push_back(to);
      }
      break;
    }
    case PT::Knight:
      leapTargets(b, from, us, kKnight, out);
      break;
    case PT::Bishop:
      slideTargets(b, from, us, kBishop, out);
      break;
    case PT::Rook:
      slideTargets(b, from, us, kRook, out);
      break;
    case PT::Queen:
      slideTargets(b, from, us, kRook, out);
      slideTargets(b, from, us, kBishop, out);
      break;
    case PT::King:
      leapTargets(b, from, us, kKing, out);
      break;
    case PT::None:
      break;
  }
}

void PieceRules::pawnMoves(const Board& b, Position from, const Piece& pawn,
                           std::vector<Move>& out) {
  const Orientation& o = orientation(pawn.owner);

  // pushes
  const Position one = from + o.forward;
  if (Board::onBoard(one) && !b.occupied(one)) {
    emitPawnMove(makeQuietOrCapture(b, from, one, pawn), o.axis(one) == o.promotionLine, out);

    const Position two = one + o.forward;
    if (o.axis(from) == o.pawnLine && Board::onBoard(two) && !b.occupied(two))
      out.push_back(makeQuietOrCapture(b, from, two, pawn));
  }

  // captures incl. en passant
  for (const Position d : {o.diagLeft(), o.diagRight()}) {
    const Position to = from + d;
    if (!Board::onBoard(to)) continue;
    const bool promotes = o.axis(to) == o.promotionLine;

    if (auto occ = b.pieceAt(to)) {
      if (occ->owner != pawn.owner)
        emitPawnMove(makeQuietOrCapture(b, from, to, pawn), promotes, out);
      continue;
    }

    // An adjacent enemy pawn that just double-stepped across `to`.
    for (const auto& adj : kKing) {
      const Position victimSq = from + adj;
      auto victim = b.pieceAt(victimSq);
      if (!victim || victim->type != PT::Pawn || !victim->enPassant ||
          victim->owner == pawn.owner)
        continue;
      if (victimSq - orientation(victim->owner).forward != to) continue;

      Move m(from, to);
      m.piece = pawn;
      m.captured = victim;
      m.capturedAt = victimSq;
      m.isEnPassant = true;
      emitPawnMove(m, promotes, out);
      break;
    }
  }
}

void PieceRules::castlingMoves(const Board& b, Position from, const Piece& king,
                               std::vector<Move>& out) {
  if (king.hasMoved) return;

  for (const auto& d : kRook) {
    Position cur = from + d;
    int between = 0;
    while (Board::onBoard(cur) && !b.occupied(cur)) {
      ++between;
      cur = cur + d;
    }
    if (!Board::onBoard(cur)) continue;

    auto rook = b.pieceAt(cur);
    if (rook->type != PT::Rook || rook->owner != king.owner || rook->hasMoved) continue;
    if (between != 2 && between != 3) continue;

    Move m(from, from + d + d);
    m.piece = king;
    m.castle = (between == 2) ? CastleSide::KingSide : CastleSide::QueenSide;
    out.push_back(m);
  }
}

}  // namespace tetra::model
