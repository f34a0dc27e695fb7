#include "tetra/model/move_helper.hpp"

#include <cstdlib>

#include "tetra/model/player.hpp"

namespace tetra::model {

namespace {
inline int sign(int v) noexcept {
  return (v > 0) - (v < 0);
}
}  // namespace

std::pair<core::Position, core::Position> castleRookSquares(const Move& m) noexcept {
  const core::Position d{sign(m.to.file - m.from.file), sign(m.to.rank - m.from.rank)};
  const int dist = (m.castle == CastleSide::KingSide) ? 3 : 4;
  const core::Position rookFrom{m.from.file + d.file * dist, m.from.rank + d.rank * dist};
  return {rookFrom, m.from + d};
}

std::optional<core::Position> makeMove(Board& b, const Move& m) {
  // en-passant eligibility lives for exactly one ply
  std::optional<core::Position> cleared;
  for (const auto& [pos, piece] : b.pieces()) {
    if (piece.enPassant) {
      cleared = pos;
      break;
    }
  }
  if (cleared) {
    Piece p = *b.pieceAt(*cleared);
    p.enPassant = false;
    b.set(*cleared, p);
  }

  if (m.captured) b.set(m.capturedAt, std::nullopt);

  Piece moved = m.piece;
  moved.hasMoved = true;
  moved.enPassant = false;
  if (moved.type == core::PieceType::Pawn) {
    const Orientation& o = orientation(moved.owner);
    if (std::abs(o.axis(m.to) - o.axis(m.from)) == 2) moved.enPassant = true;
  }
  if (m.promotion != core::PieceType::None) moved.type = m.promotion;

  b.set(m.from, std::nullopt);
  b.set(m.to, moved);

  if (m.castle != CastleSide::None) {
    const auto [rookFrom, rookTo] = castleRookSquares(m);
    Piece rook = *b.pieceAt(rookFrom);
    rook.hasMoved = true;
    b.set(rookFrom, std::nullopt);
    b.set(rookTo, rook);
  }
  return cleared;
}

void unmakeMove(Board& b, const Move& m, std::optional<core::Position> clearedEnPassant) {
  if (m.castle != CastleSide::None) {
    const auto [rookFrom, rookTo] = castleRookSquares(m);
    Piece rook = *b.pieceAt(rookTo);
    rook.hasMoved = false;  // castling requires an unmoved rook
    b.set(rookTo, std::nullopt);
    b.set(rookFrom, rook);
  }

  b.set(m.to, std::nullopt);
  b.set(m.from, m.piece);
  if (m.captured) b.set(m.capturedAt, *m.captured);

  if (clearedEnPassant) {
    if (auto p = b.pieceAt(*clearedEnPassant)) {
      p->enPassant = true;
      b.set(*clearedEnPassant, *p);
    }
  }
}

}  // namespace tetra::model
