#pragma once
#include <cstdint>
#include <optional>

#include "../chess_types.hpp"
#include "piece.hpp"

namespace tetra::model {

enum class CastleSide : std::uint8_t { None = 0, KingSide, QueenSide };

// Immutable record of one ply. `piece` is the mover as it stood on `from` before the move,
// `captured` the removed piece (on `capturedAt`, which differs from `to` only for en passant).
// Together they make every move reversible without consulting the board history.
struct Move {
  core::Position from{};
  core::Position to{};
  Piece piece{};
  std::optional<Piece> captured{};
  core::Position capturedAt{};
  core::PieceType promotion = core::PieceType::None;
  bool isEnPassant = false;
  CastleSide castle = CastleSide::None;

  Move() = default;
  Move(core::Position f, core::Position t, core::PieceType promo = core::PieceType::None)
      : from(f), to(t), capturedAt(t), promotion(promo) {}

  bool isCapture() const noexcept { return captured.has_value(); }
};

// Identity of a move from the caller's point of view: where from, where to, which promotion.
// Snapshots (piece, captured) are derived by the generator.
inline bool operator==(const Move& a, const Move& b) noexcept {
  return a.from == b.from && a.to == b.to && a.promotion == b.promotion &&
         a.isEnPassant == b.isEnPassant && a.castle == b.castle;
}
inline bool operator!=(const Move& a, const Move& b) noexcept {
  return !(a == b);
}

}  // namespace tetra::model
