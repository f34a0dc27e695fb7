#pragma once
#include <cstdint>

#include "../chess_types.hpp"

namespace tetra::model {

struct Piece {
  core::PieceType type = core::PieceType::None;
  core::PlayerColor owner = core::PlayerColor::Red;
  bool hasMoved = false;
  bool enPassant = false;  // pawn double-stepped on the last ply

  constexpr Piece() noexcept = default;
  constexpr Piece(core::PieceType t, core::PlayerColor o, bool moved = false,
                  bool ep = false) noexcept
      : type(t), owner(o), hasMoved(moved), enPassant(ep) {}
};

constexpr inline bool operator==(const Piece& a, const Piece& b) noexcept {
  return a.type == b.type && a.owner == b.owner && a.hasMoved == b.hasMoved &&
         a.enPassant == b.enPassant;
}
constexpr inline bool operator!=(const Piece& a, const Piece& b) noexcept {
  return !(a == b);
}

}  // namespace tetra::model
