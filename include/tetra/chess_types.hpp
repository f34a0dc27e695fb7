#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>

namespace tetra::core {

constexpr int BOARD_SIZE = 14;   // 14x14 index space
constexpr int CORNER_SIZE = 3;   // 3x3 corners are cut away
constexpr int NUM_PLAYERS = 4;

enum class PieceType : std::uint8_t { Pawn, Knight, Bishop, Rook, Queen, King, None };

// fixed turn order: Red -> Blue -> Yellow -> Green
enum class PlayerColor : std::uint8_t { Red = 0, Blue = 1, Yellow = 2, Green = 3 };

constexpr inline int pi(PlayerColor c) noexcept {
  return static_cast<int>(c);
}
constexpr inline PlayerColor playerFromIndex(int i) noexcept {
  return static_cast<PlayerColor>(((i % NUM_PLAYERS) + NUM_PLAYERS) % NUM_PLAYERS);
}
constexpr inline PlayerColor nextColor(PlayerColor c) noexcept {
  return playerFromIndex(pi(c) + 1);
}

struct Position {
  int file = 0;  // 0..13 -> 'a'..'n'
  int rank = 0;  // 0..13 -> 1..14

  constexpr Position() noexcept = default;
  constexpr Position(int f, int r) noexcept : file(f), rank(r) {}

  constexpr Position operator+(const Position& d) const noexcept {
    return Position{file + d.file, rank + d.rank};
  }
  constexpr Position operator-(const Position& d) const noexcept {
    return Position{file - d.file, rank - d.rank};
  }
};

constexpr inline bool operator==(const Position& a, const Position& b) noexcept {
  return a.file == b.file && a.rank == b.rank;
}
constexpr inline bool operator!=(const Position& a, const Position& b) noexcept {
  return !(a == b);
}
// row-major, used for deterministic ordering in tests and snapshots
constexpr inline bool operator<(const Position& a, const Position& b) noexcept {
  return a.rank != b.rank ? a.rank < b.rank : a.file < b.file;
}

struct PositionHash {
  std::size_t operator()(const Position& p) const noexcept {
    return std::hash<int>{}(p.rank * BOARD_SIZE + p.file);
  }
};

}  // namespace tetra::core

namespace std {
template <>
struct hash<tetra::core::Position> {
  std::size_t operator()(const tetra::core::Position& p) const noexcept {
    return tetra::core::PositionHash{}(p);
  }
};
}  // namespace std
