#pragma once
#include <array>
#include <string>

#include "../chess_types.hpp"

namespace tetra::model {

// Per-player geometry. Pawn advance, double-step line and promotion edge are data,
// the move rules never branch on the player identity.
struct Orientation {
  core::Position forward;  // one pawn step
  int pawnLine;            // coordinate along the forward axis where the pawns start
  int promotionLine;       // far edge along the forward axis

  constexpr bool alongRanks() const noexcept { return forward.rank != 0; }
  constexpr int axis(core::Position p) const noexcept { return alongRanks() ? p.rank : p.file; }

  // the two forward diagonals (capture directions)
  constexpr core::Position diagLeft() const noexcept {
    return alongRanks() ? core::Position{-1, forward.rank} : core::Position{forward.file, -1};
  }
  constexpr core::Position diagRight() const noexcept {
    return alongRanks() ? core::Position{1, forward.rank} : core::Position{forward.file, 1};
  }
};

constexpr Orientation ORIENTATION[core::NUM_PLAYERS] = {
    {{0, 1}, 1, 13},    // Red: bottom edge, moves up the ranks
    {{1, 0}, 1, 13},    // Blue: left edge, moves along the files
    {{0, -1}, 12, 0},   // Yellow: top edge
    {{-1, 0}, 12, 0}};  // Green: right edge

constexpr inline const Orientation& orientation(core::PlayerColor c) noexcept {
  return ORIENTATION[core::pi(c)];
}

struct Player {
  core::PlayerColor color = core::PlayerColor::Red;
  bool eliminated = false;
  int score = 0;
};

constexpr inline bool operator==(const Player& a, const Player& b) noexcept {
  return a.color == b.color && a.eliminated == b.eliminated && a.score == b.score;
}
constexpr inline bool operator!=(const Player& a, const Player& b) noexcept {
  return !(a == b);
}

// indexed by core::pi(color), fixed cyclic order
using Roster = std::array<Player, core::NUM_PLAYERS>;

Roster makeRoster() noexcept;
int activePlayerCount(const Roster& players) noexcept;

char colorChar(core::PlayerColor c) noexcept;  // 'r', 'b', 'y', 'g'
bool colorFromChar(char ch, core::PlayerColor& out) noexcept;
std::string colorName(core::PlayerColor c);

}  // namespace tetra::model
