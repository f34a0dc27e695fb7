#pragma once
#include <cstdint>

#include "board.hpp"
#include "player.hpp"

namespace tetra::model {

constexpr int NUM_SQUARES = core::BOARD_SIZE * core::BOARD_SIZE;

struct Zobrist {
  // Zobrist-Tables
  static std::uint64_t piece[core::NUM_PLAYERS][6][NUM_SQUARES];
  static std::uint64_t unmoved[NUM_SQUARES];    // unmoved king/rook (castling still possible)
  static std::uint64_t enPassant[NUM_SQUARES];  // flagged pawn
  static std::uint64_t side[core::NUM_PLAYERS];
  static std::uint64_t eliminated[core::NUM_PLAYERS];

  static void init(std::uint64_t seed);
  static void init();  // fixed seed, runs once (thread-safe)

  static inline int index(core::Position p) noexcept { return p.rank * core::BOARD_SIZE + p.file; }

  // Full key of (board, roster, player to move). Used for repetition detection.
  static std::uint64_t compute(const Board& b, const Roster& players, core::PlayerColor toMove);
};

}  // namespace tetra::model
