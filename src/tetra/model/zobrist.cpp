#include "tetra/model/zobrist.hpp"

#include <mutex>

namespace tetra::model {

// Static storage
std::uint64_t Zobrist::piece[core::NUM_PLAYERS][6][NUM_SQUARES];
std::uint64_t Zobrist::unmoved[NUM_SQUARES];
std::uint64_t Zobrist::enPassant[NUM_SQUARES];
std::uint64_t Zobrist::side[core::NUM_PLAYERS];
std::uint64_t Zobrist::eliminated[core::NUM_PLAYERS];

namespace {
// SplitMix64: fast, well distributed, deterministic
inline std::uint64_t splitmix64(std::uint64_t& x) {
  std::uint64_t z = (x += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

std::once_flag g_once_init;
}  // namespace

void Zobrist::init(std::uint64_t seed) {
  auto next = [&]() {
    std::uint64_t v;
    do {
      v = splitmix64(seed);
    } while (v == 0);
    return v;
  };

  for (int c = 0; c < core::NUM_PLAYERS; ++c)
    for (int t = 0; t < 6; ++t)
      for (int s = 0; s < NUM_SQUARES; ++s) piece[c][t][s] = next();

  for (int s = 0; s < NUM_SQUARES; ++s) unmoved[s] = next();
  for (int s = 0; s < NUM_SQUARES; ++s) enPassant[s] = next();
  for (int c = 0; c < core::NUM_PLAYERS; ++c) side[c] = next();
  for (int c = 0; c < core::NUM_PLAYERS; ++c) eliminated[c] = next();
}

void Zobrist::init() {
  std::call_once(g_once_init, [] { Zobrist::init(0xC0FFEE123456789ULL); });
}

std::uint64_t Zobrist::compute(const Board& b, const Roster& players, core::PlayerColor toMove) {
  init();
  std::uint64_t h = 0;
  for (const auto& [pos, p] : b.pieces()) {
    const int s = index(pos);
    h ^= piece[core::pi(p.owner)][static_cast<int>(p.type)][s];
    if (!p.hasMoved && (p.type == core::PieceType::King || p.type == core::PieceType::Rook))
      h ^= unmoved[s];
    if (p.enPassant) h ^= enPassant[s];
  }
  for (const Player& pl : players)
    if (pl.eliminated) h ^= eliminated[core::pi(pl.color)];
  h ^= side[core::pi(toMove)];
  return h;
}

}  // namespace tetra::model
