#include "tetra/model/perft.hpp"

#include <stdexcept>

#include "tetra/model/notation.hpp"

namespace tetra::model {

namespace {

// a generated legal move must always be accepted, and undone
void playOrThrow(GameState& game, const Move& m) {
  MoveError err;
  if (!game.applyMove(m, &err))
    throw std::logic_error("perft: generated move " + moveToString(m) + " rejected: " +
                           err.message);
}

void undoOrThrow(GameState& game) {
  MoveError err;
  if (!game.undoLastMove(&err)) throw std::logic_error("perft: undo failed: " + err.message);
}

}  // namespace

std::uint64_t perft(GameState& game, int depth) {
  if (depth <= 0) return 1;

  const auto moves = game.legalMoves();
  if (depth == 1) return moves.size();

  std::uint64_t nodes = 0;
  for (const auto& m : moves) {
    playOrThrow(game, m);
    nodes += perft(game, depth - 1);
    undoOrThrow(game);
  }
  return nodes;
}

std::vector<std::pair<Move, std::uint64_t>> perftDivide(GameState& game, int depth) {
  std::vector<std::pair<Move, std::uint64_t>> out;
  if (depth <= 0) return out;

  for (const auto& m : game.legalMoves()) {
    playOrThrow(game, m);
    out.emplace_back(m, perft(game, depth - 1));
    undoOrThrow(game);
  }
  return out;
}

}  // namespace tetra::model
