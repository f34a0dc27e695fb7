#include <cassert>
#include <vector>

#include "tetra/model/game_state.hpp"
#include "tetra/model/notation.hpp"
#include "tetra/model/turn_manager.hpp"

using namespace tetra;
using PT = core::PieceType;
using PC = core::PlayerColor;

static core::Position sq(const char* s) {
  core::Position p;
  const bool ok = model::parseSquare(s, p);
  assert(ok);
  (void)ok;
  return p;
}

static bool play(model::GameState& game, const char* text) {
  model::Move m;
  if (!model::parseMove(text, m)) return false;
  return game.applyMove(m);
}

int main() {
  // Cyclic order skipping eliminated players
  {
    auto roster = model::makeRoster();
    assert(model::TurnManager::nextActiveIndex(roster, 0) == 1);
    assert(model::TurnManager::nextActiveIndex(roster, 3) == 0);

    roster[core::pi(PC::Red)].eliminated = true;
    assert(model::TurnManager::nextActiveIndex(roster, 3) == 1);

    roster[core::pi(PC::Yellow)].eliminated = true;
    assert(model::TurnManager::nextActiveIndex(roster, 1) == 3);
    assert(model::TurnManager::nextActiveIndex(roster, 3) == 1);

    roster[core::pi(PC::Green)].eliminated = true;
    assert(model::TurnManager::nextActiveIndex(roster, 1) == 1);
    assert(model::activePlayerCount(roster) == 1);
  }

  // One rook move along the fourth rank mates Blue and Green; Blue goes out first
  {
    model::PositionRecord rec;
    rec.board.set(sq("h1"), model::Piece{PT::King, PC::Red});
    rec.board.set(sq("g14"), model::Piece{PT::King, PC::Yellow});
    rec.board.set(sq("a4"), model::Piece{PT::King, PC::Blue, true});
    rec.board.set(sq("a5"), model::Piece{PT::Pawn, PC::Blue, true});
    rec.board.set(sq("b5"), model::Piece{PT::Pawn, PC::Blue});
    rec.board.set(sq("n4"), model::Piece{PT::King, PC::Green, true});
    rec.board.set(sq("n5"), model::Piece{PT::Pawn, PC::Green, true});
    rec.board.set(sq("m5"), model::Piece{PT::Pawn, PC::Green});
    rec.board.set(sq("d8"), model::Piece{PT::Rook, PC::Red, true});

    model::GameState lookup;
    lookup.setPosition(rec);
    const auto m = lookup.findMove(sq("d8"), sq("d4"));
    assert(m);

    model::RulesConfig cfg;
    cfg.checkmateBonus = 11;
    const model::TurnManager turns(cfg);
    const auto report = turns.playMove(rec.board, rec.players, rec.turn, *m);

    assert(report.eliminated.size() == 2);
    assert(report.eliminated[0] == PC::Blue);
    assert(report.eliminated[1] == PC::Green);
    assert(rec.players[core::pi(PC::Red)].score == 22);
    assert(!rec.players[core::pi(PC::Yellow)].eliminated);
    assert(rec.turn.activeIndex == core::pi(PC::Yellow));
    assert(!rec.turn.outcome.finished());
  }

  // No-progress rule: four knight moves without capture or pawn move
  {
    model::RulesConfig cfg;
    cfg.noProgressPlyLimit = 4;
    model::GameState game(cfg);

    assert(play(game, "e1f3"));
    assert(play(game, "a5c6"));
    assert(play(game, "e14f12"));
    assert(game.turn().noProgressPlies == 3);
    assert(!game.outcome().finished());
    assert(play(game, "n5l6"));
    assert(game.outcome().result == core::MOVERULE);
    assert(game.legalMoves().empty());

    assert(game.undoLastMove());
    assert(!game.outcome().finished());
    assert(game.turn().noProgressPlies == 3);
  }

  // A pawn move resets the counter
  {
    model::RulesConfig cfg;
    cfg.noProgressPlyLimit = 3;
    model::GameState game(cfg);

    assert(play(game, "e1f3"));
    assert(play(game, "a5c6"));
    assert(play(game, "e13e12"));
    assert(game.turn().noProgressPlies == 0);
    assert(play(game, "n5l6"));
    assert(game.turn().noProgressPlies == 1);
    assert(!game.outcome().finished());
  }

  // Off by default
  {
    model::GameState game;
    const std::vector<const char*> shuffle = {"e1f3", "a5c6", "e14f12", "n5l6",
                                              "f3e1", "c6a5", "f12e14", "l6n5"};
    for (int round = 0; round < 3; ++round)
      for (const char* m : shuffle) assert(play(game, m));
    assert(!game.outcome().finished());
    assert(game.turn().noProgressPlies == 24);
  }

  // Repetition: the start position seen for the third time
  {
    model::RulesConfig cfg;
    cfg.repetitionLimit = 3;
    model::GameState game(cfg);
    const auto startKey = game.positionKey();

    const std::vector<const char*> shuffle = {"e1f3", "a5c6", "e14f12", "n5l6",
                                              "f3e1", "c6a5", "f12e14", "l6n5"};
    for (const char* m : shuffle) assert(play(game, m));
    assert(game.positionKey() == startKey);
    assert(!game.outcome().finished());

    for (std::size_t i = 0; i + 1 < shuffle.size(); ++i) assert(play(game, shuffle[i]));
    assert(!game.outcome().finished());
    assert(play(game, shuffle.back()));
    assert(game.outcome().result == core::REPETITION);

    assert(game.undoLastMove());
    assert(!game.outcome().finished());
  }

  // Rules can be changed between games
  {
    model::GameState game;
    model::RulesConfig cfg = game.config();
    cfg.noProgressPlyLimit = 1;
    game.setConfig(cfg);
    assert(game.config().noProgressPlyLimit == 1);
    assert(play(game, "e1f3"));
    assert(game.outcome().result == core::MOVERULE);
  }

  return 0;
}
