#include <algorithm>
#include <cassert>
#include <vector>

#include "tetra/model/attack_map.hpp"
#include "tetra/model/board.hpp"
#include "tetra/model/move_generator.hpp"
#include "tetra/model/move_helper.hpp"
#include "tetra/model/notation.hpp"

using namespace tetra;
using PT = core::PieceType;
using PC = core::PlayerColor;
using Rejection = model::MoveGenerator::Rejection;

static core::Position sq(const char* s) {
  core::Position p;
  const bool ok = model::parseSquare(s, p);
  assert(ok);
  (void)ok;
  return p;
}

static const model::Move* lookup(const std::vector<model::Move>& moves, const char* text) {
  model::Move m;
  const bool ok = model::parseMove(text, m);
  assert(ok);
  (void)ok;
  auto it = std::find_if(moves.begin(), moves.end(), [&](const model::Move& c) {
    return c.from == m.from && c.to == m.to && c.promotion == m.promotion;
  });
  return it == moves.end() ? nullptr : &*it;
}

// every legal move keeps the mover's king out of all remaining opponents' attacks
static void checkSelfCheckFree(const model::Board& b, const model::Roster& roster, PC side) {
  model::MoveGenerator gen;
  std::vector<model::Move> legal;
  gen.generateLegalMoves(b, roster, side, legal);
  for (const auto& m : legal) {
    assert(!(m.captured && m.captured->type == PT::King));
    model::Board scratch = b;
    model::makeMove(scratch, m);
    const auto king = scratch.kingPosition(side);
    assert(king);
    assert(!model::isAttackedByOpponents(scratch, roster, *king, side));
  }
}

// four kings in their home squares, nothing else
static model::Board kingsOnly() {
  model::Board b;
  b.set(sq("h1"), model::Piece{PT::King, PC::Red});
  b.set(sq("a8"), model::Piece{PT::King, PC::Blue});
  b.set(sq("g14"), model::Piece{PT::King, PC::Yellow});
  b.set(sq("n7"), model::Piece{PT::King, PC::Green});
  return b;
}

int main() {
  model::MoveGenerator gen;
  const auto roster = model::makeRoster();

  // Start position: 20 moves each, none of them castling
  {
    model::Board b;
    b.setupInitial();
    for (int c = 0; c < core::NUM_PLAYERS; ++c) {
      std::vector<model::Move> legal;
      gen.generateLegalMoves(b, roster, core::playerFromIndex(c), legal);
      assert(legal.size() == 20);
      checkSelfCheckFree(b, roster, core::playerFromIndex(c));
    }

    // the board is never modified by generation
    model::Board copy;
    copy.setupInitial();
    assert(b == copy);
  }

  // Pinned rook may only move along the pin line
  {
    model::Board b = kingsOnly();
    b.set(sq("h2"), model::Piece{PT::Rook, PC::Red});
    b.set(sq("h12"), model::Piece{PT::Rook, PC::Yellow});

    std::vector<model::Move> legal;
    gen.generateLegalMovesFrom(b, roster, sq("h2"), legal);
    assert(!legal.empty());
    for (const auto& m : legal) assert(m.to.file == sq("h2").file);
    assert(lookup(legal, "h2h12"));

    std::vector<model::Move> pseudo;
    gen.generatePseudoLegalMoves(b, PC::Red, pseudo);
    const auto* sideways = lookup(pseudo, "h2e2");
    assert(sideways);
    assert(gen.classify(b, roster, *sideways) == Rejection::LeavesKingInCheck);
    assert(!gen.isLegal(b, roster, *sideways));

    checkSelfCheckFree(b, roster, PC::Red);

    // the pin is released once its owner is eliminated
    auto out = roster;
    out[core::pi(PC::Yellow)].eliminated = true;
    assert(gen.isLegal(b, out, *sideways));
  }

  // Kings are never captured
  {
    model::Board b = kingsOnly();
    b.set(sq("a10"), model::Piece{PT::Rook, PC::Red});

    std::vector<model::Move> pseudo;
    gen.generatePseudoLegalMoves(b, PC::Red, pseudo);
    const auto* capture = lookup(pseudo, "a10a8");
    assert(capture && capture->captured && capture->captured->type == PT::King);
    assert(gen.classify(b, roster, *capture) == Rejection::KingCapture);

    std::vector<model::Move> legal;
    gen.generateLegalMoves(b, roster, PC::Red, legal);
    assert(!lookup(legal, "a10a8"));
    assert(lookup(legal, "a10a9"));
  }

  // Castling: start and transit square must not be attacked, destination neither
  {
    model::Board b = kingsOnly();
    b.set(sq("d1"), model::Piece{PT::Rook, PC::Red});
    b.set(sq("k1"), model::Piece{PT::Rook, PC::Red});

    std::vector<model::Move> legal;
    gen.generateLegalMovesFrom(b, roster, sq("h1"), legal);
    const auto* kingSide = lookup(legal, "h1j1");
    const auto* queenSide = lookup(legal, "h1f1");
    assert(kingSide && kingSide->castle == model::CastleSide::KingSide);
    assert(queenSide && queenSide->castle == model::CastleSide::QueenSide);

    // Yellow rook covers the transit square i1
    b.set(sq("i13"), model::Piece{PT::Rook, PC::Yellow});
    std::vector<model::Move> pseudo;
    gen.generatePseudoLegalMoves(b, PC::Red, pseudo);
    const auto* through = lookup(pseudo, "h1j1");
    assert(through);
    assert(gen.classify(b, roster, *through) == Rejection::CastlesThroughCheck);

    legal.clear();
    gen.generateLegalMovesFrom(b, roster, sq("h1"), legal);
    assert(!lookup(legal, "h1j1"));
    assert(lookup(legal, "h1f1"));
    checkSelfCheckFree(b, roster, PC::Red);

    // Blue bishop hits the destination j1 only
    b.set(sq("i13"), std::nullopt);
    b.set(sq("e6"), model::Piece{PT::Bishop, PC::Blue});
    pseudo.clear();
    gen.generatePseudoLegalMoves(b, PC::Red, pseudo);
    through = lookup(pseudo, "h1j1");
    assert(through);
    assert(gen.classify(b, roster, *through) == Rejection::CastlesThroughCheck);

    // no castling out of check
    b.set(sq("e6"), std::nullopt);
    b.set(sq("h9"), model::Piece{PT::Rook, PC::Green});
    legal.clear();
    gen.generateLegalMovesFrom(b, roster, sq("h1"), legal);
    assert(!lookup(legal, "h1j1") && !lookup(legal, "h1f1"));
    assert(lookup(legal, "h1g2"));
  }

  // Eliminated players have no moves
  {
    model::Board b;
    b.setupInitial();
    auto out = roster;
    out[core::pi(PC::Green)].eliminated = true;

    std::vector<model::Move> legal;
    gen.generateLegalMoves(b, out, PC::Green, legal);
    assert(legal.empty());
    gen.generateLegalMovesFrom(b, out, sq("m5"), legal);
    assert(legal.empty());
    assert(!gen.hasLegalMove(b, out, PC::Green));
    assert(gen.hasLegalMove(b, out, PC::Red));
  }

  // Crowded middle game position stays free of self-check for every side
  {
    model::Board b = kingsOnly();
    b.set(sq("g7"), model::Piece{PT::Queen, PC::Yellow, true});
    b.set(sq("h2"), model::Piece{PT::Bishop, PC::Red, true});
    b.set(sq("b8"), model::Piece{PT::Knight, PC::Blue, true});
    b.set(sq("m7"), model::Piece{PT::Pawn, PC::Green});
    b.set(sq("k4"), model::Piece{PT::Rook, PC::Green, true});
    b.set(sq("c9"), model::Piece{PT::Pawn, PC::Blue, true});
    b.set(sq("f13"), model::Piece{PT::Pawn, PC::Yellow});
    b.set(sq("i3"), model::Piece{PT::Knight, PC::Red, true});
    for (int c = 0; c < core::NUM_PLAYERS; ++c)
      checkSelfCheckFree(b, roster, core::playerFromIndex(c));
  }

  return 0;
}
