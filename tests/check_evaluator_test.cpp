#include <cassert>

#include "tetra/model/board.hpp"
#include "tetra/model/check_evaluator.hpp"
#include "tetra/model/notation.hpp"

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

static model::Board kingsOnly() {
  model::Board b;
  b.set(sq("h1"), model::Piece{PT::King, PC::Red});
  b.set(sq("a8"), model::Piece{PT::King, PC::Blue});
  b.set(sq("g14"), model::Piece{PT::King, PC::Yellow});
  b.set(sq("n7"), model::Piece{PT::King, PC::Green});
  return b;
}

int main() {
  model::CheckEvaluator checks;
  const auto roster = model::makeRoster();

  // Start position is quiet
  {
    model::Board b;
    b.setupInitial();
    for (int c = 0; c < core::NUM_PLAYERS; ++c) {
      const auto p = core::playerFromIndex(c);
      assert(!checks.inCheck(b, roster, p));
      assert(!checks.isCheckmated(b, roster, p));
      assert(!checks.isStalemated(b, roster, p));
    }
  }

  // Blue king boxed in on the a-file by its own pawns
  {
    model::Board b = kingsOnly();
    b.set(sq("a8"), std::nullopt);
    b.set(sq("a4"), model::Piece{PT::King, PC::Blue, true});
    b.set(sq("b4"), model::Piece{PT::Pawn, PC::Blue});
    b.set(sq("b5"), model::Piece{PT::Pawn, PC::Blue});
    b.set(sq("a11"), model::Piece{PT::Rook, PC::Red, true});

    assert(checks.inCheck(b, roster, PC::Blue));
    assert(checks.isCheckmated(b, roster, PC::Blue));
    assert(!checks.isStalemated(b, roster, PC::Blue));
    assert(!checks.inCheck(b, roster, PC::Red));

    // a blocker on the file turns it into a plain check
    b.set(sq("c7"), model::Piece{PT::Bishop, PC::Blue});
    assert(checks.inCheck(b, roster, PC::Blue));
    assert(!checks.isCheckmated(b, roster, PC::Blue));
  }

  // Red king behind its pawns, Yellow queen along the first rank
  {
    model::Board b = kingsOnly();
    b.set(sq("g2"), model::Piece{PT::Pawn, PC::Red});
    b.set(sq("h2"), model::Piece{PT::Pawn, PC::Red});
    b.set(sq("i2"), model::Piece{PT::Pawn, PC::Red});
    b.set(sq("d1"), model::Piece{PT::Queen, PC::Yellow, true});

    assert(checks.inCheck(b, roster, PC::Red));
    assert(checks.isCheckmated(b, roster, PC::Red));

    // with the queen on the d-file instead Red is not even in check
    b.set(sq("d1"), std::nullopt);
    b.set(sq("d10"), model::Piece{PT::Queen, PC::Yellow, true});
    assert(!checks.inCheck(b, roster, PC::Red));
    assert(!checks.isCheckmated(b, roster, PC::Red));
  }

  // Same king, not attacked but without a move
  {
    model::Board b = kingsOnly();
    b.set(sq("a8"), std::nullopt);
    b.set(sq("a4"), model::Piece{PT::King, PC::Blue, true});
    b.set(sq("b11"), model::Piece{PT::Rook, PC::Red, true});
    b.set(sq("e5"), model::Piece{PT::Rook, PC::Red, true});

    assert(!checks.inCheck(b, roster, PC::Blue));
    assert(checks.isStalemated(b, roster, PC::Blue));
    assert(!checks.isCheckmated(b, roster, PC::Blue));

    // eliminated players are neither stalemated nor mated
    auto out = roster;
    out[core::pi(PC::Blue)].eliminated = true;
    assert(!checks.isStalemated(b, out, PC::Blue));
    assert(!checks.isCheckmated(b, out, PC::Blue));
  }

  // Pieces of an eliminated player give no check
  {
    model::Board b = kingsOnly();
    b.set(sq("h5"), model::Piece{PT::Rook, PC::Blue, true});
    assert(checks.inCheck(b, roster, PC::Red));

    auto out = roster;
    out[core::pi(PC::Blue)].eliminated = true;
    assert(!checks.inCheck(b, out, PC::Red));
    assert(!checks.inCheck(b, out, PC::Blue));
  }

  // Check from several opponents at once
  {
    model::Board b = kingsOnly();
    b.set(sq("h9"), model::Piece{PT::Rook, PC::Yellow, true});
    b.set(sq("d5"), model::Piece{PT::Bishop, PC::Green, true});
    assert(checks.inCheck(b, roster, PC::Red));

    auto out = roster;
    out[core::pi(PC::Yellow)].eliminated = true;
    assert(checks.inCheck(b, out, PC::Red));
    out[core::pi(PC::Green)].eliminated = true;
    assert(!checks.inCheck(b, out, PC::Red));
  }

  return 0;
}
