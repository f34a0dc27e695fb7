#include <cassert>

#include "tetra/model/attack_map.hpp"
#include "tetra/model/board.hpp"
#include "tetra/model/notation.hpp"
#include "tetra/model/player.hpp"

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

// reverse lookup must agree with the forward union on every square
static void checkConsistent(const model::Board& b) {
  for (int c = 0; c < core::NUM_PLAYERS; ++c) {
    const auto attacker = core::playerFromIndex(c);
    const auto set = model::attackedSquares(b, attacker);
    for (int f = 0; f < core::BOARD_SIZE; ++f) {
      for (int r = 0; r < core::BOARD_SIZE; ++r) {
        const core::Position p{f, r};
        if (!model::Board::onBoard(p)) {
          assert(set.count(p) == 0);
          assert(!model::isSquareAttacked(b, p, attacker));
          continue;
        }
        assert((set.count(p) != 0) == model::isSquareAttacked(b, p, attacker));
      }
    }
  }
}

int main() {
  // Start position
  {
    model::Board b;
    b.setupInitial();
    checkConsistent(b);

    // pawns attack diagonally forward only
    assert(model::isSquareAttacked(b, sq("e3"), PC::Red));
    assert(!model::isSquareAttacked(b, sq("e4"), PC::Red));
    assert(model::isSquareAttacked(b, sq("c5"), PC::Blue));
    assert(model::isSquareAttacked(b, sq("f12"), PC::Yellow));
    assert(model::isSquareAttacked(b, sq("l9"), PC::Green));

    // knights
    assert(model::isSquareAttacked(b, sq("d3"), PC::Red));
    assert(model::isSquareAttacked(b, sq("c6"), PC::Blue));

    // nobody reaches the centre yet
    for (int c = 0; c < core::NUM_PLAYERS; ++c)
      assert(!model::isSquareAttacked(b, sq("g7"), core::playerFromIndex(c)));
  }

  // Sliders, blocking and own-occupied squares
  {
    model::Board b;
    b.set(sq("g7"), model::Piece{PT::Queen, PC::Green});
    b.set(sq("g10"), model::Piece{PT::Pawn, PC::Green});
    b.set(sq("j7"), model::Piece{PT::Knight, PC::Red});
    b.set(sq("d4"), model::Piece{PT::King, PC::Yellow});
    checkConsistent(b);

    const auto set = model::attackedSquares(b, PC::Green);
    assert(set.count(sq("g9")) && !set.count(sq("g10")) && !set.count(sq("g11")));
    assert(set.count(sq("j7")) && !set.count(sq("k7")));
    assert(set.count(sq("d4")) && !set.count(sq("c3")));
    assert(set.count(sq("a7")) && set.count(sq("g1")));

    assert(model::isSquareAttacked(b, sq("d4"), PC::Green));
    assert(!model::isSquareAttacked(b, sq("g7"), PC::Green));
  }

  // Eliminated players give no attacks
  {
    model::Board b;
    b.set(sq("h8"), model::Piece{PT::King, PC::Red});
    b.set(sq("h12"), model::Piece{PT::Rook, PC::Yellow});
    b.set(sq("k11"), model::Piece{PT::Bishop, PC::Blue});

    auto roster = model::makeRoster();
    assert(model::isAttackedByOpponents(b, roster, sq("h8"), PC::Red));

    roster[core::pi(PC::Yellow)].eliminated = true;
    assert(model::isSquareAttacked(b, sq("h8"), PC::Blue));
    assert(model::isAttackedByOpponents(b, roster, sq("h8"), PC::Red));

    roster[core::pi(PC::Blue)].eliminated = true;
    assert(!model::isAttackedByOpponents(b, roster, sq("h8"), PC::Red));
  }

  return 0;
}
