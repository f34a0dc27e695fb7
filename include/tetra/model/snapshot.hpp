#pragma once

#include <string>

#include "game_state.hpp"

namespace tetra::model {

// Text snapshot of a game:
//
//   tetra-snapshot 1
//   rules   <checkmate bonus> <no-progress ply limit> <repetition limit>
//   start   <record>
//   moves   <move> <move> ...
//   current <record>
//
// record = <active> <players> <outcome> <no-progress plies> <board>
//   active   color letter (r, b, y, g)
//   players  r:<eliminated 0|1>:<score>,b:...,y:...,g:...
//   outcome  *, win-<color>, stalemate, moverule, repetition
//   board    rank 14 down to rank 1, rows separated by '/', cells by ','; a number is a run of
//            empty squares, a piece is color letter + piece letter, '+' if it has moved,
//            '^' if it may be taken en passant
//
// Loading replays the moves from `start` under `rules` and requires the result to equal
// `current`. The loaded game takes over those rules; `verbose` stays as the target had it.
// Without a rules line the target's rules are used.
std::string writeSnapshot(const GameState& game);
bool readSnapshot(const std::string& text, GameState& game, std::string* error = nullptr);

// single record, as used on the start/current lines
std::string writePositionRecord(const PositionRecord& pos);
bool readPositionRecord(const std::string& text, PositionRecord& out, std::string* error = nullptr);

}  // namespace tetra::model
