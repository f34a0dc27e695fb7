#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "tetra/model/game_state.hpp"
#include "tetra/model/notation.hpp"
#include "tetra/model/perft.hpp"
#include "tetra/model/snapshot.hpp"

using namespace tetra;

// usage: tetra_perft <depth> [snapshot-file] [--divide]
int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <depth> [snapshot-file] [--divide]\n";
    return 1;
  }

  int depth = 0;
  try {
    depth = std::stoi(argv[1]);
  } catch (const std::exception& e) {
    std::cerr << "[Perft] bad depth '" << argv[1] << "': " << e.what() << "\n";
    return 1;
  }

  bool divide = false;
  std::string snapshotPath;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--divide")
      divide = true;
    else
      snapshotPath = arg;
  }

  model::GameState game = model::GameState::newGame();
  if (!snapshotPath.empty()) {
    std::ifstream in(snapshotPath);
    if (!in) {
      std::cerr << "[Perft] cannot open " << snapshotPath << "\n";
      return 1;
    }
    std::string content((std::istreambuf_iterator<char>(in)), {});
    std::string error;
    if (!model::readSnapshot(content, game, &error)) {
      std::cerr << "[Perft] " << snapshotPath << ": " << error << "\n";
      return 1;
    }
  }

  auto t0 = std::chrono::steady_clock::now();
  std::uint64_t nodes = 0;
  try {
    if (divide) {
      for (const auto& [m, n] : model::perftDivide(game, depth)) {
        std::cout << model::moveToString(m) << ": " << n << "\n";
        nodes += n;
      }
    } else {
      nodes = model::perft(game, depth);
    }
  } catch (const std::logic_error& e) {
    std::cerr << "[Perft] " << e.what() << "\n";
    return 1;
  }
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - t0)
                .count();

  std::cout << "depth " << depth << " nodes " << nodes << " time " << ms << "ms\n";
  return 0;
}
