// All comments are in English.
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "runner/simulation.hpp"

int main(int argc, char** argv) {
  // Usage: ./fibremac_sim <config.json> <operations.json>
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <config.json> <operations.json>\n";
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string ops_path    = argv[2];

  try {
    // (1) Parse engine config and operations
    const fm::EngineConfig cfg = fm::ParseConfig(config_path);
    const auto ops = fm::ParseOperations(ops_path);

    // (2) Run every operation on one engine
    fm::ClockEngine engine(cfg);
    const auto results = fm::RunOperations(engine, ops);

    // (3) Stats
    namespace fs = std::filesystem;
    std::string stem = fs::path(ops_path).stem().string();
    if (stem.empty()) stem = "operations";
    fm::WriteResultsCsv((fs::path("stats") / (stem + "__results.csv")).string(), results);

    const auto& st = engine.stats();
    std::cout << "[Simulation] operations=" << st.operations
              << " cycles=" << st.cycles
              << " matches=" << st.matches
              << " drops=" << st.overflow_drops
              << " reset_hazards=" << st.reset_hazards << "\n";
    std::cout << "[Simulation] Completed successfully.\n";
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[Simulation] Error: " << ex.what() << "\n";
    return 2;
  }
}
