// All comments are in English.
#include "runner/simulation.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>

using nlohmann::json;

namespace fm {

namespace {

std::string ReadAllText(const std::string& path, const char* who) {
  std::ifstream ifs(path);
  if (!ifs) throw std::runtime_error(std::string(who) + ": cannot open json file: " + path);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

Mask128 ParseMask(const json& jop, const char* key, const std::string& op_name) {
  if (!jop.contains(key) || !jop[key].is_string()) {
    throw std::invalid_argument("ParseOperations: operation '" + op_name +
                                "' missing hex string '" + key + "'");
  }
  return Mask128::FromHex(jop[key].get<std::string>());
}

} // namespace

EngineConfig ParseConfigJson(const json& j) {
  if (!j.is_object()) throw std::invalid_argument("ParseConfig: top level must be an object");

  EngineConfig cfg;
  cfg.threshold        = j.value("threshold", cfg.threshold);
  cfg.activity_latency = j.value("activity_latency", cfg.activity_latency);
  cfg.backpressure     = j.value("backpressure", cfg.backpressure);
  cfg.neuron_start     = j.value("neuron_start", cfg.neuron_start);
  cfg.verbose          = j.value("verbose", cfg.verbose);

  // Unsigned knobs: read signed first so a negative value is reported, not wrapped.
  const long long deadlock = j.value("deadlock_cycles", static_cast<long long>(cfg.deadlock_cycles));
  const long long max_cyc  = j.value("max_cycles", static_cast<long long>(cfg.max_cycles));

  if (cfg.activity_latency < 0) {
    throw std::invalid_argument("ParseConfig: activity_latency must be >= 0");
  }
  if (deadlock <= 0) throw std::invalid_argument("ParseConfig: deadlock_cycles must be > 0");
  if (max_cyc <= 0)  throw std::invalid_argument("ParseConfig: max_cycles must be > 0");
  cfg.deadlock_cycles = static_cast<std::uint64_t>(deadlock);
  cfg.max_cycles      = static_cast<std::uint64_t>(max_cyc);
  return cfg;
}

EngineConfig ParseConfigText(const std::string& json_text) {
  return ParseConfigJson(json::parse(json_text));
}

EngineConfig ParseConfig(const std::string& json_path) {
  return ParseConfigText(ReadAllText(json_path, "ParseConfig"));
}

std::vector<Operation> ParseOperationsJson(const json& j) {
  if (!j.contains("operations") || !j["operations"].is_array()) {
    throw std::invalid_argument("ParseOperations: missing 'operations' array");
  }

  std::vector<Operation> out;
  out.reserve(j["operations"].size());

  for (const auto& jop : j["operations"]) {
    Operation op;
    op.name   = jop.value("name", std::string("op") + std::to_string(out.size()));
    op.mask_a = ParseMask(jop, "mask_a", op.name);
    op.mask_b = ParseMask(jop, "mask_b", op.name);

    // weights: dense list indexed by rank in B, zero-padded to 128.
    if (jop.contains("weights")) {
      const auto& jw = jop.at("weights");
      if (!jw.is_array() || jw.size() > static_cast<std::size_t>(kMaskBits)) {
        throw std::invalid_argument("ParseOperations: '" + op.name +
                                    "' weights must be an array of at most 128 entries");
      }
      for (std::size_t i = 0; i < jw.size(); ++i) {
        const long long w = jw[i].get<long long>();
        if (w < -128 || w > 127) {
          throw std::invalid_argument("ParseOperations: '" + op.name + "' weight[" +
                                      std::to_string(i) + "]=" + std::to_string(w) +
                                      " does not fit in 8 bits");
        }
        op.weights[i] = static_cast<Weight>(w);
      }
      if (jw.size() < static_cast<std::size_t>(op.mask_b.Popcount())) {
        std::cerr << "[ParseOperations][Warn] '" << op.name << "' has " << jw.size()
                  << " weights for " << op.mask_b.Popcount()
                  << " set bits in mask_b; missing weights read as 0.\n";
      }
    }

    // activity: memory image, slot k = k-th set bit of A.
    if (jop.contains("activity")) {
      const auto& ja = jop.at("activity");
      if (!ja.is_array() || ja.size() > kActivityDepth) {
        throw std::invalid_argument("ParseOperations: '" + op.name +
                                    "' activity must be an array of at most 128 entries");
      }
      op.activity.reserve(ja.size());
      for (const auto& v : ja) {
        const long long p = v.get<long long>();
        if (p < 0 || p > 255) {
          throw std::invalid_argument("ParseOperations: '" + op.name +
                                      "' activity pattern out of 8-bit range");
        }
        op.activity.push_back(static_cast<std::uint8_t>(p));
      }
    }

    out.push_back(std::move(op));
  }
  return out;
}

std::vector<Operation> ParseOperationsText(const std::string& json_text) {
  return ParseOperationsJson(json::parse(json_text));
}

std::vector<Operation> ParseOperations(const std::string& json_path) {
  return ParseOperationsText(ReadAllText(json_path, "ParseOperations"));
}

std::string SpikeTrainToString(std::uint8_t spikes) {
  std::string s(kTimesteps, '0');
  for (int t = 0; t < kTimesteps; ++t) {
    if ((spikes >> t) & 1u) s[t] = '1';
  }
  return s;
}

std::vector<OperationResult> RunOperations(ClockEngine& engine,
                                           const std::vector<Operation>& ops) {
  std::vector<OperationResult> results;
  results.reserve(ops.size());
  for (const auto& op : ops) {
    OperationResult r = engine.RunOperation(op);
    std::cout << "[Simulation] " << r.name
              << ": matches=" << r.matches.size()
              << " corrections=" << r.corrections.size()
              << " drops=" << r.stats.overflow_drops
              << " acc=" << r.pseudo_accumulator
              << " spikes=" << SpikeTrainToString(r.final_spike_train())
              << " cycles=" << r.cycles << "\n";
    results.push_back(std::move(r));
  }
  return results;
}

void WriteResultsCsv(const std::string& csv_path,
                     const std::vector<OperationResult>& results) {
  const std::filesystem::path path(csv_path);
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::out | std::ios::trunc);
  if (!ofs) {
    throw std::runtime_error("WriteResultsCsv: failed to open " + csv_path);
  }

  ofs << "name,cycles,matches,corrections,overflow_drops,backpressure_stalls,"
         "pseudo_accumulator,final_spikes,neuron_runs,queue_wait_avg,queue_wait_max\n";
  for (const auto& r : results) {
    const double wait_avg = (r.stats.queue_wait.count == 0)
        ? 0.0
        : static_cast<double>(r.stats.queue_wait.total) /
          static_cast<double>(r.stats.queue_wait.count);
    ofs << std::quoted(r.name) << ','
        << r.cycles << ','
        << r.matches.size() << ','
        << r.corrections.size() << ','
        << r.stats.overflow_drops << ','
        << r.stats.backpressure_stalls << ','
        << r.pseudo_accumulator << ','
        << SpikeTrainToString(r.final_spike_train()) << ','
        << r.stats.neuron_runs << ','
        << std::fixed << std::setprecision(3) << wait_avg << ','
        << r.stats.queue_wait.max << '\n';
  }
  ofs.flush();
  std::cout << "[Simulation] Results CSV written to " << path << "\n";
}

} // namespace fm
