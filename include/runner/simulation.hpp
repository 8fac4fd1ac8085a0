// All comments are in English.
#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>

#include <nlohmann/json.hpp>
#include "common/operation.hpp"
#include "core/engine.hpp"
#include "core/engine_config.hpp"

namespace fm {

// Engine config from JSON text / file. Missing keys keep their defaults.
EngineConfig ParseConfigJson(const nlohmann::json& j);
EngineConfig ParseConfigText(const std::string& json_text);
EngineConfig ParseConfig(const std::string& json_path);

// Operations list from JSON text / file.
std::vector<Operation> ParseOperationsJson(const nlohmann::json& j);
std::vector<Operation> ParseOperationsText(const std::string& json_text);
std::vector<Operation> ParseOperations(const std::string& json_path);

// "t0..t7" rendering of a spike train, e.g. "10100100".
std::string SpikeTrainToString(std::uint8_t spikes);

// Runs every operation on one engine (full reset in between) and logs a summary line each.
std::vector<OperationResult> RunOperations(ClockEngine& engine,
                                           const std::vector<Operation>& ops);

// One row per operation.
void WriteResultsCsv(const std::string& csv_path,
                     const std::vector<OperationResult>& results);

} // namespace fm
