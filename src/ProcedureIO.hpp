#pragma once
#include <string>
#include <Mahi/Util.hpp>
#include "Staircase.hpp"
#include "TrialSequence.hpp"

// JSON and CSV persistence for trial sequences and staircases. Nothing here throws:
// failures are logged and reported through the return value.

using namespace mahi::util;

/// Staircase configuration as a JSON document
json toJson(const Staircase::Params& params);
/// Fills params from a JSON document, keys missing in the document keep their defaults
bool fromJson(const json& j, Staircase::Params& params);
json toJson(const Staircase::State& state);
bool fromJson(const json& j, Staircase::State& state);
json toJson(const TrialSequence::State& state);
bool fromJson(const json& j, TrialSequence::State& state);

/// Indented JSON text of the full object state
std::string dumpState(const TrialSequence& seq);
std::string dumpState(const Staircase& stairs);

/// Exports the full object state to a JSON file
bool exportState(const TrialSequence& seq, const std::string& filepath);
bool exportState(const Staircase& stairs, const std::string& filepath);
/// Imports a state exported by exportState
bool importState(const std::string& filepath, TrialSequence::State& state);
bool importState(const std::string& filepath, Staircase::State& state);

/// Exports staircase configuration to JSON
bool exportParams(const Staircase::Params& params, const std::string& filepath);
/// Imports staircase configuration from JSON
bool importParams(const std::string& filepath, Staircase::Params& params);

/// Writes presented intensities and 0/1 responses as two CSV rows
bool exportCsv(const Staircase& stairs, const std::string& filepath);
