#include "ProcedureIO.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string stepTypeName(Staircase::StepType type) {
    switch (type) {
        case Staircase::Db:  return "db";
        case Staircase::Log: return "log";
        case Staircase::Lin: return "lin";
    }
    return "db";
}

Staircase::StepType parseStepType(const std::string& name) {
    if (name == "db")  return Staircase::Db;
    if (name == "log") return Staircase::Log;
    if (name == "lin") return Staircase::Lin;
    throw std::invalid_argument("unknown step_type " + name);
}

Staircase::Direction parseDirection(const std::string& name) {
    if (name == "up")   return Staircase::Up;
    if (name == "down") return Staircase::Down;
    throw std::invalid_argument("unknown current_direction " + name);
}

json optionalToJson(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<double> optionalFromJson(const json& j) {
    if (j.is_null())
        return std::nullopt;
    return j.get<double>();
}

bool writeJson(const json& j, const std::string& filepath, const std::string& what) {
    fs::path path(filepath);
    std::ofstream file(path);
    if (file.is_open()) {
        file << std::setw(4) << j;
        LOG(Info) << "Exported " << what << " to " << path.generic_string();
        file.close();
        return true;
    }
    LOG(Error) << "Failed to export " << what << " because " << path << " could not be created or opened.";
    return false;
}

bool readJson(const std::string& filepath, json& j, const std::string& what) {
    fs::path path(filepath);
    if (!fs::exists(path)) {
        LOG(Error) << "Failed to import " << what << " because " << path << " does not exist.";
        return false;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG(Error) << "Failed to import " << what << " because " << path << " could not be opened.";
        return false;
    }
    try {
        file >> j;
    }
    catch (const json::exception& e) {
        LOG(Error) << "Failed to import " << what << " from " << path.generic_string() << ": " << e.what();
        return false;
    }
    return true;
}

} // namespace

//=============================================================================
// STAIRCASE
//=============================================================================

json toJson(const Staircase::Params& params) {
    json j;
    j["name"]        = params.name;
    j["start_val"]   = params.start_val;
    j["n_reversals"] = params.n_reversals;
    j["step_sizes"]  = params.step_sizes;
    j["n_trials"]    = params.n_trials;
    j["n_up"]        = params.n_up;
    j["n_down"]      = params.n_down;
    j["step_type"]   = stepTypeName(params.step_type);
    j["min_val"]     = optionalToJson(params.min_val);
    j["max_val"]     = optionalToJson(params.max_val);
    return j;
}

bool fromJson(const json& j, Staircase::Params& params) {
    try {
        Staircase::Params p = params;
        p.name        = j.value("name", p.name);
        p.start_val   = j.value("start_val", p.start_val);
        p.n_reversals = j.value("n_reversals", p.n_reversals);
        p.n_trials    = j.value("n_trials", p.n_trials);
        p.n_up        = j.value("n_up", p.n_up);
        p.n_down      = j.value("n_down", p.n_down);
        if (j.contains("step_sizes")) {
            // a single number is a fixed step size
            const json& steps = j.at("step_sizes");
            p.step_sizes = steps.is_array() ? steps.get<std::vector<double>>() : std::vector<double>{ steps.get<double>() };
        }
        if (j.contains("step_type"))
            p.step_type = parseStepType(j.at("step_type").get<std::string>());
        if (j.contains("min_val"))
            p.min_val = optionalFromJson(j.at("min_val"));
        if (j.contains("max_val"))
            p.max_val = optionalFromJson(j.at("max_val"));
        params = p;
        return true;
    }
    catch (const json::exception& e) {
        LOG(Error) << "Malformed Staircase parameters: " << e.what();
    }
    catch (const std::invalid_argument& e) {
        LOG(Error) << "Malformed Staircase parameters: " << e.what();
    }
    return false;
}

json toJson(const Staircase::State& state) {
    json j;
    j["params"]               = toJson(state.params);
    j["finished"]             = state.finished;
    j["this_trial_n"]         = state.this_trial_n;
    j["data"]                 = state.data;
    j["intensities"]          = state.intensities;
    j["reversal_points"]      = state.reversal_points;
    j["reversal_intensities"] = state.reversal_intensities;
    j["current_direction"]    = state.current_direction == Staircase::Up ? "up" : "down";
    j["streak_correct"]       = state.streak_correct;
    j["streak_length"]        = state.streak_length;
    j["step_size_current"]    = state.step_size_current;
    j["next_intensity"]       = state.next_intensity;
    if (state.pf) {
        j["pf_intensities"]             = state.pf->intensities;
        j["pf_percent_correct"]         = state.pf->percent_correct;
        j["pf_responses_per_intensity"] = state.pf->responses_per_intensity;
    }
    else {
        j["pf_intensities"]             = nullptr;
        j["pf_percent_correct"]         = nullptr;
        j["pf_responses_per_intensity"] = nullptr;
    }
    return j;
}

bool fromJson(const json& j, Staircase::State& state) {
    try {
        Staircase::State s;
        if (!fromJson(j.at("params"), s.params))
            return false;
        s.finished             = j.at("finished").get<bool>();
        s.this_trial_n         = j.at("this_trial_n").get<int>();
        s.data                 = j.at("data").get<std::vector<bool>>();
        s.intensities          = j.at("intensities").get<std::vector<double>>();
        s.reversal_points      = j.at("reversal_points").get<std::vector<int>>();
        s.reversal_intensities = j.at("reversal_intensities").get<std::vector<double>>();
        s.current_direction    = parseDirection(j.at("current_direction").get<std::string>());
        s.streak_correct       = j.at("streak_correct").get<bool>();
        s.streak_length        = j.at("streak_length").get<int>();
        s.step_size_current    = j.at("step_size_current").get<double>();
        s.next_intensity       = j.at("next_intensity").get<double>();
        if (!j.at("pf_intensities").is_null()) {
            Staircase::PsychometricSummary pf;
            pf.intensities             = j.at("pf_intensities").get<std::vector<double>>();
            pf.percent_correct         = j.at("pf_percent_correct").get<std::vector<double>>();
            pf.responses_per_intensity = j.at("pf_responses_per_intensity").get<std::vector<int>>();
            s.pf = std::move(pf);
        }
        state = std::move(s);
        return true;
    }
    catch (const json::exception& e) {
        LOG(Error) << "Malformed Staircase state: " << e.what();
    }
    catch (const std::invalid_argument& e) {
        LOG(Error) << "Malformed Staircase state: " << e.what();
    }
    return false;
}

//=============================================================================
// TRIAL SEQUENCE
//=============================================================================

json toJson(const TrialSequence::State& state) {
    json j;
    j["name"]         = state.name;
    j["conditions"]   = state.conditions;
    j["n_reps"]       = state.n_reps;
    j["trials"]       = state.trials;
    j["this_rep_n"]   = state.this_rep_n;
    j["this_trial_n"] = state.this_trial_n;
    j["this_n"]       = state.this_n;
    j["n_remaining"]  = state.n_remaining;
    j["finished"]     = state.finished;
    return j;
}

bool fromJson(const json& j, TrialSequence::State& state) {
    try {
        TrialSequence::State s;
        s.name         = j.at("name").get<std::string>();
        s.conditions   = j.at("conditions").get<std::vector<Condition>>();
        s.n_reps       = j.at("n_reps").get<int>();
        s.trials       = j.at("trials").get<std::vector<int>>();
        s.this_rep_n   = j.at("this_rep_n").get<int>();
        s.this_trial_n = j.at("this_trial_n").get<int>();
        s.this_n       = j.at("this_n").get<int>();
        s.n_remaining  = j.at("n_remaining").get<int>();
        s.finished     = j.at("finished").get<bool>();
        TrialSequence check(s); // rejects inconsistent cursors
        state = std::move(s);
        return true;
    }
    catch (const json::exception& e) {
        LOG(Error) << "Malformed TrialSequence state: " << e.what();
    }
    catch (const std::invalid_argument& e) {
        LOG(Error) << "Malformed TrialSequence state: " << e.what();
    }
    return false;
}

//=============================================================================
// FILES
//=============================================================================

std::string dumpState(const TrialSequence& seq) {
    return toJson(seq.getState()).dump(2);
}

std::string dumpState(const Staircase& stairs) {
    return toJson(stairs.getState()).dump(2);
}

bool exportState(const TrialSequence& seq, const std::string& filepath) {
    return writeJson(toJson(seq.getState()), filepath, "TrialSequence " + seq.name());
}

bool exportState(const Staircase& stairs, const std::string& filepath) {
    return writeJson(toJson(stairs.getState()), filepath, "Staircase " + stairs.name());
}

bool importState(const std::string& filepath, TrialSequence::State& state) {
    json j;
    if (!readJson(filepath, j, "TrialSequence"))
        return false;
    if (!fromJson(j, state))
        return false;
    LOG(Info) << "Imported TrialSequence " << state.name << " from " << filepath;
    return true;
}

bool importState(const std::string& filepath, Staircase::State& state) {
    json j;
    if (!readJson(filepath, j, "Staircase"))
        return false;
    if (!fromJson(j, state))
        return false;
    LOG(Info) << "Imported Staircase " << state.params.name << " from " << filepath;
    return true;
}

bool exportParams(const Staircase::Params& params, const std::string& filepath) {
    return writeJson(toJson(params), filepath, "Staircase " + params.name + " parameters");
}

bool importParams(const std::string& filepath, Staircase::Params& params) {
    json j;
    if (!readJson(filepath, j, "Staircase parameters"))
        return false;
    if (!fromJson(j, params))
        return false;
    LOG(Info) << "Imported Staircase " << params.name << " parameters from " << filepath;
    return true;
}

bool exportCsv(const Staircase& stairs, const std::string& filepath) {
    if (stairs.intensities().empty()) {
        LOG(Warning) << "Staircase " << stairs.name() << " has no trials to save.";
        return false;
    }
    std::vector<int> responses;
    responses.reserve(stairs.responses().size());
    for (bool r : stairs.responses())
        responses.push_back(r ? 1 : 0);
    if (!csv_write_row(filepath, stairs.intensities()) || !csv_append_row(filepath, responses)) {
        LOG(Error) << "Failed to export Staircase " << stairs.name() << " data to " << filepath;
        return false;
    }
    LOG(Info) << "Exported Staircase " << stairs.name() << " data to " << filepath;
    return true;
}
