#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include "ProcedureIO.hpp"
#include "Util/Random.hpp"

namespace fs = std::filesystem;

namespace {

std::string tempFile(const std::string& name) {
    return (fs::temp_directory_path() / ("psych_procedures_" + name)).string();
}

Staircase::Params linearParams() {
    Staircase::Params params;
    params.name        = "detection";
    params.start_val   = 50;
    params.n_reversals = 10;
    params.step_sizes  = { 8, 4, 4, 2, 2, 1 };
    params.n_trials    = 15;
    params.n_up        = 1;
    params.n_down      = 1;
    params.step_type   = Staircase::Lin;
    params.min_val     = 0;
    params.max_val     = 60;
    return params;
}

void step(Staircase& stairs, double thresh) {
    ASSERT_TRUE(stairs.advance().has_value());
    ASSERT_TRUE(stairs.addResponse(stairs.simulateResponse(thresh)));
}

} // namespace

TEST(ProcedureIOTest, PartiallyConsumedSequenceResumesFromFile) {
    seedShuffleEngine(5);
    TrialSequence seq(4, 3, {}, "blocks");
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(seq.advance().has_value());

    std::string path = tempFile("sequence.json");
    ASSERT_TRUE(exportState(seq, path));
    TrialSequence::State state;
    ASSERT_TRUE(importState(path, state));
    TrialSequence resumed(state);

    EXPECT_EQ(resumed.name(), "blocks");
    EXPECT_EQ(resumed.trials(), seq.trials());
    EXPECT_EQ(resumed.thisN(), seq.thisN());
    EXPECT_EQ(resumed.thisRepN(), seq.thisRepN());
    EXPECT_EQ(resumed.currentTrial(), seq.currentTrial());
    while (auto trial = seq.advance())
        EXPECT_EQ(resumed.advance(), trial);
    EXPECT_FALSE(resumed.advance().has_value());
    fs::remove(path);
}

TEST(ProcedureIOTest, SequenceDumpKeepsConditionMappings) {
    std::vector<Condition> conditions = { json::object({ { "side", "left" } }), json::object({ { "side", "right" } }) };
    TrialSequence seq(conditions, 2, { 0, 1, 1, 0 });
    json j = json::parse(dumpState(seq));
    EXPECT_EQ(j["conditions"][1]["side"], "right");
    EXPECT_EQ(j["trials"].size(), 4u);

    TrialSequence::State state;
    ASSERT_TRUE(fromJson(j, state));
    TrialSequence reloaded(state);
    EXPECT_EQ((*reloaded.advance())["side"], "left");
}

TEST(ProcedureIOTest, PartiallyRunStaircaseResumesIdentically) {
    Staircase stairs(linearParams());
    for (int i = 0; i < 6; ++i)
        step(stairs, 30);

    std::string path = tempFile("staircase.json");
    ASSERT_TRUE(exportState(stairs, path));
    Staircase::State state;
    ASSERT_TRUE(importState(path, state));
    Staircase resumed(state);
    EXPECT_EQ(resumed.toString(), stairs.toString());

    while (stairs.hasNext()) {
        step(stairs, 30);
        step(resumed, 30);
    }
    EXPECT_TRUE(resumed.finished());
    EXPECT_EQ(resumed.intensities(), stairs.intensities());
    EXPECT_EQ(resumed.reversalIntensities(), stairs.reversalIntensities());
    EXPECT_EQ(resumed.threshold(), stairs.threshold());
    ASSERT_TRUE(resumed.psychometricFunction().has_value());
    EXPECT_EQ(resumed.psychometricFunction()->intensities, stairs.psychometricFunction()->intensities);
    fs::remove(path);
}

TEST(ProcedureIOTest, FinishedStaircaseKeepsItsSummary) {
    Staircase stairs(linearParams());
    while (stairs.advance())
        ASSERT_TRUE(stairs.addResponse(stairs.simulateResponse(30)));
    ASSERT_TRUE(stairs.psychometricFunction().has_value());

    Staircase::State state;
    ASSERT_TRUE(fromJson(json::parse(dumpState(stairs)), state));
    Staircase reloaded(state);
    ASSERT_TRUE(reloaded.psychometricFunction().has_value());
    EXPECT_EQ(reloaded.psychometricFunction()->responses_per_intensity, stairs.psychometricFunction()->responses_per_intensity);
    EXPECT_FALSE(reloaded.advance().has_value());
}

TEST(ProcedureIOTest, ParamsRoundTripWithOpenBounds) {
    Staircase::Params params = linearParams();
    params.max_val.reset();
    params.step_type = Staircase::Log;
    std::string path = tempFile("params.json");
    ASSERT_TRUE(exportParams(params, path));

    Staircase::Params imported;
    ASSERT_TRUE(importParams(path, imported));
    EXPECT_EQ(imported.name, "detection");
    EXPECT_EQ(imported.step_sizes, params.step_sizes);
    EXPECT_EQ(imported.step_type, Staircase::Log);
    EXPECT_EQ(imported.min_val, std::optional<double>(0));
    EXPECT_FALSE(imported.max_val.has_value());
    fs::remove(path);
}

TEST(ProcedureIOTest, PartialParamsKeepDefaults) {
    Staircase::Params params;
    ASSERT_TRUE(fromJson(json::parse(R"({"start_val": 20, "step_sizes": 2, "step_type": "lin"})"), params));
    EXPECT_DOUBLE_EQ(params.start_val, 20);
    EXPECT_EQ(params.step_sizes, (std::vector<double>{ 2 }));
    EXPECT_EQ(params.step_type, Staircase::Lin);
    EXPECT_EQ(params.n_down, 2);

    EXPECT_FALSE(fromJson(json::parse(R"({"step_type": "octave"})"), params));
    EXPECT_FALSE(fromJson(json::parse(R"({"n_up": "one"})"), params));
    EXPECT_EQ(params.n_up, 1);
}

TEST(ProcedureIOTest, MissingOrMalformedFilesAreRejected) {
    TrialSequence::State seq_state;
    EXPECT_FALSE(importState(tempFile("does_not_exist.json"), seq_state));

    std::string path = tempFile("malformed.json");
    {
        std::ofstream file(path);
        file << "{ \"name\": \"broken\", ";
    }
    EXPECT_FALSE(importState(path, seq_state));
    {
        std::ofstream file(path);
        file << R"({ "name": "incomplete", "conditions": [0, 1] })";
    }
    EXPECT_FALSE(importState(path, seq_state));
    Staircase::State stairs_state;
    EXPECT_FALSE(importState(path, stairs_state));
    fs::remove(path);
}

TEST(ProcedureIOTest, SequenceWithInconsistentCursorIsRejected) {
    json j = json::parse(R"({ "name": "", "conditions": [0, 1], "n_reps": 1, "trials": [0, 1, 1, 0],
                              "this_rep_n": 0, "this_trial_n": -1, "this_n": -1, "n_remaining": 4,
                              "finished": false })");
    TrialSequence::State state;
    ASSERT_TRUE(fromJson(j, state));

    j["this_n"] = -4;
    TrialSequence::State rejected;
    EXPECT_FALSE(fromJson(j, rejected));
    j["this_n"]      = 1;
    j["n_remaining"] = 4;
    EXPECT_FALSE(fromJson(j, rejected));
    EXPECT_EQ(rejected.trials.size(), 0u);
}

TEST(ProcedureIOTest, UnknownStaircaseDirectionIsRejected) {
    Staircase stairs(linearParams());
    step(stairs, 30);
    json j = json::parse(dumpState(stairs));
    Staircase::State state;
    ASSERT_TRUE(fromJson(j, state));
    EXPECT_EQ(state.current_direction, Staircase::Down);

    j["current_direction"] = "sideways";
    Staircase::State rejected;
    EXPECT_FALSE(fromJson(j, rejected));
    EXPECT_TRUE(rejected.intensities.empty());
}

TEST(ProcedureIOTest, CsvHasIntensityAndResponseRows) {
    Staircase stairs(linearParams());
    std::string path = tempFile("staircase.csv");
    EXPECT_FALSE(exportCsv(stairs, path));

    while (stairs.advance())
        ASSERT_TRUE(stairs.addResponse(stairs.simulateResponse(30)));
    ASSERT_TRUE(exportCsv(stairs, path));

    std::ifstream file(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(file, line);) {
        if (!line.empty())
            lines.push_back(line);
    }
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(std::count(lines[0].begin(), lines[0].end(), ','), 14);
    EXPECT_EQ(std::count(lines[1].begin(), lines[1].end(), '1'), 8);
    fs::remove(path);
}
