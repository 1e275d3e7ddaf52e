#pragma once
#include <optional>
#include <string>
#include <vector>
#include <Mahi/Util.hpp>

using namespace mahi::util;

/// One experimental condition. Plain values (0, 1, "left") or key-value mappings ({"freq": 500}).
using Condition = json;

class TrialSequence {
public:

    /// Everything needed to resume iterating a sequence
    struct State {
        std::string            name;
        std::vector<Condition> conditions;
        int                    n_reps       = 1;
        std::vector<int>       trials;           ///< realized condition indices
        int                    this_rep_n   = 0; ///< which repetition we are on
        int                    this_trial_n = -1;///< trial number within the repetition
        int                    this_n       = -1;///< trials consumed in total
        int                    n_remaining  = 0;
        bool                   finished     = false;
    };

    /// Constructor, conditions are 0..n_conds-1
    TrialSequence(int n_conds, int n_reps = 1, std::vector<int> trials = {}, const std::string& name = "");
    /// Constructor with explicit conditions
    TrialSequence(std::vector<Condition> conditions, int n_reps = 1, std::vector<int> trials = {}, const std::string& name = "");
    /// Reloads a serialized sequence, cursor included
    explicit TrialSequence(const State& state);

    /// Advances to the next trial and returns its condition, or nothing once the sequence is exhausted
    std::optional<Condition> advance();
    /// True if advance() will produce another trial
    bool hasNext() const;
    /// Condition n trials into the future (n > 0) or past (n < 0) without moving the cursor
    std::optional<Condition> peek(int n = 1) const;

    /// Counts of condition i immediately followed by condition j
    std::vector<std::vector<int>> transitions() const;
    /// Frequency of each condition over the whole sequence, in condition order
    std::vector<double> conditionProbabilities() const;

    /// Two-condition oddball sequence (0 = standard, 1 = deviant) with at least 3 standards between deviants
    static TrialSequence mmnSequence(int n_trials, double deviant_freq = 0.12);

    /// Gets the full resumable state
    State getState() const;
    /// One line description of the sequence and its cursor
    std::string toString() const;

    const std::string&            name() const       { return m_name; }
    const std::vector<Condition>& conditions() const { return m_conditions; }
    const std::vector<int>&       trials() const     { return m_trials; }
    /// Condition of the current trial, null before the first and after the last trial
    const Condition&              currentTrial() const { return m_this_trial; }
    int  nConds() const     { return static_cast<int>(m_conditions.size()); }
    int  nReps() const      { return m_n_reps; }
    int  nTrials() const    { return static_cast<int>(m_trials.size()); }
    int  nRemaining() const { return m_n_remaining; }
    int  thisN() const      { return m_this_n; }
    int  thisRepN() const   { return m_this_rep_n; }
    int  thisTrialN() const { return m_this_trial_n; }
    bool finished() const   { return m_finished; }

private:
    /// n_conds x n_reps trials, all conditions once per repetition, no direct repeat across repetitions
    void createSimpleSequence();
    void checkTrials() const;

    std::string            m_name;
    std::vector<Condition> m_conditions;
    int                    m_n_reps;
    std::vector<int>       m_trials;
    int                    m_this_rep_n   = 0;
    int                    m_this_trial_n = -1;
    int                    m_this_n       = -1;
    int                    m_n_remaining  = 0;
    bool                   m_finished     = false;
    Condition              m_this_trial;
};
