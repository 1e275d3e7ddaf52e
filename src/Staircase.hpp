#pragma once
#include <optional>
#include <string>
#include <vector>
#include <Mahi/Util.hpp>

using namespace mahi::util;

/// Adaptive up/down staircase. n_up and n_down are treated as 1 until the first reversal.
/// The run finishes once both n_reversals reversals and n_trials trials have been reached.
class Staircase : public mahi::util::NonCopyable {
public:

    enum StepType  { Db, Log, Lin };
    enum Direction { Up, Down };
    enum Averaging { Geometric, Arithmetic };

    /// Staircase Parameter Configuration
    struct Params {
        std::string           name;
        double                start_val   = 0;
        int                   n_reversals = 0;      // 0 = one reversal per step size
        std::vector<double>   step_sizes  = { 4 };  // advances to the next entry at each reversal
        int                   n_trials    = 0;      // minimum number of trials
        int                   n_up        = 1;      // incorrect responses before the level increases
        int                   n_down      = 2;      // correct responses before the level decreases
        StepType              step_type   = Db;
        std::optional<double> min_val;
        std::optional<double> max_val;
    };

    /// Binned intensity / response rate relation, sorted by intensity
    struct PsychometricSummary {
        std::vector<double> intensities;
        std::vector<double> percent_correct;
        std::vector<int>    responses_per_intensity;
    };

    /// Everything needed to resume a staircase
    struct State {
        Params              params;
        bool                finished          = false;
        int                 this_trial_n      = -1;
        std::vector<bool>   data;
        std::vector<double> intensities;
        std::vector<int>    reversal_points;
        std::vector<double> reversal_intensities;
        Direction           current_direction = Down;
        bool                streak_correct    = false;
        int                 streak_length     = 0;
        double              step_size_current = 0;
        double              next_intensity    = 0;
        std::optional<PsychometricSummary> pf;
    };

    /// Constructor
    Staircase(Params params);
    /// Reloads a serialized staircase
    explicit Staircase(const State& state);

    /// Returns the intensity to present next and records it, or nothing once finished
    std::optional<double> advance();
    /// True until the stopping rule has been met
    bool hasNext() const { return !m_finished; }
    /// Adds the response to the last presented trial; intensity replaces the recorded value if given
    bool addResponse(bool result, std::optional<double> intensity = std::nullopt);
    /// Deterministic response oracle: is the next intensity at or above thresh?
    bool simulateResponse(double thresh) const;
    /// Mean of the last n reversal intensities, only once finished
    std::optional<double> threshold(int n = 6, Averaging method = Geometric) const;
    /// Psychometric summary, computed by the response that finishes the staircase
    const std::optional<PsychometricSummary>& psychometricFunction() const { return m_pf; }

    /// Gets the normalized configuration
    Params getParams() const { return m_params; }
    /// Gets the full resumable state
    State getState() const;
    /// One line description, e.g. "1up2down, trial 12, 4 reversals of 8"
    std::string toString() const;

    const std::string&         name() const                { return m_params.name; }
    bool                       finished() const            { return m_finished; }
    int                        thisTrialN() const          { return m_this_trial_n; }
    double                     nextIntensity() const       { return m_next_intensity; }
    double                     stepSize() const            { return m_step_size_current; }
    Direction                  direction() const           { return m_current_direction; }
    const std::vector<bool>&   responses() const           { return m_data; }
    const std::vector<double>& intensities() const         { return m_intensities; }
    const std::vector<int>&    reversalPoints() const      { return m_reversal_points; }
    const std::vector<double>& reversalIntensities() const { return m_reversal_intensities; }

private:
    /// Based on current intensity, the response streak and the current direction
    void calculateNextIntensity();
    void intensityInc();
    void intensityDec();
    void clampIntensity();
    void computePsychometricFunction();

    Params      m_params;    ///< parameters
    bool        m_variable_step = false;
    bool        m_finished = false;
    int         m_this_trial_n = -1;

    std::vector<bool>   m_data;                 ///< responses, true = correct/detected
    std::vector<double> m_intensities;          ///< presented intensities
    std::vector<int>    m_reversal_points;
    std::vector<double> m_reversal_intensities;

    Direction   m_current_direction = Down;
    bool        m_streak_correct = false;       ///< result of the current run of identical responses
    int         m_streak_length = 0;            ///< length of that run, 0 after every intensity change
    double      m_step_size_current;
    double      m_next_intensity;

    std::optional<PsychometricSummary> m_pf;
};
