#include "Staircase.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace {

/// decimals kept when binning intensities for the psychometric function
constexpr double kBinScale = 1e8;

Staircase::Params normalizeParams(Staircase::Params params) {
    if (params.step_sizes.empty())
        throw std::invalid_argument("Staircase needs at least one step size");
    for (double s : params.step_sizes) {
        if (!(s > 0))
            throw std::invalid_argument("Staircase step sizes must be positive");
    }
    if (params.n_up < 1 || params.n_down < 1)
        throw std::invalid_argument("Staircase n_up and n_down must be at least 1");
    if (params.min_val && params.max_val && *params.min_val > *params.max_val)
        throw std::invalid_argument("Staircase min_val is larger than max_val");

    int n_steps = static_cast<int>(params.step_sizes.size());
    if (params.n_reversals <= 0) {
        params.n_reversals = n_steps;
    }
    else if (n_steps > params.n_reversals) {
        LOG(Warning) << "Increasing number of minimum required reversals to the number of step sizes, " << n_steps;
        params.n_reversals = n_steps;
    }
    return params;
}

} // namespace

Staircase::Staircase(Params params) :
    m_params(normalizeParams(std::move(params)))
{
    m_variable_step     = m_params.step_sizes.size() > 1;
    m_step_size_current = m_params.step_sizes[0];
    m_next_intensity    = m_params.start_val;
    clampIntensity();
    if (m_next_intensity != m_params.start_val)
        LOG(Warning) << "Staircase " << m_params.name << " start value " << m_params.start_val << " clamped to " << m_next_intensity;
    LOG(Verbose) << "Opened Staircase " << toString();
}

Staircase::Staircase(const State& state) :
    m_params(normalizeParams(state.params)),
    m_finished(state.finished),
    m_this_trial_n(state.this_trial_n),
    m_data(state.data),
    m_intensities(state.intensities),
    m_reversal_points(state.reversal_points),
    m_reversal_intensities(state.reversal_intensities),
    m_current_direction(state.current_direction),
    m_streak_correct(state.streak_correct),
    m_streak_length(state.streak_length),
    m_step_size_current(state.step_size_current),
    m_next_intensity(state.next_intensity),
    m_pf(state.pf)
{
    m_variable_step = m_params.step_sizes.size() > 1;
    if (m_intensities.size() < m_data.size() || m_intensities.size() > m_data.size() + 1)
        throw std::invalid_argument("Staircase state has " + std::to_string(m_intensities.size()) + " intensities for "
                                    + std::to_string(m_data.size()) + " responses");
    if (m_reversal_points.size() != m_reversal_intensities.size())
        throw std::invalid_argument("Staircase state reversal points and intensities differ in length");
    if (m_finished && !m_pf)
        computePsychometricFunction();
    LOG(Verbose) << "Reloaded Staircase " << toString();
}

//=============================================================================
// TRIALS
//=============================================================================

std::optional<double> Staircase::advance() {
    if (m_finished)
        return std::nullopt;
    if (m_intensities.size() > m_data.size()) {
        LOG(Error) << "Response for trial " << m_this_trial_n << " is not recorded, presenting it again.";
        return m_intensities.back();
    }
    m_this_trial_n++;
    m_intensities.push_back(m_next_intensity);
    return m_next_intensity;
}

bool Staircase::addResponse(bool result, std::optional<double> intensity) {
    if (m_finished) {
        LOG(Error) << "Staircase " << m_params.name << " is finished, response ignored.";
        return false;
    }
    if (m_intensities.size() != m_data.size() + 1) {
        LOG(Error) << "Staircase " << m_params.name << " has no trial awaiting a response.";
        return false;
    }
    m_data.push_back(result);
    if (intensity)
        m_intensities.back() = *intensity;
    if (m_data.size() > 1 && m_data[m_data.size() - 2] == result)
        m_streak_length++; // still on a run
    else
        m_streak_length = 1;
    m_streak_correct = result;
    calculateNextIntensity();
    return true;
}

void Staircase::calculateNextIntensity() {
    bool reversal = false;
    if (m_reversal_intensities.empty()) { // strict 1-up/1-down until the first reversal
        if (m_data.back()) {
            reversal = m_current_direction == Up;
            m_current_direction = Down;
        }
        else {
            reversal = m_current_direction == Down;
            m_current_direction = Up;
        }
    }
    else if (m_streak_correct && m_streak_length >= m_params.n_down) {
        reversal = m_current_direction != Down;
        m_current_direction = Down;
    }
    else if (!m_streak_correct && m_streak_length >= m_params.n_up) {
        reversal = m_current_direction != Up;
        m_current_direction = Up;
    }

    if (reversal) {
        m_reversal_points.push_back(m_this_trial_n);
        m_reversal_intensities.push_back(m_intensities.back());
        LOG(Verbose) << "Staircase " << m_params.name << " reversal " << m_reversal_intensities.size() << " at trial "
                     << m_this_trial_n << ", intensity " << m_intensities.back();
    }
    if (static_cast<int>(m_reversal_intensities.size()) >= m_params.n_reversals &&
        static_cast<int>(m_intensities.size()) >= m_params.n_trials) {
        m_finished = true;
        LOG(Info) << "Staircase " << m_params.name << " finished after " << m_intensities.size() << " trials and "
                  << m_reversal_intensities.size() << " reversals.";
        computePsychometricFunction();
    }
    if (reversal && m_variable_step) {
        // beyond the list of step sizes the last one is kept
        std::size_t n_rev = m_reversal_intensities.size();
        m_step_size_current = n_rev >= m_params.step_sizes.size() ? m_params.step_sizes.back() : m_params.step_sizes[n_rev];
    }

    if (m_reversal_intensities.empty()) {
        if (m_data.back())
            intensityDec();
        else
            intensityInc();
    }
    else if (m_streak_correct && m_streak_length >= m_params.n_down) {
        intensityDec();
    }
    else if (!m_streak_correct && m_streak_length >= m_params.n_up) {
        intensityInc();
    }
}

void Staircase::intensityInc() {
    switch (m_params.step_type) {
        case Db:  m_next_intensity *= std::pow(10.0, m_step_size_current / 20.0); break;
        case Log: m_next_intensity *= std::pow(10.0, m_step_size_current); break;
        case Lin: m_next_intensity += m_step_size_current; break;
    }
    clampIntensity();
    m_streak_length = 0;
}

void Staircase::intensityDec() {
    switch (m_params.step_type) {
        case Db:  m_next_intensity /= std::pow(10.0, m_step_size_current / 20.0); break;
        case Log: m_next_intensity /= std::pow(10.0, m_step_size_current); break;
        case Lin: m_next_intensity -= m_step_size_current; break;
    }
    clampIntensity();
    m_streak_length = 0;
}

void Staircase::clampIntensity() {
    if (m_params.max_val && m_next_intensity > *m_params.max_val) {
        LOG(Verbose) << "Intensity " << m_next_intensity << " clamped by max_val " << *m_params.max_val;
        m_next_intensity = *m_params.max_val;
    }
    if (m_params.min_val && m_next_intensity < *m_params.min_val) {
        LOG(Verbose) << "Intensity " << m_next_intensity << " clamped by min_val " << *m_params.min_val;
        m_next_intensity = *m_params.min_val;
    }
}

bool Staircase::simulateResponse(double thresh) const {
    return m_next_intensity >= thresh;
}

//=============================================================================
// RESULTS
//=============================================================================

std::optional<double> Staircase::threshold(int n, Averaging method) const {
    if (!m_finished)
        return std::nullopt;
    n = std::min(n, static_cast<int>(m_reversal_intensities.size()));
    if (n < 1)
        return std::nullopt;
    auto first = m_reversal_intensities.end() - n;
    double sum = 0;
    if (method == Geometric) {
        for (auto it = first; it != m_reversal_intensities.end(); ++it)
            sum += std::log(*it);
        return std::exp(sum / n);
    }
    for (auto it = first; it != m_reversal_intensities.end(); ++it)
        sum += *it;
    return sum / n;
}

void Staircase::computePsychometricFunction() {
    std::map<double, std::pair<int, int>> bins; // rounded intensity -> (correct, total)
    std::size_t n = std::min(m_intensities.size(), m_data.size());
    for (std::size_t i = 0; i < n; ++i) {
        double key = std::round(m_intensities[i] * kBinScale) / kBinScale;
        auto& bin = bins[key];
        bin.first  += m_data[i] ? 1 : 0;
        bin.second += 1;
    }
    PsychometricSummary pf;
    for (const auto& [intensity, counts] : bins) {
        pf.intensities.push_back(intensity);
        pf.percent_correct.push_back(static_cast<double>(counts.first) / counts.second);
        pf.responses_per_intensity.push_back(counts.second);
    }
    m_pf = std::move(pf);
    LOG(Verbose) << "Staircase " << m_params.name << " psychometric function over " << bins.size() << " intensities.";
}

//=============================================================================
// STATE
//=============================================================================

Staircase::State Staircase::getState() const {
    State state;
    state.params               = m_params;
    state.finished             = m_finished;
    state.this_trial_n         = m_this_trial_n;
    state.data                 = m_data;
    state.intensities          = m_intensities;
    state.reversal_points      = m_reversal_points;
    state.reversal_intensities = m_reversal_intensities;
    state.current_direction    = m_current_direction;
    state.streak_correct       = m_streak_correct;
    state.streak_length        = m_streak_length;
    state.step_size_current    = m_step_size_current;
    state.next_intensity       = m_next_intensity;
    state.pf                   = m_pf;
    return state;
}

std::string Staircase::toString() const {
    std::string label = m_params.name.empty() ? "" : m_params.name + " ";
    return label + std::to_string(m_params.n_up) + "up" + std::to_string(m_params.n_down) + "down, trial "
         + std::to_string(m_this_trial_n) + ", " + std::to_string(m_reversal_intensities.size()) + " reversals of "
         + std::to_string(m_params.n_reversals);
}
