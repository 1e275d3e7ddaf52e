#include "TrialSequence.hpp"
#include "Util/Random.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace {

std::vector<Condition> indexConditions(int n_conds) {
    if (n_conds < 1)
        throw std::invalid_argument("TrialSequence needs at least one condition, got " + std::to_string(n_conds));
    std::vector<Condition> conditions;
    conditions.reserve(n_conds);
    for (int i = 0; i < n_conds; ++i)
        conditions.push_back(i);
    return conditions;
}

} // namespace

TrialSequence::TrialSequence(int n_conds, int n_reps, std::vector<int> trials, const std::string& name) :
    TrialSequence(indexConditions(n_conds), n_reps, std::move(trials), name)
{ }

TrialSequence::TrialSequence(std::vector<Condition> conditions, int n_reps, std::vector<int> trials, const std::string& name) :
    m_name(name),
    m_conditions(std::move(conditions)),
    m_n_reps(n_reps),
    m_trials(std::move(trials))
{
    if (m_conditions.empty())
        throw std::invalid_argument("TrialSequence needs at least one condition");
    if (m_n_reps < 1)
        throw std::invalid_argument("TrialSequence needs at least one repetition, got " + std::to_string(m_n_reps));
    if (m_trials.empty())
        createSimpleSequence();
    else
        checkTrials();
    m_n_remaining = nTrials();
    LOG(Verbose) << "Created TrialSequence " << m_name << " with " << nConds() << " conditions and " << nTrials() << " trials.";
}

TrialSequence::TrialSequence(const State& state) :
    m_name(state.name),
    m_conditions(state.conditions),
    m_n_reps(state.n_reps),
    m_trials(state.trials),
    m_this_rep_n(state.this_rep_n),
    m_this_trial_n(state.this_trial_n),
    m_this_n(state.this_n),
    m_n_remaining(state.n_remaining),
    m_finished(state.finished)
{
    if (m_conditions.empty() || m_trials.empty())
        throw std::invalid_argument("TrialSequence state has no conditions or no trials");
    checkTrials();
    if (m_n_reps < 1)
        throw std::invalid_argument("TrialSequence state needs at least one repetition, got " + std::to_string(m_n_reps));
    // the cursor indexes m_trials on the next advance()
    if (m_this_n < -1 || m_this_n > nTrials() || (m_this_n == nTrials() && !m_finished))
        throw std::invalid_argument("TrialSequence state cursor " + std::to_string(m_this_n) + " is outside the "
                                    + std::to_string(nTrials()) + " trials");
    if (m_this_trial_n < -1 || m_this_rep_n < 0)
        throw std::invalid_argument("TrialSequence state has a negative trial or repetition number");
    if (m_n_remaining != std::max(0, nTrials() - 1 - m_this_n))
        throw std::invalid_argument("TrialSequence state has " + std::to_string(m_n_remaining) + " remaining trials at cursor "
                                    + std::to_string(m_this_n));
    if (!m_finished && m_this_n >= 0 && m_this_n < nTrials())
        m_this_trial = m_conditions[m_trials[m_this_n]];
}

//=============================================================================
// ITERATION
//=============================================================================

std::optional<Condition> TrialSequence::advance() {
    if (m_finished)
        return std::nullopt;
    m_this_trial_n++;
    m_this_n++;
    m_n_remaining--;
    if (m_this_trial_n >= nConds() && m_n_reps > 1) { // start a new repetition
        m_this_trial_n = 0;
        m_this_rep_n++;
    }
    if (m_this_n >= nTrials()) {
        m_this_trial  = Condition();
        m_n_remaining = 0;
        m_finished    = true;
        LOG(Verbose) << "TrialSequence " << m_name << " finished after " << nTrials() << " trials.";
        return std::nullopt;
    }
    m_this_trial = m_conditions[m_trials[m_this_n]];
    return m_this_trial;
}

bool TrialSequence::hasNext() const {
    return !m_finished && m_this_n + 1 < nTrials();
}

std::optional<Condition> TrialSequence::peek(int n) const {
    if (n > m_n_remaining || m_this_n + n < 0)
        return std::nullopt;
    int pos = m_this_n + n;
    if (pos >= nTrials())
        return std::nullopt;
    return m_conditions[m_trials[pos]];
}

//=============================================================================
// ANALYTICS
//=============================================================================

std::vector<std::vector<int>> TrialSequence::transitions() const {
    std::vector<std::vector<int>> counts(nConds(), std::vector<int>(nConds(), 0));
    for (std::size_t i = 1; i < m_trials.size(); ++i)
        counts[m_trials[i-1]][m_trials[i]]++;
    return counts;
}

std::vector<double> TrialSequence::conditionProbabilities() const {
    std::vector<double> probs(nConds(), 0.0);
    for (int idx : m_trials)
        probs[idx] += 1.0;
    for (auto& p : probs)
        p /= nTrials();
    return probs;
}

//=============================================================================
// SEQUENCE BUILDERS
//=============================================================================

void TrialSequence::createSimpleSequence() {
    auto& g = shuffleEngine();
    std::vector<int> permute(nConds());
    std::iota(permute.begin(), permute.end(), 0);
    if (nConds() == 1 && m_n_reps > 1)
        LOG(Warning) << "TrialSequence " << m_name << " has a single condition, it will repeat across repetitions.";
    m_trials.reserve(nConds() * m_n_reps);
    for (int rep = 0; rep < m_n_reps; ++rep) {
        std::shuffle(permute.begin(), permute.end(), g);
        // redraw until the block does not start with the condition that ended the last one
        while (rep > 0 && nConds() > 1 && permute.front() == m_trials.back())
            std::shuffle(permute.begin(), permute.end(), g);
        m_trials.insert(m_trials.end(), permute.begin(), permute.end());
    }
}

void TrialSequence::checkTrials() const {
    for (int idx : m_trials) {
        if (idx < 0 || idx >= nConds())
            throw std::invalid_argument("Trial index " + std::to_string(idx) + " is outside the " + std::to_string(nConds()) + " conditions");
    }
}

TrialSequence TrialSequence::mmnSequence(int n_trials, double deviant_freq) {
    if (n_trials < 1)
        throw std::invalid_argument("MMN sequence needs at least one trial, got " + std::to_string(n_trials));
    if (deviant_freq <= 0)
        throw std::invalid_argument("MMN deviant frequency must be positive");
    if (deviant_freq > 0.25) {
        LOG(Warning) << "MMN deviant frequency " << deviant_freq << " clamped to the maximum of 0.25.";
        deviant_freq = 0.25;
    }
    // partial k is (3+k) standards followed by one deviant, partials longer than the sequence never finish
    int n_partials = static_cast<int>(std::min(std::ceil(2.0 / deviant_freq - 7.0), static_cast<double>(n_trials)));
    int reps       = (n_trials + n_partials - 1) / n_partials;
    std::vector<int> idx;
    idx.reserve(static_cast<std::size_t>(n_partials) * reps);
    for (int r = 0; r < reps; ++r) {
        for (int k = 0; k < n_partials; ++k)
            idx.push_back(k);
    }
    std::shuffle(idx.begin(), idx.end(), shuffleEngine());

    std::vector<int> trials;
    trials.reserve(static_cast<std::size_t>(n_trials) + n_partials + 3);
    for (int k : idx) {
        trials.insert(trials.end(), 3 + k, 0);
        trials.push_back(1);
        if (static_cast<int>(trials.size()) >= n_trials)
            break;
    }
    trials.resize(n_trials);
    return TrialSequence(2, 1, std::move(trials), "mmn");
}

//=============================================================================
// STATE
//=============================================================================

TrialSequence::State TrialSequence::getState() const {
    State state;
    state.name         = m_name;
    state.conditions   = m_conditions;
    state.n_reps       = m_n_reps;
    state.trials       = m_trials;
    state.this_rep_n   = m_this_rep_n;
    state.this_trial_n = m_this_trial_n;
    state.this_n       = m_this_n;
    state.n_remaining  = m_n_remaining;
    state.finished     = m_finished;
    return state;
}

std::string TrialSequence::toString() const {
    return "TrialSequence " + m_name + ", trials " + std::to_string(nTrials()) + ", remaining " + std::to_string(m_n_remaining)
         + ", current condition " + m_this_trial.dump();
}
