#include "AdvantageEstimator.h"
#include <cmath>
#include <stdexcept>

AdvantageResult AdvantageEstimator::compute(const std::vector<float>& rewards,
                                            const std::vector<float>& values,
                                            const std::vector<bool>& dones) const
{
    if (rewards.size() != values.size() || rewards.size() != dones.size()) {
        throw std::invalid_argument("AdvantageEstimator: rewards, values and dones differ in length");
    }

    const int n = static_cast<int>(rewards.size());
    AdvantageResult result;
    result.advantages.resize(n);
    result.returns.resize(n);
    if (n == 0) return result;

    float lastGae = 0.0f;
    for (int t = n - 1; t >= 0; --t) {
        const float nextValue = (t == n - 1) ? 0.0f : values[t + 1];
        const float nextNonTerminal = dones[t] ? 0.0f : 1.0f;
        const float delta = rewards[t] + m_gamma * nextValue * nextNonTerminal - values[t];
        lastGae = delta + m_gamma * m_lambda * nextNonTerminal * lastGae;
        result.advantages[t] = lastGae;
        result.returns[t] = lastGae + values[t];
    }

    double sum = 0.0;
    for (float a : result.advantages) sum += a;
    const double mean = sum / n;

    double var = 0.0;
    for (float a : result.advantages) var += (a - mean) * (a - mean);

    result.mean = static_cast<float>(mean);
    result.stddev = static_cast<float>(std::sqrt(var / n));
    return result;
}

AdvantageResult AdvantageEstimator::compute(const std::vector<Transition>& episode) const
{
    std::vector<float> rewards;
    std::vector<float> values;
    std::vector<bool> dones;
    rewards.reserve(episode.size());
    values.reserve(episode.size());
    dones.reserve(episode.size());

    for (const auto& t : episode) {
        rewards.push_back(t.reward);
        values.push_back(t.value);
        dones.push_back(t.done);
    }
    return compute(rewards, values, dones);
}

void AdvantageEstimator::normalize(AdvantageResult& result)
{
    for (float& a : result.advantages) {
        a = (a - result.mean) / (result.stddev + 1e-8f);
    }
}
