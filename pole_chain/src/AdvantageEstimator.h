#ifndef ADVANTAGEESTIMATOR_H
#define ADVANTAGEESTIMATOR_H

#include <vector>
#include "RolloutBuffer.h"

struct AdvantageResult {
    std::vector<float> advantages;
    std::vector<float> returns;
    float mean = 0.0f;
    float stddev = 0.0f;   // population standard deviation of advantages
};

/**
 * @brief Generalized Advantage Estimation over one finished episode
 *
 * delta_t = r_t + gamma * V(t+1) * (1 - done_t) - V(t)
 * A_t     = delta_t + gamma * lambda * (1 - done_t) * A_{t+1}
 * R_t     = A_t + V(t)
 *
 * The value after the last transition is taken as 0 (no bootstrap).
 */
class AdvantageEstimator {
public:
    explicit AdvantageEstimator(float gamma = 0.99f, float lambda = 0.95f)
        : m_gamma(gamma), m_lambda(lambda) {}

    // Throws std::invalid_argument if the sequences differ in length
    AdvantageResult compute(const std::vector<float>& rewards,
                            const std::vector<float>& values,
                            const std::vector<bool>& dones) const;

    AdvantageResult compute(const std::vector<Transition>& episode) const;

    // (a - mean) / (stddev + 1e-8), in place
    static void normalize(AdvantageResult& result);

private:
    float m_gamma;
    float m_lambda;
};

#endif // ADVANTAGEESTIMATOR_H
