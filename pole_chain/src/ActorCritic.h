#ifndef ACTORCRITIC_H
#define ACTORCRITIC_H

#include <Eigen/Core>
#include <random>
#include "MlpNetwork.h"

struct ActionSample {
    Eigen::VectorXf action;
    float logProb = 0.0f;
    float value = 0.0f;
};

/**
 * @brief Gaussian policy (actor) and state-value estimate (critic)
 *
 * Actor: State(2+2N) -> 64 tanh -> 64 tanh -> mean force (linear)
 * Critic: State(2+2N) -> 64 tanh -> 64 tanh -> value (linear)
 *
 * The standard deviation comes from a free logStd vector that does not
 * depend on the observation.
 */
class ActorCritic {
public:
    ActorCritic(int state_dim, int action_dim = 1, int hidden = 64,
                float initial_log_std = -0.5f, unsigned int seed = 0);

    int stateDim() const { return m_actor.inputDim(); }
    int actionDim() const { return m_actor.outputDim(); }

    // Samples action = mean + exp(logStd) * noise
    ActionSample getAction(const Eigen::VectorXf& state);

    Eigen::VectorXf mean(const Eigen::VectorXf& state) const { return m_actor.forward(state); }
    float value(const Eigen::VectorXf& state) const { return m_critic.forward(state)(0); }

    // Diagonal Gaussian log density summed over action dimensions
    static float logProbability(const Eigen::VectorXf& action,
                                const Eigen::VectorXf& mean,
                                const Eigen::VectorXf& logStd);

    // sum_d logStd_d + 0.5 * ln(2 pi e)
    float entropy() const;

    const Eigen::VectorXf& logStd() const { return m_logStd; }

    MlpNetwork& actor() { return m_actor; }
    const MlpNetwork& actor() const { return m_actor; }
    MlpNetwork& critic() { return m_critic; }
    const MlpNetwork& critic() const { return m_critic; }

    // Actor layout: actor network parameters followed by logStd
    Eigen::VectorXf getActorParams() const;
    Eigen::VectorXf getCriticParams() const;
    void setActorParams(const Eigen::VectorXf& params);
    void setCriticParams(const Eigen::VectorXf& params);
    int actorParamCount() const;
    int criticParamCount() const;

    // Copies weights and logStd, keeps this model's sampling stream
    void copyParametersFrom(const ActorCritic& other);

    bool hasFiniteParameters() const;

private:
    MlpNetwork m_actor;
    MlpNetwork m_critic;
    Eigen::VectorXf m_logStd;
    std::mt19937 m_rng;
    std::normal_distribution<float> m_noise{0.0f, 1.0f};
};

#endif // ACTORCRITIC_H
