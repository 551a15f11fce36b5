#ifndef PPOUPDATER_H
#define PPOUPDATER_H

#include <Eigen/Core>
#include <random>
#include <vector>
#include "ActorCritic.h"
#include "AdamOptimizer.h"
#include "AdvantageEstimator.h"
#include "RolloutBuffer.h"
#include "TrainingConfig.h"

struct UpdateStats {
    bool skipped = false;      // nothing to train on
    bool diverged = false;     // non-finite loss or parameters, update discarded
    int samples = 0;
    int minibatches = 0;
    float actorLoss = 0.0f;    // mean over minibatches
    float criticLoss = 0.0f;   // mean over minibatches
    float entropy = 0.0f;
    float advantageMean = 0.0f;
    float advantageStd = 0.0f;
};

/**
 * @brief Clipped-surrogate PPO update for ActorCritic
 *
 * Per minibatch:
 *   ratio      = exp(logp_new - logp_old)
 *   actorLoss  = -mean(min(ratio * A, clip(ratio, 1-eps, 1+eps) * A)) - c_ent * entropy
 *   criticLoss = mean((R - V)^2)
 *
 * The actor (network + logStd) and the critic take separate Adam steps.
 * The optimizer moments persist across episodes.
 */
class PPOUpdater {
public:
    struct Minibatch {
        Eigen::MatrixXf states;     // stateDim x B
        Eigen::MatrixXf actions;    // actionDim x B
        Eigen::VectorXf oldLogProbs;
        Eigen::VectorXf advantages;
        Eigen::VectorXf returns;
    };

    explicit PPOUpdater(const PPOConfig& config = PPOConfig{}, unsigned int seed = 0);

    // GAE followed by update(); an empty episode is skipped
    UpdateStats train(ActorCritic& model, const std::vector<Transition>& episode);

    UpdateStats update(ActorCritic& model,
                       const std::vector<Transition>& episode,
                       const AdvantageResult& advantages);

    // Index order for every epoch. Without reshuffleEachEpoch all epochs
    // share one permutation drawn before the first epoch.
    std::vector<std::vector<int>> planMinibatches(int sampleCount);

    // Columns order[begin..end) of the episode
    static Minibatch gather(const std::vector<Transition>& episode,
                            const std::vector<float>& advantages,
                            const std::vector<float>& returns,
                            const std::vector<int>& order, int begin, int end);

    // Clipped-surrogate actor loss of a minibatch. When gradient is given and
    // the loss is finite, fills dLoss/d(getActorParams()).
    float actorObjective(const ActorCritic& model, const Minibatch& batch,
                         Eigen::VectorXf* gradient = nullptr) const;

private:
    // Each returns the loss; no step is taken when it is not finite
    float actorStep(ActorCritic& model, const Minibatch& batch);
    float criticStep(ActorCritic& model, const Minibatch& batch);

    PPOConfig m_config;
    AdamOptimizer m_actorOptimizer;
    AdamOptimizer m_criticOptimizer;
    std::mt19937 m_rng;
};

#endif // PPOUPDATER_H
