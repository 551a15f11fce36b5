#include "PPOUpdater.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>

PPOUpdater::PPOUpdater(const PPOConfig& config, unsigned int seed)
    : m_config(config)
    , m_actorOptimizer(config.actorLr)
    , m_criticOptimizer(config.criticLr)
    , m_rng(seed == 0 ? std::random_device{}() : seed)
{
}

UpdateStats PPOUpdater::train(ActorCritic& model, const std::vector<Transition>& episode)
{
    if (episode.empty()) {
        UpdateStats stats;
        stats.skipped = true;
        return stats;
    }

    AdvantageEstimator estimator(m_config.gamma, m_config.gaeLambda);
    AdvantageResult advantages = estimator.compute(episode);
    return update(model, episode, advantages);
}

std::vector<std::vector<int>> PPOUpdater::planMinibatches(int sampleCount)
{
    std::vector<int> indices(sampleCount);
    std::iota(indices.begin(), indices.end(), 0);
    std::shuffle(indices.begin(), indices.end(), m_rng);

    std::vector<std::vector<int>> orders;
    orders.reserve(m_config.epochs);
    for (int epoch = 0; epoch < m_config.epochs; ++epoch) {
        if (m_config.reshuffleEachEpoch && epoch > 0) {
            std::shuffle(indices.begin(), indices.end(), m_rng);
        }
        orders.push_back(indices);
    }
    return orders;
}

PPOUpdater::Minibatch PPOUpdater::gather(const std::vector<Transition>& episode,
                                         const std::vector<float>& advantages,
                                         const std::vector<float>& returns,
                                         const std::vector<int>& order, int begin, int end)
{
    const int b = end - begin;
    const Transition& first = episode[order[begin]];

    Minibatch batch;
    batch.states.resize(first.state.size(), b);
    batch.actions.resize(first.action.size(), b);
    batch.oldLogProbs.resize(b);
    batch.advantages.resize(b);
    batch.returns.resize(b);

    for (int j = 0; j < b; ++j) {
        const int i = order[begin + j];
        batch.states.col(j) = episode[i].state;
        batch.actions.col(j) = episode[i].action;
        batch.oldLogProbs(j) = episode[i].log_prob;
        batch.advantages(j) = advantages[i];
        batch.returns(j) = returns[i];
    }
    return batch;
}

float PPOUpdater::actorObjective(const ActorCritic& model, const Minibatch& batch,
                                 Eigen::VectorXf* gradient) const
{
    const int b = static_cast<int>(batch.states.cols());
    const float eps = m_config.clipEpsilon;
    const Eigen::VectorXf& logStd = model.logStd();
    const Eigen::VectorXf invVar = (-2.0f * logStd.array()).exp().matrix();

    MlpNetwork::ForwardCache cache;
    Eigen::MatrixXf means = model.actor().forward(batch.states, gradient ? &cache : nullptr);

    Eigen::MatrixXf dMean(means.rows(), b);
    Eigen::VectorXf dLogStd = Eigen::VectorXf::Zero(logStd.size());
    float surrogate = 0.0f;

    for (int i = 0; i < b; ++i) {
        Eigen::VectorXf diff = batch.actions.col(i) - means.col(i);
        const float logProb = ActorCritic::logProbability(batch.actions.col(i), means.col(i), logStd);
        const float ratio = std::exp(logProb - batch.oldLogProbs(i));
        const float adv = batch.advantages(i);

        const float surr1 = ratio * adv;
        const float surr2 = std::clamp(ratio, 1.0f - eps, 1.0f + eps) * adv;
        surrogate += std::min(surr1, surr2);

        // The clipped branch is constant in the parameters
        const float g = (surr1 <= surr2) ? -adv * ratio / b : 0.0f;

        // dlogp/dmean = (a - mu) / sigma^2, dlogp/dlogStd = (a - mu)^2 / sigma^2 - 1
        dMean.col(i) = g * diff.cwiseProduct(invVar);
        dLogStd += g * (diff.array().square() * invVar.array() - 1.0f).matrix();
    }

    const float loss = -surrogate / b - m_config.entropyCoef * model.entropy();
    if (!gradient || !std::isfinite(loss)) return loss;

    // d(-c * entropy)/dlogStd_d = -c
    dLogStd.array() -= m_config.entropyCoef;

    Eigen::VectorXf networkGrad = model.actor().backward(cache, dMean).flatten();
    gradient->resize(networkGrad.size() + dLogStd.size());
    *gradient << networkGrad, dLogStd;
    return loss;
}

float PPOUpdater::actorStep(ActorCritic& model, const Minibatch& batch)
{
    Eigen::VectorXf gradient;
    const float loss = actorObjective(model, batch, &gradient);
    if (!std::isfinite(loss)) return loss;

    Eigen::VectorXf params = model.getActorParams();
    m_actorOptimizer.apply(params, gradient);
    model.setActorParams(params);

    return loss;
}

float PPOUpdater::criticStep(ActorCritic& model, const Minibatch& batch)
{
    const int b = static_cast<int>(batch.states.cols());

    MlpNetwork::ForwardCache cache;
    Eigen::MatrixXf values = model.critic().forward(batch.states, &cache);

    Eigen::MatrixXf diff = values - batch.returns.transpose();
    const float loss = diff.squaredNorm() / b;
    if (!std::isfinite(loss)) return loss;

    Eigen::MatrixXf dValue = (2.0f / b) * diff;
    MlpNetwork::Gradients grads = model.critic().backward(cache, dValue);

    Eigen::VectorXf params = model.getCriticParams();
    m_criticOptimizer.apply(params, grads.flatten());
    model.setCriticParams(params);

    return loss;
}

UpdateStats PPOUpdater::update(ActorCritic& model,
                               const std::vector<Transition>& episode,
                               const AdvantageResult& advantages)
{
    UpdateStats stats;
    const int n = static_cast<int>(episode.size());
    stats.samples = n;
    stats.advantageMean = advantages.mean;
    stats.advantageStd = advantages.stddev;

    if (n == 0 || static_cast<int>(advantages.advantages.size()) != n
        || static_cast<int>(advantages.returns.size()) != n) {
        stats.skipped = true;
        return stats;
    }

    for (const auto& t : episode) {
        if (t.state.size() != model.stateDim() || t.action.size() != model.actionDim()) {
            std::cerr << "PPOUpdater: transition shape does not match the model, update skipped" << std::endl;
            stats.skipped = true;
            return stats;
        }
    }

    AdvantageResult batchAdvantages = advantages;
    if (m_config.normalizeAdvantages) {
        AdvantageEstimator::normalize(batchAdvantages);
    }

    // Restored if anything goes non-finite
    const Eigen::VectorXf savedActor = model.getActorParams();
    const Eigen::VectorXf savedCritic = model.getCriticParams();
    const AdamOptimizer savedActorOptimizer = m_actorOptimizer;
    const AdamOptimizer savedCriticOptimizer = m_criticOptimizer;

    const int batchSize = std::max(1, m_config.batchSize);
    const std::vector<std::vector<int>> orders = planMinibatches(n);

    double actorLossSum = 0.0;
    double criticLossSum = 0.0;

    for (const auto& order : orders) {
        for (int begin = 0; begin < n && !stats.diverged; begin += batchSize) {
            const int end = std::min(begin + batchSize, n);
            Minibatch batch = gather(episode, batchAdvantages.advantages, batchAdvantages.returns,
                                     order, begin, end);

            const float actorLoss = actorStep(model, batch);
            const float criticLoss = std::isfinite(actorLoss) ? criticStep(model, batch) : actorLoss;

            if (!std::isfinite(actorLoss) || !std::isfinite(criticLoss)) {
                stats.diverged = true;
                break;
            }
            actorLossSum += actorLoss;
            criticLossSum += criticLoss;
            stats.minibatches++;
        }
        if (stats.diverged) break;
    }

    if (!stats.diverged && !model.hasFiniteParameters()) {
        stats.diverged = true;
    }

    if (stats.diverged) {
        model.setActorParams(savedActor);
        model.setCriticParams(savedCritic);
        m_actorOptimizer = savedActorOptimizer;
        m_criticOptimizer = savedCriticOptimizer;
        std::cerr << "PPOUpdater: non-finite loss after " << stats.minibatches
                  << " minibatches, update discarded" << std::endl;
        return stats;
    }

    if (stats.minibatches > 0) {
        stats.actorLoss = static_cast<float>(actorLossSum / stats.minibatches);
        stats.criticLoss = static_cast<float>(criticLossSum / stats.minibatches);
    }
    stats.entropy = model.entropy();
    return stats;
}
