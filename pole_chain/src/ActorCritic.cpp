#include "ActorCritic.h"
#include <cmath>

namespace {
const float kLog2Pi = std::log(2.0f * static_cast<float>(M_PI));
}

ActorCritic::ActorCritic(int state_dim, int action_dim, int hidden, float initial_log_std, unsigned int seed)
    : m_actor(state_dim, hidden, hidden, action_dim)
    , m_critic(state_dim, hidden, hidden, 1)
    , m_logStd(Eigen::VectorXf::Constant(action_dim, initial_log_std))
    , m_rng(seed == 0 ? std::random_device{}() : seed)
{
    m_actor.randomize(m_rng);
    m_critic.randomize(m_rng);
}

ActionSample ActorCritic::getAction(const Eigen::VectorXf& state)
{
    Eigen::VectorXf mu = m_actor.forward(state);

    ActionSample sample;
    sample.action.resize(mu.size());
    sample.logProb = 0.0f;

    for (int d = 0; d < mu.size(); ++d) {
        const float noise = m_noise(m_rng);
        sample.action(d) = mu(d) + std::exp(m_logStd(d)) * noise;
        sample.logProb += -0.5f * (noise * noise + 2.0f * m_logStd(d) + kLog2Pi);
    }

    sample.value = m_critic.forward(state)(0);
    return sample;
}

float ActorCritic::logProbability(const Eigen::VectorXf& action,
                                  const Eigen::VectorXf& mean,
                                  const Eigen::VectorXf& logStd)
{
    float logProb = 0.0f;
    for (int d = 0; d < action.size(); ++d) {
        const float z = (action(d) - mean(d)) / std::exp(logStd(d));
        logProb += -0.5f * (z * z + 2.0f * logStd(d) + kLog2Pi);
    }
    return logProb;
}

float ActorCritic::entropy() const
{
    // 0.5 * ln(2 pi e) = 0.5 * (ln(2 pi) + 1)
    return m_logStd.sum() + static_cast<float>(m_logStd.size()) * 0.5f * (kLog2Pi + 1.0f);
}

int ActorCritic::actorParamCount() const
{
    return m_actor.parameterCount() + static_cast<int>(m_logStd.size());
}

int ActorCritic::criticParamCount() const
{
    return m_critic.parameterCount();
}

Eigen::VectorXf ActorCritic::getActorParams() const
{
    Eigen::VectorXf p(actorParamCount());
    const int n = m_actor.parameterCount();
    p.head(n) = m_actor.getParameters();
    p.tail(m_logStd.size()) = m_logStd;
    return p;
}

Eigen::VectorXf ActorCritic::getCriticParams() const
{
    return m_critic.getParameters();
}

void ActorCritic::setActorParams(const Eigen::VectorXf& p)
{
    const int n = m_actor.parameterCount();
    m_actor.setParameters(p.head(n));
    m_logStd = p.tail(m_logStd.size());
}

void ActorCritic::setCriticParams(const Eigen::VectorXf& p)
{
    m_critic.setParameters(p);
}

void ActorCritic::copyParametersFrom(const ActorCritic& other)
{
    m_actor = other.m_actor;
    m_critic = other.m_critic;
    m_logStd = other.m_logStd;
}

bool ActorCritic::hasFiniteParameters() const
{
    return getActorParams().allFinite() && getCriticParams().allFinite();
}
