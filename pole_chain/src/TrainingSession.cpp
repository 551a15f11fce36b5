#include "TrainingSession.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

double EpisodeBatch::totalReward() const
{
    double total = 0.0;
    for (const auto& t : transitions) total += t.reward;
    return total;
}

TrainingSession::TrainingSession(const TrainingConfig& config)
    : m_config(config)
{
    std::string error;
    if (!m_config.isValid(&error)) {
        throw std::invalid_argument("TrainingSession: " + error);
    }
    m_physics = makePhysics(m_config);
    m_model = makeModel(m_config);
}

std::unique_ptr<PhysicsEngine> TrainingSession::makePhysics(const TrainingConfig& config)
{
    return std::make_unique<PhysicsEngine>(config.numPoles, config.physics, config.seed);
}

std::unique_ptr<ActorCritic> TrainingSession::makeModel(const TrainingConfig& config)
{
    const int stateDim = 2 + 2 * config.numPoles;
    // Offset so the model does not replay the physics jitter stream
    const unsigned int seed = config.seed == 0 ? 0u : config.seed + 1u;
    return std::make_unique<ActorCritic>(stateDim, 1, config.hiddenWidth, config.initialLogStd, seed);
}

TickResult TrainingSession::tick(double elapsedMillis)
{
    TickResult result;

    Eigen::VectorXf observation = m_physics->state().cast<float>();
    ActionSample sample = m_model->getAction(observation);
    result.action = sample.action(0);

    result.physicsSteps = m_physics->advance(static_cast<double>(sample.action(0)), elapsedMillis);

    if (!m_physics->hasFiniteState() || !std::isfinite(sample.logProb) || !std::isfinite(sample.value)) {
        m_consecutiveDivergences++;
        std::cerr << "TrainingSession: non-finite state after " << m_buffer.size()
                  << " transitions, episode discarded" << std::endl;
        m_buffer.clear();
        m_physics->reset();
        result.done = true;
        result.diverged = true;
        return result;
    }

    Transition t;
    t.state = std::move(observation);
    t.action = sample.action;
    t.reward = 1.0f;
    t.done = m_physics->isTerminal();
    t.log_prob = sample.logProb;
    t.value = sample.value;
    m_buffer.push(std::move(t));

    result.done = m_buffer.transitions().back().done;
    if (!result.done) return result;

    EpisodeBatch batch;
    batch.episode = ++m_episodeCount;
    batch.transitions = m_buffer.takeEpisode();
    m_bestEpisodeSteps = std::max(m_bestEpisodeSteps, batch.steps());

    m_physics->reset();
    result.episode = std::move(batch);
    return result;
}

bool TrainingSession::reconfigure(int numPoles, std::string* error)
{
    TrainingConfig next = m_config;
    next.numPoles = numPoles;
    if (!next.isValid(error)) return false;

    std::unique_ptr<PhysicsEngine> physics = makePhysics(next);
    std::unique_ptr<ActorCritic> model = makeModel(next);

    m_config = next;
    m_physics = std::move(physics);
    m_model = std::move(model);
    m_buffer.clear();
    m_episodeCount = 0;
    m_consecutiveDivergences = 0;
    m_bestEpisodeSteps = 0;
    return true;
}

void TrainingSession::resetSimulation()
{
    m_buffer.clear();
    m_physics->reset();
}

void TrainingSession::setGravity(double gravity)
{
    m_config.physics.gravity = gravity;
    m_physics->setGravity(gravity);
}
