#ifndef TRAININGSESSION_H
#define TRAININGSESSION_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ActorCritic.h"
#include "PhysicsEngine.h"
#include "RolloutBuffer.h"
#include "TrainingConfig.h"

struct EpisodeBatch {
    int episode = 0;                       // 1-based episode counter
    std::vector<Transition> transitions;

    int steps() const { return static_cast<int>(transitions.size()); }
    double totalReward() const;
};

struct TickResult {
    int physicsSteps = 0;
    float action = 0.0f;
    bool done = false;
    bool diverged = false;                 // non-finite state, episode discarded
    std::optional<EpisodeBatch> episode;   // set when a finished episode is ready for training
};

/**
 * @brief Simulator, policy/value model and rollout buffer of one configuration
 *
 * One tick: query the policy, advance the physics by the elapsed time,
 * record the transition and, when the episode ends, hand the episode over
 * and reset the physics. Training itself is done by the caller.
 */
class TrainingSession {
public:
    // Throws std::invalid_argument on an invalid configuration
    explicit TrainingSession(const TrainingConfig& config);

    TickResult tick(double elapsedMillis);

    // Tears down and rebuilds physics, model and buffer for a new pole
    // count. Returns false and leaves the session untouched when invalid.
    bool reconfigure(int numPoles, std::string* error = nullptr);

    // Fresh physics, empty buffer; the model is kept
    void resetSimulation();

    const TrainingConfig& config() const { return m_config; }
    int numPoles() const { return m_config.numPoles; }

    PhysicsEngine& physics() { return *m_physics; }
    const PhysicsEngine& physics() const { return *m_physics; }
    ActorCritic& model() { return *m_model; }
    const ActorCritic& model() const { return *m_model; }
    const RolloutBuffer& buffer() const { return m_buffer; }

    int episodeCount() const { return m_episodeCount; }
    int consecutiveDivergences() const { return m_consecutiveDivergences; }
    int bestEpisodeSteps() const { return m_bestEpisodeSteps; }

    // The streak grows with every discarded episode or update and only
    // ends when an update is applied to the model
    void recordDivergence() { m_consecutiveDivergences++; }
    void clearDivergences() { m_consecutiveDivergences = 0; }

    void setGravity(double gravity);

private:
    static std::unique_ptr<PhysicsEngine> makePhysics(const TrainingConfig& config);
    static std::unique_ptr<ActorCritic> makeModel(const TrainingConfig& config);

    TrainingConfig m_config;
    std::unique_ptr<PhysicsEngine> m_physics;
    std::unique_ptr<ActorCritic> m_model;
    RolloutBuffer m_buffer;

    int m_episodeCount = 0;
    int m_consecutiveDivergences = 0;
    int m_bestEpisodeSteps = 0;
};

#endif // TRAININGSESSION_H
