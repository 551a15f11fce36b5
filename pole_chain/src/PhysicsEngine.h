#ifndef PHYSICSENGINE_H
#define PHYSICSENGINE_H

#include <Eigen/Core>
#include <random>
#include <vector>
#include "TrainingConfig.h"

/**
 * @brief Cart carrying a vertical chain of N inverted poles
 *
 * State layout: [x, x_dot, theta_1, theta_1_dot, ..., theta_N, theta_N_dot]
 * - cart at offsets 0..1
 * - pole i (0-based) at offsets 2+2i .. 3+2i
 *
 * The cart acceleration is force / (massCart + N * massPole) and every pole
 * sees that same acceleration. Poles do not feed reaction forces back into
 * the cart or into each other, so this is not a coupled multi-body model.
 */
class PhysicsEngine {
public:
    using State = Eigen::VectorXd;

    // Throws std::invalid_argument if numPoles < 1
    PhysicsEngine(int numPoles, const PhysicsConfig& config = PhysicsConfig{}, unsigned int seed = 0);

    int numPoles() const { return m_numPoles; }
    int stateDimension() const { return 2 + 2 * m_numPoles; }
    const PhysicsConfig& config() const { return m_config; }

    static constexpr int cartPositionIndex() { return 0; }
    static constexpr int cartVelocityIndex() { return 1; }
    static constexpr int poleAngleIndex(int pole) { return 2 + 2 * pole; }
    static constexpr int poleRateIndex(int pole) { return 3 + 2 * pole; }

    const State& state() const { return m_state; }
    // Returns false (state untouched) if the length does not match
    bool setState(const State& state);

    // Time derivative of a state under a cart force
    State derivative(const State& state, double force) const;

    // One classical RK4 step; no hidden state, no randomness
    State rk4Step(const State& state, double force, double dt) const;

    // Runs floor(elapsedMillis / (dt * 1000)) RK4 steps; the sub-step
    // remainder is dropped. Returns the number of steps taken.
    int advance(double force, double elapsedMillis);

    bool isTerminal() const;
    bool hasFiniteState() const;

    // Height of each pole tip above the ground line (m)
    std::vector<double> tipHeights() const;

    void reset();
    void setGravity(double gravity) { m_config.gravity = gravity; }

private:
    double totalMass() const { return m_config.massCart + m_numPoles * m_config.massPole; }

    int m_numPoles;
    PhysicsConfig m_config;
    State m_state;
    std::mt19937 m_rng;
};

#endif // PHYSICSENGINE_H
