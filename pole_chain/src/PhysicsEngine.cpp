#include "PhysicsEngine.h"
#include <cmath>
#include <stdexcept>

PhysicsEngine::PhysicsEngine(int numPoles, const PhysicsConfig& config, unsigned int seed)
    : m_numPoles(numPoles)
    , m_config(config)
    , m_rng(seed == 0 ? std::random_device{}() : seed)
{
    if (numPoles < 1) {
        throw std::invalid_argument("PhysicsEngine: numPoles must be >= 1");
    }
    reset();
}

void PhysicsEngine::reset()
{
    std::uniform_real_distribution<double> jitter(-m_config.initialJitter, m_config.initialJitter);

    m_state = State::Zero(stateDimension());
    for (int i = 0; i < m_numPoles; ++i) {
        m_state(poleAngleIndex(i)) = jitter(m_rng);
        m_state(poleRateIndex(i)) = jitter(m_rng);
    }
}

bool PhysicsEngine::setState(const State& state)
{
    if (state.size() != stateDimension()) return false;
    m_state = state;
    return true;
}

PhysicsEngine::State PhysicsEngine::derivative(const State& state, double force) const
{
    const double a = force / totalMass();
    const double g = m_config.gravity;
    const double L = m_config.poleLength;

    State d(state.size());
    d(cartPositionIndex()) = state(cartVelocityIndex());
    d(cartVelocityIndex()) = a;

    for (int i = 0; i < m_numPoles; ++i) {
        const double theta = state(poleAngleIndex(i));
        d(poleAngleIndex(i)) = state(poleRateIndex(i));
        d(poleRateIndex(i)) = -(g / L) * std::sin(theta) - (a / L) * std::cos(theta);
    }
    return d;
}

PhysicsEngine::State PhysicsEngine::rk4Step(const State& state, double force, double dt) const
{
    State k1 = derivative(state, force);
    State k2 = derivative(state + 0.5 * dt * k1, force);
    State k3 = derivative(state + 0.5 * dt * k2, force);
    State k4 = derivative(state + dt * k3, force);
    return state + (dt / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
}

int PhysicsEngine::advance(double force, double elapsedMillis)
{
    if (!(elapsedMillis > 0.0)) return 0;

    const int steps = static_cast<int>(std::floor(elapsedMillis / (m_config.dt * 1000.0)));
    for (int s = 0; s < steps; ++s) {
        m_state = rk4Step(m_state, force, m_config.dt);
    }
    return steps;
}

std::vector<double> PhysicsEngine::tipHeights() const
{
    std::vector<double> heights(m_numPoles);
    double height = 0.0;
    for (int i = 0; i < m_numPoles; ++i) {
        height += m_config.poleLength * std::cos(m_state(poleAngleIndex(i)));
        heights[i] = height;
    }
    return heights;
}

bool PhysicsEngine::isTerminal() const
{
    if (std::abs(m_state(cartPositionIndex())) > m_config.trackLimit) return true;

    for (double h : tipHeights()) {
        if (h <= m_config.groundMargin) return true;
    }
    return false;
}

bool PhysicsEngine::hasFiniteState() const
{
    return m_state.allFinite();
}
