#include "AdamOptimizer.h"
#include <cmath>

AdamOptimizer::AdamOptimizer(float learningRate, float beta1, float beta2, float epsilon)
    : m_learningRate(learningRate)
    , m_beta1(beta1)
    , m_beta2(beta2)
    , m_epsilon(epsilon)
    , m_t(0)
{
}

Eigen::VectorXf AdamOptimizer::step(const Eigen::VectorXf& gradient)
{
    if (m_m.size() != gradient.size()) {
        m_m = Eigen::VectorXf::Zero(gradient.size());
        m_v = Eigen::VectorXf::Zero(gradient.size());
        m_t = 0;
    }

    m_t++;

    // m_t = beta1 * m_{t-1} + (1 - beta1) * g_t
    m_m = m_beta1 * m_m + (1.0f - m_beta1) * gradient;

    // v_t = beta2 * v_{t-1} + (1 - beta2) * g_t^2
    m_v = m_beta2 * m_v + (1.0f - m_beta2) * gradient.array().square().matrix();

    const float biasCorrection1 = 1.0f - std::pow(m_beta1, static_cast<float>(m_t));
    const float biasCorrection2 = 1.0f - std::pow(m_beta2, static_cast<float>(m_t));

    Eigen::VectorXf m_hat = m_m / biasCorrection1;
    Eigen::VectorXf v_hat = m_v / biasCorrection2;

    // theta_t = theta_{t-1} - alpha * m_hat_t / (sqrt(v_hat_t) + epsilon)
    Eigen::VectorXf update = (m_learningRate * m_hat.array() /
                              (v_hat.array().sqrt() + m_epsilon)).matrix();

    return update;
}

void AdamOptimizer::apply(Eigen::VectorXf& params, const Eigen::VectorXf& gradient)
{
    params -= step(gradient);
}

void AdamOptimizer::reset()
{
    m_m.resize(0);
    m_v.resize(0);
    m_t = 0;
}
