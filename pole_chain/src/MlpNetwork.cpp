#include "MlpNetwork.h"
#include <utility>

namespace {

void appendTo(Eigen::VectorXf& flat, int& idx, const float* data, Eigen::Index count)
{
    for (Eigen::Index i = 0; i < count; ++i) flat(idx++) = data[i];
}

void readFrom(const Eigen::VectorXf& flat, int& idx, float* data, Eigen::Index count)
{
    for (Eigen::Index i = 0; i < count; ++i) data[i] = flat(idx++);
}

}

MlpNetwork::MlpNetwork(int input_dim, int hidden1, int hidden2, int output_dim)
{
    m_W1 = Eigen::MatrixXf::Zero(hidden1, input_dim);
    m_b1 = Eigen::VectorXf::Zero(hidden1);
    m_W2 = Eigen::MatrixXf::Zero(hidden2, hidden1);
    m_b2 = Eigen::VectorXf::Zero(hidden2);
    m_W3 = Eigen::MatrixXf::Zero(output_dim, hidden2);
    m_b3 = Eigen::VectorXf::Zero(output_dim);
}

void MlpNetwork::randomize(std::mt19937& rng, float scale)
{
    std::normal_distribution<float> dist(0.0f, scale);

    auto fill = [&](float* data, Eigen::Index count) {
        for (Eigen::Index i = 0; i < count; ++i) data[i] = dist(rng);
    };

    fill(m_W1.data(), m_W1.size());
    fill(m_b1.data(), m_b1.size());
    fill(m_W2.data(), m_W2.size());
    fill(m_b2.data(), m_b2.size());
    fill(m_W3.data(), m_W3.size());
    fill(m_b3.data(), m_b3.size());
}

Eigen::MatrixXf MlpNetwork::tanh_activation(const Eigen::MatrixXf& x)
{
    return x.array().tanh().matrix();
}

Eigen::VectorXf MlpNetwork::forward(const Eigen::VectorXf& input) const
{
    Eigen::VectorXf h1 = (m_W1 * input + m_b1).array().tanh().matrix();
    Eigen::VectorXf h2 = (m_W2 * h1 + m_b2).array().tanh().matrix();
    return m_W3 * h2 + m_b3;
}

Eigen::MatrixXf MlpNetwork::forward(const Eigen::MatrixXf& inputs, ForwardCache* cache) const
{
    Eigen::MatrixXf z1 = m_W1 * inputs;
    z1.colwise() += m_b1;
    Eigen::MatrixXf h1 = tanh_activation(z1);

    Eigen::MatrixXf z2 = m_W2 * h1;
    z2.colwise() += m_b2;
    Eigen::MatrixXf h2 = tanh_activation(z2);

    Eigen::MatrixXf out = m_W3 * h2;
    out.colwise() += m_b3;

    if (cache) {
        cache->input = inputs;
        cache->h1 = std::move(h1);
        cache->h2 = std::move(h2);
    }
    return out;
}

MlpNetwork::Gradients MlpNetwork::backward(const ForwardCache& cache, const Eigen::MatrixXf& dOutput) const
{
    Gradients g;

    // Output layer (linear)
    g.W3 = dOutput * cache.h2.transpose();
    g.b3 = dOutput.rowwise().sum();

    // tanh'(z) = 1 - tanh(z)^2
    Eigen::MatrixXf dz2 = (m_W3.transpose() * dOutput).cwiseProduct(
        (1.0f - cache.h2.array().square()).matrix());
    g.W2 = dz2 * cache.h1.transpose();
    g.b2 = dz2.rowwise().sum();

    Eigen::MatrixXf dz1 = (m_W2.transpose() * dz2).cwiseProduct(
        (1.0f - cache.h1.array().square()).matrix());
    g.W1 = dz1 * cache.input.transpose();
    g.b1 = dz1.rowwise().sum();

    return g;
}

int MlpNetwork::parameterCount() const
{
    return static_cast<int>(m_W1.size() + m_b1.size() + m_W2.size() + m_b2.size() + m_W3.size() + m_b3.size());
}

Eigen::VectorXf MlpNetwork::getParameters() const
{
    Eigen::VectorXf params(parameterCount());
    int idx = 0;

    appendTo(params, idx, m_W1.data(), m_W1.size());
    appendTo(params, idx, m_b1.data(), m_b1.size());
    appendTo(params, idx, m_W2.data(), m_W2.size());
    appendTo(params, idx, m_b2.data(), m_b2.size());
    appendTo(params, idx, m_W3.data(), m_W3.size());
    appendTo(params, idx, m_b3.data(), m_b3.size());

    return params;
}

void MlpNetwork::setParameters(const Eigen::VectorXf& params)
{
    int idx = 0;

    readFrom(params, idx, m_W1.data(), m_W1.size());
    readFrom(params, idx, m_b1.data(), m_b1.size());
    readFrom(params, idx, m_W2.data(), m_W2.size());
    readFrom(params, idx, m_b2.data(), m_b2.size());
    readFrom(params, idx, m_W3.data(), m_W3.size());
    readFrom(params, idx, m_b3.data(), m_b3.size());
}

Eigen::VectorXf MlpNetwork::Gradients::flatten() const
{
    Eigen::VectorXf flat(W1.size() + b1.size() + W2.size() + b2.size() + W3.size() + b3.size());
    int idx = 0;

    appendTo(flat, idx, W1.data(), W1.size());
    appendTo(flat, idx, b1.data(), b1.size());
    appendTo(flat, idx, W2.data(), W2.size());
    appendTo(flat, idx, b2.data(), b2.size());
    appendTo(flat, idx, W3.data(), W3.size());
    appendTo(flat, idx, b3.data(), b3.size());

    return flat;
}
