#ifndef MLPNETWORK_H
#define MLPNETWORK_H

#include <Eigen/Core>
#include <random>

/**
 * @brief Fully connected network with two tanh hidden layers
 *
 * Architecture: Input -> Hidden(tanh) -> Hidden(tanh) -> Output(linear)
 *
 * Batched calls take one observation per column. A forward pass that will
 * be differentiated fills a ForwardCache owned by the caller; the cache and
 * the Gradients it produces live only as long as the caller's scope.
 */
class MlpNetwork {
public:
    struct ForwardCache {
        Eigen::MatrixXf input;
        Eigen::MatrixXf h1;
        Eigen::MatrixXf h2;
    };

    struct Gradients {
        Eigen::MatrixXf W1, W2, W3;
        Eigen::VectorXf b1, b2, b3;

        // Same ordering as MlpNetwork::getParameters()
        Eigen::VectorXf flatten() const;
    };

    MlpNetwork(int input_dim, int hidden1, int hidden2, int output_dim);

    int inputDim() const { return static_cast<int>(m_W1.cols()); }
    int outputDim() const { return static_cast<int>(m_W3.rows()); }

    // Single observation
    Eigen::VectorXf forward(const Eigen::VectorXf& input) const;

    // Batched forward; fills cache when given
    Eigen::MatrixXf forward(const Eigen::MatrixXf& inputs, ForwardCache* cache) const;

    // dOutput holds dLoss/dOutput per column; cache must come from the
    // forward pass that produced that output
    Gradients backward(const ForwardCache& cache, const Eigen::MatrixXf& dOutput) const;

    // Flat parameter access: W1, b1, W2, b2, W3, b3 (column-major matrices)
    Eigen::VectorXf getParameters() const;
    void setParameters(const Eigen::VectorXf& params);
    int parameterCount() const;

    void randomize(std::mt19937& rng, float scale = 0.1f);

private:
    Eigen::MatrixXf m_W1, m_W2, m_W3;
    Eigen::VectorXf m_b1, m_b2, m_b3;

    static Eigen::MatrixXf tanh_activation(const Eigen::MatrixXf& x);
};

#endif // MLPNETWORK_H
