#ifndef ADAMOPTIMIZER_H
#define ADAMOPTIMIZER_H

#include <Eigen/Core>

/**
 * @brief Adam optimizer over a flat parameter vector
 *
 * Keeps one first-moment and one second-moment estimate per parameter and
 * returns the bias-corrected step lr * m_hat / (sqrt(v_hat) + eps).
 * The actor (network weights followed by logStd) and the critic each own
 * an instance, so their moments never mix.
 */
class AdamOptimizer
{
public:
    /**
     * @brief Construct Adam optimizer
     * @param learningRate Step size
     * @param beta1 Exponential decay rate for first moment (default: 0.9)
     * @param beta2 Exponential decay rate for second moment (default: 0.999)
     * @param epsilon Small constant for numerical stability (default: 1e-8)
     */
    explicit AdamOptimizer(float learningRate, float beta1 = 0.9f, float beta2 = 0.999f, float epsilon = 1e-8f);

    /**
     * @brief Perform one Adam step
     * @param gradient dLoss/dParams, same layout as the parameters it updates
     * @return delta to subtract from the parameters
     *
     * Moments are sized on the first call; a gradient of another size
     * restarts the optimizer.
     */
    Eigen::VectorXf step(const Eigen::VectorXf& gradient);

    /**
     * @brief Minimize in place: params -= step(gradient)
     */
    void apply(Eigen::VectorXf& params, const Eigen::VectorXf& gradient);

    /**
     * @brief Reset optimizer state (clear momentum moments)
     */
    void reset();

    int timestep() const { return m_t; }

private:
    float m_learningRate;
    float m_beta1;   // First moment decay (momentum)
    float m_beta2;   // Second moment decay (RMSprop)
    float m_epsilon;  // Numerical stability

    // Internal state
    Eigen::VectorXf m_m;  // First moment (moving average of gradients)
    Eigen::VectorXf m_v;  // Second moment (moving average of squared gradients)
    int m_t;              // Timestep counter
};

#endif // ADAMOPTIMIZER_H
