#ifndef ROLLOUTBUFFER_H
#define ROLLOUTBUFFER_H

#include <Eigen/Core>
#include <cstddef>
#include <utility>
#include <vector>

struct Transition {
    Eigen::VectorXf state;
    Eigen::VectorXf action;
    float reward = 0.0f;
    bool done = false;
    float log_prob = 0.0f;
    float value = 0.0f;
};

/**
 * @brief Ordered transitions of the episode currently being collected
 *
 * takeEpisode() hands the whole sequence over and leaves the buffer empty,
 * so one episode's transitions can never leak into the next.
 */
class RolloutBuffer {
public:
    void push(Transition t) { m_transitions.push_back(std::move(t)); }

    std::vector<Transition> takeEpisode();
    void clear();

    std::size_t size() const { return m_transitions.size(); }
    bool empty() const { return m_transitions.empty(); }
    const std::vector<Transition>& transitions() const { return m_transitions; }

    // Number of times the buffer has been emptied
    std::size_t clearCount() const { return m_clearCount; }

private:
    std::vector<Transition> m_transitions;
    std::size_t m_clearCount = 0;
};

#endif // ROLLOUTBUFFER_H
