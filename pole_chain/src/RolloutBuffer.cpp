#include "RolloutBuffer.h"

std::vector<Transition> RolloutBuffer::takeEpisode()
{
    std::vector<Transition> episode;
    episode.swap(m_transitions);
    m_clearCount++;
    return episode;
}

void RolloutBuffer::clear()
{
    m_transitions.clear();
    m_clearCount++;
}
