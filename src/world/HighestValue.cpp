#include "tokentrail/world/HighestValue.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace tokentrail {

bool HighestValueRecord::Observe(int value)
{
    if (value <= m_value)
        return false;

    m_value = value;
    m_listener->OnHighestValueChanged(m_value);

    if (!m_reached && m_value >= m_threshold) {
        m_reached = true;
        spdlog::info("Highest token value {} reached the win threshold {}", m_value, m_threshold);
        m_listener->OnThresholdReached(m_threshold);
    }
    return true;
}

void HighestValueRecord::Restore(int value, bool thresholdReached)
{
    m_value = std::max(0, value);
    m_reached = thresholdReached || m_value >= m_threshold;
    m_listener->OnHighestValueChanged(m_value);
}

void HighestValueRecord::Reset()
{
    m_value = 0;
    m_reached = false;
    m_listener->OnHighestValueChanged(m_value);
}

} // namespace tokentrail
