#pragma once
#include "tokentrail/world/CellRenderer.hpp"

namespace tokentrail {

inline constexpr int kWinThreshold = 2048;

// Monotonic maximum of every token value the world has produced.
// Fires OnThresholdReached at most once per session.
class HighestValueRecord {
public:
    explicit HighestValueRecord(IScoreListener& listener, int threshold = kWinThreshold) noexcept
        : m_listener(&listener), m_threshold(threshold) {}

    // Returns true if the record increased.
    bool Observe(int value);

    [[nodiscard]] int Value() const noexcept { return m_value; }
    [[nodiscard]] int Threshold() const noexcept { return m_threshold; }
    [[nodiscard]] bool ThresholdReached() const noexcept { return m_reached; }

    // Load and reset paths: set the record and report the new value to the HUD.
    // OnThresholdReached is never replayed from here.
    void Restore(int value, bool thresholdReached);
    void Reset();

private:
    IScoreListener* m_listener;
    int m_threshold;
    int m_value = 0;
    bool m_reached = false;
};

} // namespace tokentrail
