#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

#include "pipeline_types.h"

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

// Converts per-phase progress into one global 0..100 value that never decreases
// during a run. Only the complete phase reports 100.
class ProgressMapper
{
public:
    explicit ProgressMapper(SteadyClock clock = {});

    // Restart the run: displayed percent back to 0, ETA history cleared
    void reset();

    // Global percent for a phase-local percent, without the monotonic clamp
    static int mapPhasePercent(ProcessingPhase phase, double phasePercent);

    // Returns the snapshot to display: percent is global, ETA is smoothed
    ProcessingProgress update(const ProcessingProgress &phaseProgress);

    int displayedPercent() const { return m_displayed; }

private:
    std::optional<double> updateEta(ProcessingPhase phase, int percent);

    SteadyClock m_clock;
    std::chrono::steady_clock::time_point m_started;
    int m_displayed = 0;
    std::optional<double> m_smoothedEta;
};

// Rate limits processing-phase progress events. The first frame, the last frame and
// forced reports always go through; others at most once per interval.
class ThrottledProgressReporter
{
public:
    ThrottledProgressReporter(ProgressCallback onProgress, int64_t totalFrames,
                              std::chrono::milliseconds interval, SteadyClock clock = {});

    void report(int64_t framesProcessed, bool force = false);

private:
    ProgressCallback m_onProgress;
    int64_t m_totalFrames;
    std::chrono::milliseconds m_interval;
    SteadyClock m_clock;
    std::optional<std::chrono::steady_clock::time_point> m_lastReport;
};
