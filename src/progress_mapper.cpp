#include "progress_mapper.h"

#include <algorithm>
#include <cmath>
#include <utility>

struct PhaseRange
{
    int min;
    int max;
};

static PhaseRange phase_range(ProcessingPhase phase)
{
    switch (phase)
    {
    case ProcessingPhase::Demuxing:
        return {0, 5};
    case ProcessingPhase::Encoding:
        return {5, 85};
    case ProcessingPhase::Processing:
        return {5, 92};
    case ProcessingPhase::Muxing:
        return {92, 99};
    case ProcessingPhase::Complete:
    default:
        return {100, 100};
    }
}

static SteadyClock default_clock(SteadyClock clock)
{
    if (clock)
        return clock;
    return []()
    { return std::chrono::steady_clock::now(); };
}

ProgressMapper::ProgressMapper(SteadyClock clock)
    : m_clock(default_clock(std::move(clock)))
{
    m_started = m_clock();
}

void ProgressMapper::reset()
{
    m_started = m_clock();
    m_displayed = 0;
    m_smoothedEta.reset();
}

int ProgressMapper::mapPhasePercent(ProcessingPhase phase, double phasePercent)
{
    if (phase == ProcessingPhase::Complete)
        return 100;

    double clamped = std::isfinite(phasePercent) ? std::clamp(phasePercent, 0.0, 100.0) : 0.0;
    PhaseRange range = phase_range(phase);
    return static_cast<int>(std::lround(range.min + (range.max - range.min) * (clamped / 100.0)));
}

ProcessingProgress ProgressMapper::update(const ProcessingProgress &phaseProgress)
{
    int mapped = mapPhasePercent(phaseProgress.phase, phaseProgress.percent);
    if (phaseProgress.phase == ProcessingPhase::Complete)
        m_displayed = 100;
    else
        m_displayed = std::min(99, std::max(m_displayed, mapped));

    ProcessingProgress out = phaseProgress;
    out.percent = m_displayed;
    out.estimatedRemainingSeconds = updateEta(phaseProgress.phase, m_displayed);
    return out;
}

std::optional<double> ProgressMapper::updateEta(ProcessingPhase phase, int percent)
{
    if (phase == ProcessingPhase::Complete)
    {
        m_smoothedEta = 0.0;
        return 0.0;
    }
    if (percent <= 0)
    {
        m_smoothedEta.reset();
        return std::nullopt;
    }

    double elapsed = std::max(0.0, std::chrono::duration<double>(m_clock() - m_started).count());
    double raw = elapsed * (100.0 - percent) / percent;
    if (m_smoothedEta)
        m_smoothedEta = *m_smoothedEta * 0.7 + raw * 0.3;
    else
        m_smoothedEta = raw;
    return std::max(0.0, std::round(*m_smoothedEta));
}

ThrottledProgressReporter::ThrottledProgressReporter(ProgressCallback onProgress, int64_t totalFrames,
                                                     std::chrono::milliseconds interval, SteadyClock clock)
    : m_onProgress(std::move(onProgress)), m_totalFrames(totalFrames), m_interval(interval),
      m_clock(default_clock(std::move(clock)))
{
}

void ThrottledProgressReporter::report(int64_t framesProcessed, bool force)
{
    if (!m_onProgress)
        return;

    auto now = m_clock();
    bool due = force || framesProcessed == 0 || framesProcessed == m_totalFrames ||
               !m_lastReport || now - *m_lastReport >= m_interval;
    if (!due)
        return;
    m_lastReport = now;

    ProcessingProgress p;
    p.phase = ProcessingPhase::Processing;
    p.percent = m_totalFrames > 0
                    ? static_cast<int>(std::lround(100.0 * framesProcessed / m_totalFrames))
                    : 0;
    p.framesProcessed = framesProcessed;
    p.totalFrames = m_totalFrames;
    m_onProgress(p);
}
