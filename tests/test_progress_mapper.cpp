#include <catch2/catch.hpp>

#include "progress_mapper.h"

struct FakeClock
{
    std::chrono::steady_clock::time_point now{};

    SteadyClock fn()
    {
        return [this]() { return now; };
    }

    void advance(std::chrono::milliseconds ms) { now += ms; }
};

static ProcessingProgress phase_progress(ProcessingPhase phase, int percent)
{
    ProcessingProgress p;
    p.phase = phase;
    p.percent = percent;
    return p;
}

TEST_CASE("Phase percentages map into global ranges", "[progress]")
{
    CHECK(ProgressMapper::mapPhasePercent(ProcessingPhase::Demuxing, 0) == 0);
    CHECK(ProgressMapper::mapPhasePercent(ProcessingPhase::Demuxing, 100) == 5);
    CHECK(ProgressMapper::mapPhasePercent(ProcessingPhase::Encoding, 100) == 85);
    CHECK(ProgressMapper::mapPhasePercent(ProcessingPhase::Processing, 0) == 5);
    CHECK(ProgressMapper::mapPhasePercent(ProcessingPhase::Processing, 100) == 92);
    CHECK(ProgressMapper::mapPhasePercent(ProcessingPhase::Muxing, 0) == 92);
    CHECK(ProgressMapper::mapPhasePercent(ProcessingPhase::Muxing, 100) == 99);
    CHECK(ProgressMapper::mapPhasePercent(ProcessingPhase::Complete, 0) == 100);

    // Out of range phase values are clamped
    CHECK(ProgressMapper::mapPhasePercent(ProcessingPhase::Muxing, 250) == 99);
    CHECK(ProgressMapper::mapPhasePercent(ProcessingPhase::Processing, -10) == 5);
}

TEST_CASE("Displayed progress never decreases and only completion reaches 100", "[progress]")
{
    FakeClock clock;
    ProgressMapper mapper(clock.fn());

    CHECK(mapper.update(phase_progress(ProcessingPhase::Processing, 52)).percent == 50);
    // A repair pass reporting from the start of its range does not move the bar back
    CHECK(mapper.update(phase_progress(ProcessingPhase::Encoding, 0)).percent == 50);
    CHECK(mapper.update(phase_progress(ProcessingPhase::Demuxing, 100)).percent == 50);

    CHECK(mapper.update(phase_progress(ProcessingPhase::Muxing, 100)).percent == 99);
    CHECK(mapper.displayedPercent() == 99);

    CHECK(mapper.update(phase_progress(ProcessingPhase::Complete, 0)).percent == 100);

    mapper.reset();
    CHECK(mapper.displayedPercent() == 0);
    CHECK(mapper.update(phase_progress(ProcessingPhase::Demuxing, 0)).percent == 0);
}

TEST_CASE("Remaining time is extrapolated and smoothed", "[progress]")
{
    FakeClock clock;
    ProgressMapper mapper(clock.fn());

    CHECK_FALSE(mapper.update(phase_progress(ProcessingPhase::Demuxing, 0)).estimatedRemainingSeconds);

    clock.advance(std::chrono::seconds(10));
    auto half = mapper.update(phase_progress(ProcessingPhase::Processing, 52));
    REQUIRE(half.estimatedRemainingSeconds);
    CHECK(*half.estimatedRemainingSeconds == Approx(10.0));

    clock.advance(std::chrono::seconds(10));
    auto late = mapper.update(phase_progress(ProcessingPhase::Processing, 100));
    REQUIRE(late.estimatedRemainingSeconds);
    // 0.7 * 10 + 0.3 * (20 * 8 / 92)
    CHECK(*late.estimatedRemainingSeconds == Approx(8.0));

    auto done = mapper.update(phase_progress(ProcessingPhase::Complete, 100));
    REQUIRE(done.estimatedRemainingSeconds);
    CHECK(*done.estimatedRemainingSeconds == 0.0);
}

TEST_CASE("Frame progress is throttled", "[progress]")
{
    FakeClock clock;
    std::vector<ProcessingProgress> events;
    ThrottledProgressReporter reporter([&](const ProcessingProgress &p) { events.push_back(p); },
                                       100, std::chrono::milliseconds(120), clock.fn());

    reporter.report(0);
    reporter.report(1);
    reporter.report(2);
    REQUIRE(events.size() == 1);
    CHECK(events[0].phase == ProcessingPhase::Processing);
    CHECK(events[0].percent == 0);

    clock.advance(std::chrono::milliseconds(120));
    reporter.report(40);
    REQUIRE(events.size() == 2);
    CHECK(events[1].percent == 40);
    CHECK(events[1].framesProcessed == 40);
    CHECK(events[1].totalFrames == 100);

    reporter.report(41);
    CHECK(events.size() == 2);
    reporter.report(42, true);
    CHECK(events.size() == 3);

    // The last frame always gets through
    reporter.report(100);
    REQUIRE(events.size() == 4);
    CHECK(events.back().percent == 100);
}

TEST_CASE("Reporter without a callback does nothing", "[progress]")
{
    ThrottledProgressReporter reporter({}, 10, std::chrono::milliseconds(120));
    reporter.report(0);
    reporter.report(10);
    SUCCEED();
}
