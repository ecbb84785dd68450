#include <catch2/catch.hpp>

#include "pipeline_orchestrator.h"
#include "test_fakes.h"

// Fakes for every platform seam, sharing their logs with the test
struct Harness
{
    std::shared_ptr<CodecLog> codec = std::make_shared<CodecLog>();
    std::shared_ptr<WriterLog> writer = std::make_shared<WriterLog>();
    std::shared_ptr<CompositorLog> compositor = std::make_shared<CompositorLog>();
    AcceptingProbe probe;
    FakeTranscoder transcoder;
    PipelineTuning tuning;
    std::atomic<bool> abortFlag{false};
    std::vector<ProcessingProgress> progress;

    PipelineResources resources()
    {
        PipelineResources res;
        auto codecLog = codec;
        auto compositorLog = compositor;
        res.decoderFactory = [codecLog](DecodedFrameCallback onFrame, CodecErrorCallback onError)
        { return std::unique_ptr<IVideoDecoder>(new FakeDecoder(codecLog, std::move(onFrame), std::move(onError))); };
        res.encoderFactory = [codecLog](EncodedChunkCallback onChunk, CodecErrorCallback onError)
        { return std::unique_ptr<IVideoEncoder>(new FakeEncoder(codecLog, std::move(onChunk), std::move(onError))); };
        res.compositorFactory = [compositorLog](int width, int height, AVPixelFormat)
        {
            compositorLog->width = width;
            compositorLog->height = height;
            return std::unique_ptr<IFrameCompositor>(new FakeCompositor(compositorLog));
        };
        res.writerFactory = fake_writer_factory(writer);
        res.probe = &probe;
        res.transcoder = &transcoder;
        return res;
    }

    ByteBuffer run(const PipelineRequest &request, PipelineOrchestrator &orchestrator)
    {
        return orchestrator.run(request, [this](const ProcessingProgress &p) { progress.push_back(p); }, abortFlag);
    }
};

static PipelineRequest request_for(ByteBuffer mp4)
{
    PipelineRequest request;
    request.source = MediaSource::fromBuffer(std::move(mp4), "clip.mp4");
    return request;
}

static ErrorKind run_error_kind(Harness &h, PipelineOrchestrator &orchestrator, const PipelineRequest &request,
                                std::string *message = nullptr)
{
    try
    {
        h.run(request, orchestrator);
    }
    catch (const PipelineError &e)
    {
        if (message)
            *message = e.what();
        return e.kind();
    }
    FAIL("run should throw");
    return ErrorKind::ParseFailure;
}

TEST_CASE("Full run encodes every frame with keyframes on the source GOP", "[orchestrator]")
{
    Harness h;
    PipelineOrchestrator orchestrator(h.resources(), h.tuning);
    ByteBuffer out = h.run(request_for(make_test_mp4(300, 30)), orchestrator);

    CHECK(out.size() == 8 + 300);
    CHECK(orchestrator.state() == PipelineState::Complete);

    const PipelineStats &stats = orchestrator.stats();
    CHECK(stats.gopSize == 30);
    CHECK(stats.framesDecoded == 300);
    CHECK(stats.framesEncoded == 300);
    CHECK(stats.framesDiscarded == 0);
    CHECK(stats.keyframesForced == 10);
    CHECK_FALSE(stats.streaming);
    CHECK_FALSE(stats.repaired);
    CHECK(stats.plan.encoderName == "fake_h264");

    REQUIRE(h.codec->keyRequests.size() == 300);
    for (size_t i = 0; i < 300; ++i)
        CHECK(h.codec->keyRequests[i] == (i % 30 == 0));
    CHECK(h.codec->encodedPts[10] == 333330);
    CHECK(h.codec->decoderClosed);
    CHECK(h.codec->encoderClosed);
    CHECK(h.compositor->width == 320);
    CHECK(h.compositor->height == 240);

    REQUIRE_FALSE(h.progress.empty());
    CHECK(h.progress.back().phase == ProcessingPhase::Complete);
    CHECK(h.progress.back().percent == 100);
    for (size_t i = 1; i < h.progress.size(); ++i)
        CHECK(h.progress[i].percent >= h.progress[i - 1].percent);
    for (size_t i = 0; i + 1 < h.progress.size(); ++i)
        CHECK(h.progress[i].percent <= 99);
}

TEST_CASE("Sample submission waits on the decoder queue", "[orchestrator]")
{
    Harness h;
    h.codec->decoderStride = 3;
    PipelineOrchestrator orchestrator(h.resources(), h.tuning);
    h.run(request_for(make_test_mp4(120, 30)), orchestrator);

    CHECK(h.codec->maxDecoderQueueAtSubmit == 24);
    CHECK(orchestrator.stats().framesEncoded == 120);
}

TEST_CASE("Sample submission waits on the encoder queue", "[orchestrator]")
{
    Harness h;
    h.codec->encoderStride = 4;
    PipelineOrchestrator orchestrator(h.resources(), h.tuning);
    ByteBuffer out = h.run(request_for(make_test_mp4(300, 30)), orchestrator);

    CHECK(h.codec->maxEncoderQueueAtSubmit == 24);
    CHECK(orchestrator.stats().framesEncoded == 300);
    CHECK(out.size() == 8 + 300);
}

TEST_CASE("Frame tasks in flight stay within the bound", "[orchestrator]")
{
    Harness h;
    h.codec->decoderStride = 3;
    h.codec->decoderBurst = 3;
    PipelineOrchestrator orchestrator(h.resources(), h.tuning);
    h.run(request_for(make_test_mp4(120, 30)), orchestrator);

    const PipelineStats &stats = orchestrator.stats();
    CHECK(stats.peakFrameTasksAtSubmit > 0);
    CHECK(stats.peakFrameTasksAtSubmit < h.tuning.maxInflightFrameTasks);
    CHECK(stats.framesEncoded == 120);
    REQUIRE(h.codec->encodeRequestPts.size() == 120);
    CHECK(std::is_sorted(h.codec->encodeRequestPts.begin(), h.codec->encodeRequestPts.end()));
}

TEST_CASE("Abort stops submission and reports cancellation", "[orchestrator]")
{
    Harness h;
    h.codec->afterDecode = [&h](size_t calls)
    {
        if (calls == 50)
            h.abortFlag.store(true);
    };
    PipelineOrchestrator orchestrator(h.resources(), h.tuning);

    CHECK(run_error_kind(h, orchestrator, request_for(make_test_mp4(300, 30))) == ErrorKind::Cancelled);
    CHECK(h.codec->decodeCalls == 50);
    CHECK(orchestrator.state() == PipelineState::Error);
    CHECK(h.codec->decoderClosed);
    CHECK(h.codec->encoderClosed);
    CHECK(h.writer->writersCreated == 0);
}

TEST_CASE("Decoded frames in flight at abort are not encoded", "[orchestrator]")
{
    Harness h;
    h.codec->decoderStride = 3;
    h.codec->decoderBurst = 3;
    h.codec->afterDecode = [&h](size_t calls)
    {
        if (calls == 50)
            h.abortFlag.store(true);
    };
    PipelineOrchestrator orchestrator(h.resources(), h.tuning);

    CHECK(run_error_kind(h, orchestrator, request_for(make_test_mp4(300, 30))) == ErrorKind::Cancelled);

    const PipelineStats &stats = orchestrator.stats();
    CHECK(stats.framesDiscarded > 0);
    CHECK(stats.framesEncoded < stats.framesDecoded);
    CHECK(stats.framesEncoded + stats.framesDiscarded == stats.framesDecoded);
    CHECK(h.codec->encodeRequestPts.size() == stats.framesEncoded);
    REQUIRE_FALSE(h.codec->decodedPts.empty());
    REQUIRE_FALSE(h.codec->encodeRequestPts.empty());
    // The newest decoded frame arrived after the abort and never reached the encoder
    CHECK(h.codec->encodeRequestPts.back() < h.codec->decodedPts.back());
}

TEST_CASE("Samples before the first keyframe are skipped", "[orchestrator]")
{
    Harness h;
    PipelineOrchestrator orchestrator(h.resources(), h.tuning);
    ByteBuffer out = h.run(request_for(make_test_mp4(60, 30, 5)), orchestrator);

    CHECK(orchestrator.stats().leadingSamplesDropped == 5);
    CHECK(orchestrator.stats().framesEncoded == 55);
    CHECK(out.size() == 8 + 55);
    REQUIRE_FALSE(h.codec->decodedPts.empty());
    CHECK(h.codec->decodedPts.front() == 5 * 33333);
}

TEST_CASE("Undecodable codecs are converted once", "[orchestrator]")
{
    Harness h;
    h.transcoder.forcedKeyframeResult = MediaSource::fromBuffer(make_test_mp4(30, 30), "converted.mp4");

    SECTION("decodable after conversion")
    {
        h.probe.decoderSupportedAfter = 1;
        PipelineOrchestrator orchestrator(h.resources(), h.tuning);
        ByteBuffer out = h.run(request_for(make_test_mp4(90, 45)), orchestrator);

        CHECK(orchestrator.stats().repaired);
        CHECK(orchestrator.stats().framesEncoded == 30);
        CHECK(h.transcoder.forcedKeyframeCalls == 1);
        CHECK(h.transcoder.lastOptions.gopSize == 30);
        bool sawEncoding = std::any_of(h.progress.begin(), h.progress.end(),
                                       [](const ProcessingProgress &p) { return p.phase == ProcessingPhase::Encoding; });
        CHECK(sawEncoding);
    }

    SECTION("never decodable")
    {
        h.probe.decoderSupportedAfter = -1;
        PipelineOrchestrator orchestrator(h.resources(), h.tuning);
        CHECK(run_error_kind(h, orchestrator, request_for(make_test_mp4(30, 30))) == ErrorKind::UnsupportedCodec);
        CHECK(h.transcoder.forcedKeyframeCalls == 1);
        CHECK(h.probe.decoderQueries == 2);
    }
}

TEST_CASE("Sources without a keyframe are converted once", "[orchestrator]")
{
    Harness h;
    PipelineRequest request = request_for(make_keyless_mp4(40));

    SECTION("conversion adds keyframes")
    {
        h.transcoder.forcedKeyframeResult = MediaSource::fromBuffer(make_test_mp4(40, 30), "converted.mp4");
        PipelineOrchestrator orchestrator(h.resources(), h.tuning);
        ByteBuffer out = h.run(request, orchestrator);

        CHECK(h.transcoder.forcedKeyframeCalls == 1);
        CHECK(orchestrator.stats().repaired);
        CHECK(orchestrator.stats().leadingSamplesDropped == 0);
        CHECK(orchestrator.stats().framesEncoded == 40);
        CHECK(out.size() == 8 + 40);
        CHECK(orchestrator.state() == PipelineState::Complete);
        bool sawEncoding = std::any_of(h.progress.begin(), h.progress.end(),
                                       [](const ProcessingProgress &p) { return p.phase == ProcessingPhase::Encoding; });
        CHECK(sawEncoding);
    }

    SECTION("converted file is still keyless")
    {
        h.transcoder.forcedKeyframeResult = MediaSource::fromBuffer(make_keyless_mp4(40), "converted.mp4");
        PipelineOrchestrator orchestrator(h.resources(), h.tuning);
        CHECK(run_error_kind(h, orchestrator, request) == ErrorKind::NoKeyframe);
        CHECK(h.transcoder.forcedKeyframeCalls == 1);
        CHECK(h.codec->decodeCalls == 0);
    }
}

TEST_CASE("Large sources are muxed while encoding", "[orchestrator]")
{
    Harness h;
    h.tuning.streamingThresholdBytes = 0;
    PipelineOrchestrator orchestrator(h.resources(), h.tuning);
    ByteBuffer out = h.run(request_for(make_test_mp4(90, 30)), orchestrator);

    CHECK(orchestrator.stats().streaming);
    CHECK(out.size() == 8 + 90);
    CHECK(h.writer->videoTimestamps.size() == 90);
    CHECK(h.writer->events.back() == "finalize");
}

TEST_CASE("Codec failures are reported as codec errors", "[orchestrator]")
{
    Harness h;
    std::string message;

    SECTION("decode error")
    {
        h.codec->failDecodeAt = 10;
        PipelineOrchestrator orchestrator(h.resources(), h.tuning);
        CHECK(run_error_kind(h, orchestrator, request_for(make_test_mp4(60, 30)), &message) == ErrorKind::CodecFailure);
        CHECK(message.find("Video decoding failed") != std::string::npos);
        CHECK(h.writer->writersCreated == 0);
    }

    SECTION("encoder cannot be opened")
    {
        h.codec->failEncoderConfigure = true;
        PipelineOrchestrator orchestrator(h.resources(), h.tuning);
        CHECK(run_error_kind(h, orchestrator, request_for(make_test_mp4(60, 30)), &message) == ErrorKind::CodecFailure);
        CHECK(message == "Could not open the video encoder");
        CHECK(h.codec->decodeCalls == 0);
    }
}

TEST_CASE("Telemetry reaches the compositor", "[orchestrator]")
{
    Harness h;
    PipelineRequest request = request_for(make_test_mp4(60, 30));

    SECTION("with samples")
    {
        TelemetryFrame a;
        a.timeOffsetSeconds = 0;
        a.hr = 120;
        a.elapsedTime = "0:00";
        TelemetryFrame b = a;
        b.timeOffsetSeconds = 10;
        b.hr = 140;
        b.elapsedTime = "0:10";
        request.telemetry = {a, b};

        PipelineOrchestrator orchestrator(h.resources(), h.tuning);
        h.run(request, orchestrator);
        REQUIRE(h.compositor->heartRates.size() == 60);
        for (const auto &hr : h.compositor->heartRates)
            CHECK(hr.has_value());
    }

    SECTION("without samples")
    {
        PipelineOrchestrator orchestrator(h.resources(), h.tuning);
        h.run(request, orchestrator);
        REQUIRE(h.compositor->heartRates.size() == 60);
        for (const auto &hr : h.compositor->heartRates)
            CHECK_FALSE(hr.has_value());
    }
}

TEST_CASE("Final remux replaces the output only when it works", "[orchestrator]")
{
    Harness h;
    PipelineRequest request = request_for(make_test_mp4(30, 30));
    request.finalRemux = true;

    SECTION("remux fails")
    {
        PipelineOrchestrator orchestrator(h.resources(), h.tuning);
        ByteBuffer out = h.run(request, orchestrator);
        CHECK(out.size() == 8 + 30);
        CHECK(h.transcoder.repackCalls == 1);
        CHECK(orchestrator.state() == PipelineState::Complete);
    }

    SECTION("remux succeeds")
    {
        h.transcoder.repackResult = MediaSource::fromBuffer(ByteBuffer{1, 2, 3});
        PipelineOrchestrator orchestrator(h.resources(), h.tuning);
        CHECK(h.run(request, orchestrator) == ByteBuffer{1, 2, 3});
    }
}

TEST_CASE("Orchestrator requires every resource", "[orchestrator]")
{
    Harness h;
    PipelineResources res = h.resources();
    res.probe = nullptr;
    CHECK_THROWS_AS(PipelineOrchestrator(res), std::invalid_argument);

    PipelineResources noWriter = h.resources();
    noWriter.writerFactory = nullptr;
    CHECK_THROWS_AS(PipelineOrchestrator(noWriter), std::invalid_argument);
}
