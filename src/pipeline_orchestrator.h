#pragma once

#include <atomic>
#include <vector>

#include "codec_negotiator.h"
#include "container_writer.h"
#include "external_transcoder.h"
#include "frame_compositor.h"
#include "media_source.h"
#include "progress_mapper.h"
#include "video_codecs.h"

enum class PipelineState
{
    Idle,
    Demuxing,
    Encoding,
    Processing,
    Muxing,
    Complete,
    Error
};

const char *pipeline_state_name(PipelineState state);

// Everything a run needs from the platform. Owned by the caller and
// passed in explicitly so tests can substitute fakes.
struct PipelineResources
{
    VideoDecoderFactory decoderFactory;
    VideoEncoderFactory encoderFactory;
    FrameCompositorFactory compositorFactory;
    ContainerWriterFactory writerFactory;
    ICodecCapabilityProbe *probe = nullptr;
    IExternalTranscoder *transcoder = nullptr;
    SteadyClock clock;
};

struct PipelineRequest
{
    MediaSource source;
    std::vector<TelemetryFrame> telemetry; // ascending timeOffsetSeconds
    double syncOffsetSeconds = 0.0;
    bool finalRemux = false;
};

// Counters of the last run
struct PipelineStats
{
    size_t samplesSubmitted = 0;
    size_t framesDecoded = 0;
    size_t framesEncoded = 0;
    size_t framesDiscarded = 0;
    size_t chunksProduced = 0;
    size_t keyframesForced = 0;
    size_t leadingSamplesDropped = 0;
    size_t peakFrameTasksAtSubmit = 0; // deepest frame chain seen when a sample was submitted
    int gopSize = 0;
    bool repaired = false;
    bool streaming = false;
    EncoderPlan plan;
};

// Runs one overlay job: demux (with repair), decode, composite, encode, mux.
// States: demuxing -> (encoding) -> processing -> muxing -> complete, or error.
// Failures are thrown as PipelineError; partial output is never returned.
class PipelineOrchestrator
{
public:
    explicit PipelineOrchestrator(PipelineResources resources, PipelineTuning tuning = {});

    ByteBuffer run(const PipelineRequest &request,
                   const ProgressCallback &onProgress,
                   const std::atomic<bool> &abortFlag);

    PipelineState state() const { return m_state; }
    const PipelineStats &stats() const { return m_stats; }

private:
    ByteBuffer runStages(const PipelineRequest &request, const std::atomic<bool> &abortFlag);
    DemuxResult repairWithForcedKeyframes(MediaSource &current, const DemuxResult &parsed,
                                          const std::atomic<bool> &abortFlag);
    ByteBuffer finalRemux(ByteBuffer bytes);

    void forward(const ProcessingProgress &phaseProgress);
    void emitPhase(ProcessingPhase phase, double percent);

    PipelineResources m_res;
    PipelineTuning m_tuning;
    ProgressMapper m_mapper;
    ProgressCallback m_onProgress;
    PipelineState m_state = PipelineState::Idle;
    PipelineStats m_stats;
};
