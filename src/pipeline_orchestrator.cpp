#include "pipeline_orchestrator.h"
#include "bitstream_inspector.h"
#include "demuxer.h"
#include "logger.h"
#include "muxer.h"
#include "pipeline_error.h"
#include "telemetry.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <deque>
#include <optional>
#include <stdexcept>

const char *pipeline_state_name(PipelineState state)
{
    switch (state)
    {
    case PipelineState::Idle:
        return "idle";
    case PipelineState::Demuxing:
        return "demuxing";
    case PipelineState::Encoding:
        return "encoding";
    case PipelineState::Processing:
        return "processing";
    case PipelineState::Muxing:
        return "muxing";
    case PipelineState::Complete:
        return "complete";
    case PipelineState::Error:
    default:
        return "error";
    }
}

// Last libav* lines from the log tail, attached to codec failures
static std::string recent_ffmpeg_log()
{
    std::vector<std::string> lines = Logger::instance().recentLines();
    std::vector<std::string> ffmpegLines;
    for (const auto &line : lines)
    {
        if (line.find("[ffmpeg]") != std::string::npos)
            ffmpegLines.push_back(line);
    }
    size_t start = ffmpegLines.size() > 10 ? ffmpegLines.size() - 10 : 0;
    std::string detail;
    for (size_t i = start; i < ffmpegLines.size(); ++i)
    {
        if (!detail.empty())
            detail += '\n';
        detail += ffmpegLines[i];
    }
    return detail;
}

static void check_cancelled(const std::atomic<bool> &abortFlag)
{
    if (abortFlag.load())
        throw PipelineError(ErrorKind::Cancelled, "Processing was cancelled");
}

// Closes decoder and encoder on every exit path of the frame loop
struct CodecCloser
{
    IVideoDecoder *decoder = nullptr;
    IVideoEncoder *encoder = nullptr;

    ~CodecCloser()
    {
        if (decoder)
            decoder->close();
        if (encoder)
            encoder->close();
    }
};

// Decode -> composite -> encode loop of one run. Frames are handed from the
// decoder to an ordered FIFO of frame tasks; at most maxInflightFrameTasks are
// pending before sample submission waits for the chain to drain.
class FrameLoop
{
public:
    FrameLoop(const PipelineResources &res, const PipelineTuning &tuning, const EncoderPlan &plan, int gopSize,
              const PipelineRequest &request, const std::atomic<bool> &abortFlag, PipelineStats &stats,
              EncodedChunkCallback sink, ThrottledProgressReporter &reporter)
        : m_res(res), m_tuning(tuning), m_plan(plan), m_gop(std::max(1, gopSize)), m_request(request),
          m_abortFlag(abortFlag), m_stats(stats), m_sink(std::move(sink)), m_reporter(reporter)
    {
        double fps = plan.frameRate > 0.0 ? plan.frameRate : 30.0;
        m_nominalDurationUs = std::max<int64_t>(1, std::llround(1e6 / fps));
    }

    void run(const TrackDescriptor &track, const std::vector<EncodedSample> &samples, size_t first)
    {
        m_decoder = m_res.decoderFactory(
            [this](FramePtr frame) { onFrame(std::move(frame)); },
            [this](const std::string &message) { latch(ErrorKind::CodecFailure, "Video decoding failed: " + message, recent_ffmpeg_log()); });
        m_encoder = m_res.encoderFactory(
            [this](EncodedChunk chunk, const VideoDecoderConfig *config) { onChunk(std::move(chunk), config); },
            [this](const std::string &message) { latch(ErrorKind::CodecFailure, "Video encoding failed: " + message, recent_ffmpeg_log()); });
        if (!m_decoder || !m_encoder)
            throw std::logic_error("codec factory returned nothing");

        CodecCloser closer;
        closer.decoder = m_decoder.get();
        closer.encoder = m_encoder.get();

        try
        {
            m_decoder->configure(track);
        }
        catch (const std::exception &e)
        {
            throw PipelineError(ErrorKind::CodecFailure, "Could not open the video decoder", e.what());
        }
        try
        {
            m_encoder->configure(m_plan);
        }
        catch (const std::exception &e)
        {
            throw PipelineError(ErrorKind::CodecFailure, "Could not open the video encoder", e.what());
        }
        m_compositor = m_res.compositorFactory(m_plan.targetWidth, m_plan.targetHeight, m_encoder->pixelFormat());

        m_reporter.report(0);
        for (size_t i = first; i < samples.size(); ++i)
        {
            if (aborted())
                break;
            waitForCapacity();
            if (aborted())
                break;

            m_stats.peakFrameTasksAtSubmit = std::max(m_stats.peakFrameTasksAtSubmit, m_chain.size());
            m_decoder->decode(samples[i]);
            ++m_stats.samplesSubmitted;
            yieldOnce();
        }

        if (!aborted())
        {
            m_decoder->flush();
            drainChain();
            if (!aborted())
                m_encoder->flush();
        }

        // Frames still queued after an abort are released unencoded
        m_stats.framesDiscarded += m_chain.size();
        m_chain.clear();

        if (m_error)
            throw PipelineError(*m_error);
        check_cancelled(m_abortFlag);
        m_reporter.report(static_cast<int64_t>(m_stats.framesEncoded), true);
    }

private:
    bool aborted() const { return m_error.has_value() || m_abortFlag.load(); }

    void latch(ErrorKind kind, const std::string &message, const std::string &detail = {})
    {
        if (m_error)
        {
            LOG_DEBUG("Ignoring error after the first: %s", message.c_str());
            return;
        }
        LOG_DEBUG("Latched error: %s", message.c_str());
        m_error.emplace(kind, message, detail);
    }

    void onFrame(FramePtr frame)
    {
        ++m_stats.framesDecoded;
        if (aborted())
        {
            ++m_stats.framesDiscarded;
            return;
        }
        m_chain.push_back(std::move(frame));
    }

    void onChunk(EncodedChunk chunk, const VideoDecoderConfig *config)
    {
        ++m_stats.chunksProduced;
        if (m_error)
            return;
        try
        {
            m_sink(std::move(chunk), config);
        }
        catch (const PipelineError &e)
        {
            latch(e.kind(), e.what(), e.detail());
        }
        catch (const std::exception &e)
        {
            latch(ErrorKind::MuxFailure, "Could not store an encoded video chunk", e.what());
        }
    }

    // One unit of cooperative progress: decoder, frame chain, encoder
    bool yieldOnce()
    {
        bool progressed = m_decoder->pump();
        progressed = runNextFrameTask() || progressed;
        progressed = m_encoder->pump() || progressed;
        return progressed;
    }

    // Submission waits until the frame chain is below its bound and both codec
    // queues are at or below the watermark
    void waitForCapacity()
    {
        size_t watermark = m_tuning.queueWatermark;
        while (!aborted())
        {
            if (m_chain.size() >= m_tuning.maxInflightFrameTasks)
            {
                drainChain();
                continue;
            }
            if (m_decoder->queueSize() <= watermark && m_encoder->queueSize() <= watermark)
                return;
            if (!yieldOnce())
                throw PipelineError(ErrorKind::CodecFailure, "Video codec queues stopped draining");
        }
    }

    void drainChain()
    {
        while (!m_chain.empty())
        {
            runNextFrameTask();
            m_encoder->pump();
        }
    }

    bool runNextFrameTask()
    {
        if (m_chain.empty())
            return false;

        FramePtr decoded = std::move(m_chain.front());
        m_chain.pop_front();
        if (aborted())
        {
            ++m_stats.framesDiscarded;
            return true;
        }

        int64_t pts = decoded->pts != AV_NOPTS_VALUE ? decoded->pts : m_nextPts;
        int64_t duration = decoded->duration > 0 ? decoded->duration : m_nominalDurationUs;
        m_nextPts = pts + duration;

        std::optional<TelemetryFrame> telemetry =
            telemetry_at_time(m_request.telemetry, pts / 1e6, m_request.syncOffsetSeconds);

        FramePtr out(nullptr, &av_frame_free_single);
        try
        {
            out = m_compositor->composite(decoded.get(), telemetry ? &*telemetry : nullptr);
        }
        catch (const std::exception &e)
        {
            latch(ErrorKind::CodecFailure, "Could not draw the overlay on a video frame", e.what());
            return true;
        }
        decoded.reset();
        if (!out)
        {
            latch(ErrorKind::CodecFailure, "Could not draw the overlay on a video frame");
            return true;
        }

        out->pts = pts;
        out->duration = duration;
        bool key = m_stats.framesEncoded == 0 || m_stats.framesEncoded % static_cast<size_t>(m_gop) == 0;
        if (key)
            ++m_stats.keyframesForced;
        m_encoder->encode(std::move(out), key);
        ++m_stats.framesEncoded;
        m_reporter.report(static_cast<int64_t>(m_stats.framesEncoded));
        return true;
    }

    const PipelineResources &m_res;
    const PipelineTuning &m_tuning;
    const EncoderPlan &m_plan;
    int m_gop;
    const PipelineRequest &m_request;
    const std::atomic<bool> &m_abortFlag;
    PipelineStats &m_stats;
    EncodedChunkCallback m_sink;
    ThrottledProgressReporter &m_reporter;

    std::unique_ptr<IVideoDecoder> m_decoder;
    std::unique_ptr<IVideoEncoder> m_encoder;
    std::unique_ptr<IFrameCompositor> m_compositor;
    std::deque<FramePtr> m_chain;
    std::optional<PipelineError> m_error;
    int64_t m_nominalDurationUs = 1;
    int64_t m_nextPts = 0;
};

PipelineOrchestrator::PipelineOrchestrator(PipelineResources resources, PipelineTuning tuning)
    : m_res(std::move(resources)), m_tuning(tuning), m_mapper(m_res.clock)
{
    if (!m_res.decoderFactory || !m_res.encoderFactory || !m_res.compositorFactory || !m_res.writerFactory)
        throw std::invalid_argument("PipelineOrchestrator: missing codec, compositor or writer factory");
    if (!m_res.probe || !m_res.transcoder)
        throw std::invalid_argument("PipelineOrchestrator: missing capability probe or transcoder");
    m_tuning.maxInflightFrameTasks = std::max<size_t>(1, m_tuning.maxInflightFrameTasks);
}

void PipelineOrchestrator::forward(const ProcessingProgress &phaseProgress)
{
    ProcessingProgress shown = m_mapper.update(phaseProgress);
    if (m_onProgress)
        m_onProgress(shown);
}

void PipelineOrchestrator::emitPhase(ProcessingPhase phase, double percent)
{
    ProcessingProgress p;
    p.phase = phase;
    p.percent = static_cast<int>(std::lround(std::clamp(percent, 0.0, 100.0)));
    forward(p);
}

ByteBuffer PipelineOrchestrator::run(const PipelineRequest &request,
                                     const ProgressCallback &onProgress,
                                     const std::atomic<bool> &abortFlag)
{
    m_onProgress = onProgress;
    m_mapper.reset();
    m_stats = PipelineStats();

    try
    {
        ByteBuffer output = runStages(request, abortFlag);
        m_state = PipelineState::Complete;
        emitPhase(ProcessingPhase::Complete, 100);
        return output;
    }
    catch (const std::exception &e)
    {
        LOG_DEBUG("Run failed in state %s: %s", pipeline_state_name(m_state), e.what());
        m_state = PipelineState::Error;
        throw;
    }
}

DemuxResult PipelineOrchestrator::repairWithForcedKeyframes(MediaSource &current, const DemuxResult &parsed,
                                                            const std::atomic<bool> &abortFlag)
{
    m_state = PipelineState::Encoding;
    emitPhase(ProcessingPhase::Encoding, 0);

    ForcedKeyframeOptions options;
    options.fps = parsed.videoTrack.frameRate > 0.0 ? parsed.videoTrack.frameRate : 30.0;
    options.gopSize = std::max(1, static_cast<int>(std::lround(options.fps)));
    options.durationSeconds = parsed.durationSeconds;

    MediaSource converted = m_res.transcoder->transcodeWithForcedKeyframes(
        current, options, [this](int percent) { emitPhase(ProcessingPhase::Encoding, percent); });
    check_cancelled(abortFlag);

    DemuxResult result = demux(converted);
    if (result.videoSamples.empty())
        throw PipelineError(ErrorKind::ParseFailure, "The converted video contains no video frames");

    current = converted;
    m_stats.repaired = true;
    emitPhase(ProcessingPhase::Encoding, 100);
    return result;
}

ByteBuffer PipelineOrchestrator::finalRemux(ByteBuffer bytes)
{
    try
    {
        MediaSource remuxed = m_res.transcoder->repackContainer(MediaSource::fromBuffer(bytes, "output.mp4"));
        ByteBuffer repacked = remuxed.readAll();
        if (repacked.empty())
        {
            LOG_WARN("Final remux produced an empty file, keeping the muxed output");
            return bytes;
        }
        LOG_VERBOSE("Final remux: %s -> %s", format_bytes(bytes.size()).c_str(), format_bytes(repacked.size()).c_str());
        return repacked;
    }
    catch (const std::exception &e)
    {
        LOG_WARN("Final remux failed, keeping the muxed output: %s", e.what());
        return bytes;
    }
}

ByteBuffer PipelineOrchestrator::runStages(const PipelineRequest &request, const std::atomic<bool> &abortFlag)
{
    m_state = PipelineState::Demuxing;
    emitPhase(ProcessingPhase::Demuxing, 0);

    MediaSource current = request.source;
    DemuxResult parsed = demux_with_fallback(
        request.source, *m_res.transcoder,
        [this](const ProcessingProgress &p) { forward(p); },
        m_tuning.repackMaxBytes, &current);
    check_cancelled(abortFlag);
    emitPhase(ProcessingPhase::Demuxing, 100);

    // Pre-pass: the track must be decodable here
    bool codecRepairTried = false;
    if (!m_res.probe->isDecoderSupported(parsed.videoTrack))
    {
        LOG_WARN("Video codec %s cannot be decoded, converting the source", parsed.videoTrack.codecString.c_str());
        parsed = repairWithForcedKeyframes(current, parsed, abortFlag);
        codecRepairTried = true;
        if (!m_res.probe->isDecoderSupported(parsed.videoTrack))
        {
            throw PipelineError(ErrorKind::UnsupportedCodec,
                                "The video codec (" + parsed.videoTrack.codecString + ") is not supported, even after conversion");
        }
    }

    // Pre-pass: there must be a random access point to start from
    KeyframeDetector detector(parsed.videoTrack.codecFamily, parsed.videoTrack.decoderDescription);
    std::optional<size_t> first = find_first_keyframe(parsed.videoSamples, detector, m_tuning.keyframeSearchLimit);
    if (!first)
    {
        LOG_WARN("No keyframe found in the video%s, converting the source with forced keyframes",
                 codecRepairTried ? " after conversion" : "");
        parsed = repairWithForcedKeyframes(current, parsed, abortFlag);
        KeyframeDetector repairedDetector(parsed.videoTrack.codecFamily, parsed.videoTrack.decoderDescription);
        first = find_first_keyframe(parsed.videoSamples, repairedDetector, m_tuning.keyframeSearchLimit);
        if (!first)
            throw PipelineError(ErrorKind::NoKeyframe, "The video has no keyframe to start from, even after conversion");
    }
    check_cancelled(abortFlag);

    m_stats.leadingSamplesDropped = *first;
    if (*first > 0)
        LOG_VERBOSE("Skipping %zu samples before the first keyframe", *first);

    VideoMeta meta = describe_video(parsed, current.size());
    int gop = detect_gop_size(parsed.videoSamples, meta.fps, m_tuning.gopSampleLimit);
    CodecNegotiator negotiator(*m_res.probe, m_tuning.downscaleMaxPixels);
    EncoderPlan plan = negotiator.negotiate(meta);
    m_stats.gopSize = gop;
    m_stats.plan = plan;

    LOG_INFO("Source: %s %dx%d @ %.3f fps, %.1fs, %s", meta.codecString.c_str(), meta.width, meta.height,
             meta.fps, meta.durationSeconds, format_bytes(meta.fileSizeBytes).c_str());
    LOG_INFO("Output: %s via %s (%s), %dx%d, %.1f Mbps, keyframe every %d frames", plan.chosenCodec.c_str(),
             plan.encoderName.c_str(), hardware_tier_name(plan.hardwareTier), plan.targetWidth, plan.targetHeight,
             plan.targetBitrate / 1e6, gop);

    // Large sources are muxed while encoding instead of holding every chunk
    Mp4Muxer muxer(m_res.writerFactory);
    bool streaming = request.source.size() >= m_tuning.streamingThresholdBytes;
    m_stats.streaming = streaming;
    std::unique_ptr<StreamingMuxSession> session;
    std::vector<EncodedChunk> chunks;
    std::optional<VideoDecoderConfig> decoderConfig;
    EncodedChunkCallback sink;
    if (streaming)
    {
        LOG_VERBOSE("Source is %s, muxing while encoding", format_bytes(request.source.size()).c_str());
        session = muxer.startStreamingSession(parsed, meta, abortFlag);
        sink = [&session](EncodedChunk chunk, const VideoDecoderConfig *config)
        {
            session->enqueueVideoChunk(std::move(chunk), config);
            if (session->error())
                throw PipelineError(ErrorKind::MuxFailure, "Streaming mux failed while writing video packets: " + *session->error());
        };
    }
    else
    {
        sink = [&chunks, &decoderConfig](EncodedChunk chunk, const VideoDecoderConfig *config)
        {
            if (config && !decoderConfig)
                decoderConfig = *config;
            chunks.push_back(std::move(chunk));
        };
    }

    m_state = PipelineState::Processing;
    int64_t totalFrames = static_cast<int64_t>(parsed.videoSamples.size() - *first);
    ThrottledProgressReporter reporter([this](const ProcessingProgress &p) { forward(p); },
                                       totalFrames, m_tuning.progressInterval, m_res.clock);
    {
        FrameLoop loop(m_res, m_tuning, plan, gop, request, abortFlag, m_stats, sink, reporter);
        loop.run(parsed.videoTrack, parsed.videoSamples, *first);
    }
    LOG_VERBOSE("Encoded %zu frames (%zu forced keyframes), %zu chunks", m_stats.framesEncoded,
                m_stats.keyframesForced, m_stats.chunksProduced);
    check_cancelled(abortFlag);

    m_state = PipelineState::Muxing;
    emitPhase(ProcessingPhase::Muxing, 0);
    PercentCallback onMuxProgress = [this](int percent) { emitPhase(ProcessingPhase::Muxing, percent); };

    ByteBuffer output;
    if (streaming)
    {
        output = session->finalize(parsed.audioSamples, onMuxProgress);
    }
    else
    {
        if (chunks.empty())
            throw PipelineError(ErrorKind::EmptyOutput, "No video frames were encoded");
        if (!decoderConfig)
            throw PipelineError(ErrorKind::MuxFailure, "The encoder did not report its stream configuration");
        output = muxer.muxMp4(parsed, chunks, *decoderConfig, meta, onMuxProgress);
    }
    check_cancelled(abortFlag);

    if (request.finalRemux)
        output = finalRemux(std::move(output));

    LOG_INFO("Output ready: %s", format_bytes(output.size()).c_str());
    return output;
}
