#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "codec_negotiator.h"
#include "container_writer.h"
#include "external_transcoder.h"
#include "ffmpeg_utils.h"
#include "frame_compositor.h"
#include "pipeline_error.h"
#include "video_codecs.h"

// Test doubles shared by the muxer and orchestrator tests

// avcC: version 1, High profile level 3.1, 4 byte lengths, one SPS, one PPS
inline ByteBuffer fake_avcc()
{
    return {1, 0x64, 0x00, 0x1f, 0xff, 0xe1, 0x00, 0x04, 0x67, 0x64, 0x00, 0x1f, 0x01, 0x00, 0x02, 0x68, 0xee};
}

// Length-prefixed access unit holding one IDR or non-IDR slice NAL
inline ByteBuffer fake_h264_access_unit(bool idr)
{
    if (idr)
        return {0, 0, 0, 4, 0x65, 0x88, 0x84, 0x21};
    return {0, 0, 0, 4, 0x41, 0x9a, 0x02, 0x11};
}

inline VideoDecoderConfig fake_decoder_config(int width = 320, int height = 240)
{
    VideoDecoderConfig config;
    config.codecString = "avc1.64001F";
    config.codecId = AV_CODEC_ID_H264;
    config.description = fake_avcc();
    config.width = width;
    config.height = height;
    return config;
}

inline EncodedChunk fake_chunk(int64_t index, bool key, int64_t frameUs = 33333)
{
    EncodedChunk chunk;
    chunk.data = fake_h264_access_unit(key);
    chunk.timestampUs = index * frameUs;
    chunk.decodeTimestampUs = index * frameUs;
    chunk.durationUs = frameUs;
    chunk.isKey = key;
    return chunk;
}

// Small H.264-in-MP4 file written with the real muxer. Frames before firstKey are
// non-IDR, from firstKey on every keyEvery-th frame is an IDR.
inline ByteBuffer make_test_mp4(int frames, int keyEvery = 30, int firstKey = 0, int width = 320, int height = 240)
{
    FfmpegMp4Writer writer;
    writer.addVideoTrack(fake_decoder_config(width, height), 30.0);
    writer.start();
    for (int i = 0; i < frames; ++i)
    {
        bool key = i >= firstKey && (i - firstKey) % keyEvery == 0;
        writer.writeVideo(fake_chunk(i, key));
    }
    return writer.finalize();
}

// H.264 MP4 in which no sample is a random access point: the sync sample table
// is emptied and the one IDR slice is rewritten as a non-IDR slice
inline ByteBuffer make_keyless_mp4(int frames)
{
    ByteBuffer bytes = make_test_mp4(frames, frames, frames - 1);
    const ByteBuffer idr = fake_h264_access_unit(true);
    auto slice = std::search(bytes.begin(), bytes.end(), idr.begin(), idr.end());
    if (slice == bytes.end())
        throw std::runtime_error("IDR access unit not found in test file");
    slice[4] = 0x41;

    const uint8_t stss[] = {'s', 't', 's', 's'};
    auto box = std::search(bytes.begin(), bytes.end(), std::begin(stss), std::end(stss));
    if (box == bytes.end() || bytes.end() - box < 12)
        throw std::runtime_error("stss box not found in test file");
    // entry_count follows the version and flags
    std::fill(box + 8, box + 12, 0);
    return bytes;
}

struct WriterLog
{
    std::vector<std::string> events;
    std::vector<int64_t> videoTimestamps;
    std::vector<int64_t> videoDecodeTimestamps;
    size_t writersCreated = 0;
    size_t audioWritten = 0;

    bool rejectAudioTrack = false;
    bool failAudioWrite = false;
    std::optional<size_t> failVideoAt;
    bool emptyFinalize = false;
};

class FakeContainerWriter : public IContainerWriter
{
public:
    explicit FakeContainerWriter(std::shared_ptr<WriterLog> log) : m_log(std::move(log)) {}

    void addVideoTrack(const VideoDecoderConfig &config, double) override
    {
        m_log->events.push_back("video-track:" + config.codecString);
    }

    void addAudioTrack(const TrackDescriptor &track) override
    {
        if (m_log->rejectAudioTrack)
            throw ContainerMuxError("audio codec " + track.codecString + " is not supported in MP4");
        m_hasAudio = true;
        m_log->events.push_back("audio-track:" + track.codecString);
    }

    void start() override { m_log->events.push_back("start"); }

    void writeVideo(const EncodedChunk &chunk) override
    {
        if (m_log->failVideoAt && *m_log->failVideoAt == m_videoCount)
            throw ContainerMuxError("write video packet: Invalid argument");
        ++m_videoCount;
        m_log->videoTimestamps.push_back(chunk.timestampUs);
        m_log->videoDecodeTimestamps.push_back(chunk.decodeTimestampUs);
        m_log->events.push_back("v");
    }

    void writeAudio(const EncodedSample &) override
    {
        if (!m_hasAudio || m_log->failAudioWrite)
            throw ContainerMuxError("write audio packet: Invalid data found when processing input");
        ++m_log->audioWritten;
        m_log->events.push_back("a");
    }

    ByteBuffer finalize() override
    {
        m_log->events.push_back("finalize");
        if (m_log->emptyFinalize)
            return {};
        return ByteBuffer(8 + m_videoCount, 0x42);
    }

private:
    std::shared_ptr<WriterLog> m_log;
    size_t m_videoCount = 0;
    bool m_hasAudio = false;
};

inline ContainerWriterFactory fake_writer_factory(std::shared_ptr<WriterLog> log)
{
    return [log]() -> std::unique_ptr<IContainerWriter>
    {
        ++log->writersCreated;
        return std::make_unique<FakeContainerWriter>(log);
    };
}

struct CodecLog
{
    std::vector<int64_t> decodedPts;
    std::vector<bool> keyRequests;
    std::vector<int64_t> encodeRequestPts;
    std::vector<int64_t> encodedPts;
    size_t decodeCalls = 0;
    // Queue depths seen each time a sample is submitted to the decoder
    size_t maxDecoderQueueAtSubmit = 0;
    size_t maxEncoderQueueAtSubmit = 0;
    size_t encoderQueued = 0;
    bool decoderClosed = false;
    bool encoderClosed = false;
    std::optional<TrackDescriptor> decoderTrack;
    std::optional<EncoderPlan> encoderPlan;

    // Decoder delivers decoderBurst frames on every decoderStride-th pump
    int decoderStride = 1;
    int decoderBurst = 1;
    // Encoder emits a chunk only on every encoderStride-th pump
    int encoderStride = 1;
    std::optional<size_t> failDecodeAt;
    bool failEncoderConfigure = false;
    // Called after every decode() submission, e.g. to raise the abort flag
    std::function<void(size_t)> afterDecode;
};

class FakeDecoder : public IVideoDecoder
{
public:
    FakeDecoder(std::shared_ptr<CodecLog> log, DecodedFrameCallback onFrame, CodecErrorCallback onError)
        : m_log(std::move(log)), m_onFrame(std::move(onFrame)), m_onError(std::move(onError))
    {
    }

    void configure(const TrackDescriptor &track) override { m_log->decoderTrack = track; }

    void decode(const EncodedSample &sample) override
    {
        m_log->maxDecoderQueueAtSubmit = std::max(m_log->maxDecoderQueueAtSubmit, m_pending.size());
        m_log->maxEncoderQueueAtSubmit = std::max(m_log->maxEncoderQueueAtSubmit, m_log->encoderQueued);
        m_pending.push_back(sample);
        ++m_log->decodeCalls;
        if (m_log->afterDecode)
            m_log->afterDecode(m_log->decodeCalls);
    }

    size_t queueSize() const override { return m_pending.size(); }

    bool pump() override
    {
        if (m_pending.empty())
            return false;
        if (++m_tick % m_log->decoderStride != 0)
            return true;
        for (int i = 0; i < m_log->decoderBurst && !m_pending.empty(); ++i)
            deliverOne();
        return true;
    }

    void flush() override
    {
        while (!m_pending.empty())
            deliverOne();
    }

    void close() override { m_log->decoderClosed = true; }

private:
    void deliverOne()
    {
        EncodedSample sample = std::move(m_pending.front());
        m_pending.erase(m_pending.begin());
        if (m_log->failDecodeAt && *m_log->failDecodeAt == m_delivered)
        {
            m_onError("Invalid data found when processing input");
            return;
        }
        ++m_delivered;

        FramePtr frame = make_frame();
        frame->pts = sample.timestampUs;
        frame->duration = sample.durationUs;
        m_log->decodedPts.push_back(sample.timestampUs);
        m_onFrame(std::move(frame));
    }

    std::shared_ptr<CodecLog> m_log;
    DecodedFrameCallback m_onFrame;
    CodecErrorCallback m_onError;
    std::vector<EncodedSample> m_pending;
    size_t m_tick = 0;
    size_t m_delivered = 0;
};

class FakeEncoder : public IVideoEncoder
{
public:
    FakeEncoder(std::shared_ptr<CodecLog> log, EncodedChunkCallback onChunk, CodecErrorCallback onError)
        : m_log(std::move(log)), m_onChunk(std::move(onChunk)), m_onError(std::move(onError))
    {
    }

    void configure(const EncoderPlan &plan) override
    {
        if (m_log->failEncoderConfigure)
            throw std::runtime_error("open encoder: Function not implemented");
        m_log->encoderPlan = plan;
        m_plan = plan;
    }

    AVPixelFormat pixelFormat() const override { return AV_PIX_FMT_YUV420P; }

    void encode(FramePtr frame, bool keyFrame) override
    {
        m_log->keyRequests.push_back(keyFrame);
        m_log->encodeRequestPts.push_back(frame->pts);
        m_pending.push_back({frame->pts, frame->duration, keyFrame});
        m_log->encoderQueued = m_pending.size();
    }

    size_t queueSize() const override { return m_pending.size(); }

    bool pump() override
    {
        if (m_pending.empty())
            return false;
        if (++m_tick % m_log->encoderStride != 0)
            return true;
        emitOne();
        return true;
    }

    void flush() override
    {
        while (!m_pending.empty())
            emitOne();
    }

    void close() override { m_log->encoderClosed = true; }

private:
    struct Pending
    {
        int64_t pts;
        int64_t duration;
        bool key;
    };

    void emitOne()
    {
        Pending p = m_pending.front();
        m_pending.erase(m_pending.begin());
        m_log->encoderQueued = m_pending.size();

        EncodedChunk chunk;
        chunk.data = fake_h264_access_unit(p.key);
        chunk.timestampUs = p.pts;
        chunk.decodeTimestampUs = p.pts;
        chunk.durationUs = p.duration;
        chunk.isKey = p.key;
        m_log->encodedPts.push_back(p.pts);

        if (!m_configSent)
        {
            m_configSent = true;
            VideoDecoderConfig config = fake_decoder_config(m_plan.targetWidth, m_plan.targetHeight);
            m_onChunk(std::move(chunk), &config);
        }
        else
        {
            m_onChunk(std::move(chunk), nullptr);
        }
    }

    std::shared_ptr<CodecLog> m_log;
    EncodedChunkCallback m_onChunk;
    CodecErrorCallback m_onError;
    EncoderPlan m_plan;
    std::vector<Pending> m_pending;
    size_t m_tick = 0;
    bool m_configSent = false;
};

// Returns a fresh frame per call and records which frames had telemetry
struct CompositorLog
{
    std::vector<std::optional<int>> heartRates;
    int width = 0;
    int height = 0;
};

class FakeCompositor : public IFrameCompositor
{
public:
    explicit FakeCompositor(std::shared_ptr<CompositorLog> log) : m_log(std::move(log)) {}

    FramePtr composite(const AVFrame *decoded, const TelemetryFrame *telemetry) override
    {
        m_log->heartRates.push_back(telemetry ? telemetry->hr : std::nullopt);
        FramePtr out = make_frame();
        out->pts = decoded->pts;
        out->duration = decoded->duration;
        return out;
    }

private:
    std::shared_ptr<CompositorLog> m_log;
};

class AcceptingProbe : public ICodecCapabilityProbe
{
public:
    std::optional<std::string> probeEncoder(const EncoderVariant &variant) override
    {
        if (static_cast<int64_t>(variant.width) * variant.height > maxPixels)
            return std::nullopt;
        return std::string("fake_h264");
    }

    bool isDecoderSupported(const TrackDescriptor &) override
    {
        ++decoderQueries;
        if (decoderSupportedAfter < 0)
            return false;
        return decoderQueries > decoderSupportedAfter;
    }

    int64_t maxPixels = INT64_MAX;
    // Number of decoder queries answered "unsupported" before answering "supported"; -1 = never
    int decoderSupportedAfter = 0;
    int decoderQueries = 0;
};

class FakeTranscoder : public IExternalTranscoder
{
public:
    MediaSource repackContainer(const MediaSource &input) override
    {
        ++repackCalls;
        repackInputs.push_back(input.size());
        if (!repackResult)
            throw PipelineError(ErrorKind::TranscodeFailure, "Container repack failed (ffmpeg exit code 1)");
        return *repackResult;
    }

    MediaSource transcodeWithForcedKeyframes(const MediaSource &, const ForcedKeyframeOptions &options,
                                             const PercentCallback &onProgress) override
    {
        ++forcedKeyframeCalls;
        lastOptions = options;
        if (onProgress)
        {
            onProgress(50);
            onProgress(100);
        }
        if (!forcedKeyframeResult)
            throw PipelineError(ErrorKind::TranscodeFailure, "FFmpeg transcode failed for both audio modes");
        return *forcedKeyframeResult;
    }

    std::optional<MediaSource> repackResult;
    std::optional<MediaSource> forcedKeyframeResult;
    int repackCalls = 0;
    int forcedKeyframeCalls = 0;
    std::vector<uint64_t> repackInputs;
    ForcedKeyframeOptions lastOptions;
};
