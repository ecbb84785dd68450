#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "ffmpeg_utils.h"
#include "pipeline_types.h"

// Decoded frame handed over to the caller, which owns it from then on
using DecodedFrameCallback = std::function<void(FramePtr frame)>;
// Encoded output; config is set on the first chunk only
using EncodedChunkCallback = std::function<void(EncodedChunk chunk, const VideoDecoderConfig *config)>;
using CodecErrorCallback = std::function<void(const std::string &message)>;

// Asynchronous decoder contract: decode() queues a sample and returns, frames are
// delivered by pump() one queued sample at a time, or by flush() for everything left.
// Runtime failures go to the error callback; configure() throws.
class IVideoDecoder
{
public:
    virtual ~IVideoDecoder() = default;

    virtual void configure(const TrackDescriptor &track) = 0;
    virtual void decode(const EncodedSample &sample) = 0;
    virtual size_t queueSize() const = 0;
    // Process one queued unit; false when there was nothing to do
    virtual bool pump() = 0;
    virtual void flush() = 0;
    virtual void close() = 0;
};

// Asynchronous encoder contract, mirroring IVideoDecoder
class IVideoEncoder
{
public:
    virtual ~IVideoEncoder() = default;

    virtual void configure(const EncoderPlan &plan) = 0;
    // Pixel format frames must be in when passed to encode()
    virtual AVPixelFormat pixelFormat() const = 0;
    virtual void encode(FramePtr frame, bool keyFrame) = 0;
    virtual size_t queueSize() const = 0;
    virtual bool pump() = 0;
    virtual void flush() = 0;
    virtual void close() = 0;
};

using VideoDecoderFactory =
    std::function<std::unique_ptr<IVideoDecoder>(DecodedFrameCallback onFrame, CodecErrorCallback onError)>;
using VideoEncoderFactory =
    std::function<std::unique_ptr<IVideoEncoder>(EncodedChunkCallback onChunk, CodecErrorCallback onError)>;

class FfmpegVideoDecoder : public IVideoDecoder
{
public:
    FfmpegVideoDecoder(DecodedFrameCallback onFrame, CodecErrorCallback onError);
    ~FfmpegVideoDecoder() override;

    void configure(const TrackDescriptor &track) override;
    void decode(const EncodedSample &sample) override;
    size_t queueSize() const override { return m_pending.size(); }
    bool pump() override;
    void flush() override;
    void close() override;

private:
    bool sendPacket(AVPacket *pkt);
    bool receiveFrames();
    void fail(const std::string &message);

    DecodedFrameCallback m_onFrame;
    CodecErrorCallback m_onError;
    CodecContextPtr m_ctx{nullptr, &avcodec_free_context_single};
    PacketPtr m_packet{nullptr, &av_packet_free_single};
    std::deque<EncodedSample> m_pending;
    bool m_failed = false;
};

class FfmpegVideoEncoder : public IVideoEncoder
{
public:
    FfmpegVideoEncoder(EncodedChunkCallback onChunk, CodecErrorCallback onError);
    ~FfmpegVideoEncoder() override;

    void configure(const EncoderPlan &plan) override;
    AVPixelFormat pixelFormat() const override;
    void encode(FramePtr frame, bool keyFrame) override;
    size_t queueSize() const override { return m_pending.size(); }
    bool pump() override;
    void flush() override;
    void close() override;

private:
    bool sendFrame(AVFrame *frame);
    bool receivePackets();
    void fail(const std::string &message);

    EncodedChunkCallback m_onChunk;
    CodecErrorCallback m_onError;
    CodecContextPtr m_ctx{nullptr, &avcodec_free_context_single};
    PacketPtr m_packet{nullptr, &av_packet_free_single};
    std::deque<std::pair<FramePtr, bool>> m_pending;
    std::string m_codecString;
    int64_t m_nominalDurationUs = 1;
    bool m_configSent = false;
    bool m_failed = false;
};

VideoDecoderFactory ffmpeg_decoder_factory();
VideoEncoderFactory ffmpeg_encoder_factory();
