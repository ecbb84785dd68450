#include "video_codecs.h"
#include "codec_negotiator.h"
#include "logger.h"

extern "C"
{
#include <libavutil/opt.h>
#include <libavutil/pixdesc.h>
}

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

// Compatibility for older FFmpeg versions
#ifndef AV_FRAME_FLAG_KEY
#define AV_FRAME_FLAG_KEY (1 << 0)
#endif

static void copy_extradata(AVCodecContext *ctx, const ByteBuffer &data)
{
    if (data.empty())
        return;
    ctx->extradata = static_cast<uint8_t *>(av_mallocz(data.size() + AV_INPUT_BUFFER_PADDING_SIZE));
    if (!ctx->extradata)
        throw std::runtime_error("av_mallocz failed");
    std::memcpy(ctx->extradata, data.data(), data.size());
    ctx->extradata_size = static_cast<int>(data.size());
}

FfmpegVideoDecoder::FfmpegVideoDecoder(DecodedFrameCallback onFrame, CodecErrorCallback onError)
    : m_onFrame(std::move(onFrame)), m_onError(std::move(onError))
{
}

FfmpegVideoDecoder::~FfmpegVideoDecoder()
{
    close();
}

void FfmpegVideoDecoder::configure(const TrackDescriptor &track)
{
    const AVCodec *codec = avcodec_find_decoder(track.codecId);
    if (!codec)
        throw std::runtime_error("No decoder available for " + track.codecString);

    m_ctx.reset(avcodec_alloc_context3(codec));
    if (!m_ctx)
        throw std::runtime_error("Failed to allocate decoder context");

    copy_extradata(m_ctx.get(), track.decoderDescription);
    m_ctx->width = track.width;
    m_ctx->height = track.height;
    m_ctx->pkt_timebase = kMicrosecondTimeBase;

    ff_check(avcodec_open2(m_ctx.get(), codec, nullptr), "open video decoder");
    m_packet = make_packet();
    m_failed = false;
    LOG_VERBOSE("Video decoder: %s for %s %dx%d", codec->name, track.codecString.c_str(), track.width, track.height);
}

void FfmpegVideoDecoder::decode(const EncodedSample &sample)
{
    m_pending.push_back(sample);
}

bool FfmpegVideoDecoder::pump()
{
    if (m_pending.empty())
        return false;

    EncodedSample sample = std::move(m_pending.front());
    m_pending.pop_front();
    if (m_failed || !m_ctx)
        return true;

    av_packet_unref(m_packet.get());
    int ret = av_new_packet(m_packet.get(), static_cast<int>(sample.data.size()));
    if (ret < 0)
    {
        fail("Failed to allocate decoder packet: " + ff_error_string(ret));
        return true;
    }
    if (!sample.data.empty())
        std::memcpy(m_packet->data, sample.data.data(), sample.data.size());
    m_packet->pts = sample.timestampUs;
    m_packet->dts = sample.decodeTimestampUs;
    m_packet->duration = sample.durationUs;
    if (sample.isRandomAccessPoint)
        m_packet->flags |= AV_PKT_FLAG_KEY;

    sendPacket(m_packet.get());
    return true;
}

bool FfmpegVideoDecoder::sendPacket(AVPacket *pkt)
{
    int ret = avcodec_send_packet(m_ctx.get(), pkt);
    if (ret == AVERROR(EAGAIN))
    {
        if (!receiveFrames())
            return false;
        ret = avcodec_send_packet(m_ctx.get(), pkt);
    }
    if (ret < 0 && ret != AVERROR_EOF)
    {
        fail("Video decode failed: " + ff_error_string(ret));
        return false;
    }
    return receiveFrames();
}

bool FfmpegVideoDecoder::receiveFrames()
{
    while (true)
    {
        FramePtr frame = make_frame();
        int ret = avcodec_receive_frame(m_ctx.get(), frame.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            return true;
        if (ret < 0)
        {
            fail("Video decode failed: " + ff_error_string(ret));
            return false;
        }
        frame->pts = frame->best_effort_timestamp;
        m_onFrame(std::move(frame));
    }
}

void FfmpegVideoDecoder::flush()
{
    while (pump())
    {
    }
    if (m_failed || !m_ctx)
        return;
    sendPacket(nullptr);
}

void FfmpegVideoDecoder::close()
{
    m_pending.clear();
    m_packet.reset();
    m_ctx.reset();
}

void FfmpegVideoDecoder::fail(const std::string &message)
{
    // Only the first failure is reported; later work is dropped
    if (m_failed)
        return;
    m_failed = true;
    m_pending.clear();
    if (m_onError)
        m_onError(message);
}

FfmpegVideoEncoder::FfmpegVideoEncoder(EncodedChunkCallback onChunk, CodecErrorCallback onError)
    : m_onChunk(std::move(onChunk)), m_onError(std::move(onError))
{
}

FfmpegVideoEncoder::~FfmpegVideoEncoder()
{
    close();
}

void FfmpegVideoEncoder::configure(const EncoderPlan &plan)
{
    const AVCodec *codec = nullptr;
    if (!plan.encoderName.empty())
        codec = avcodec_find_encoder_by_name(plan.encoderName.c_str());
    if (!codec)
        codec = avcodec_find_encoder(parse_codec_string(plan.chosenCodec).codecId);
    if (!codec)
        throw std::runtime_error("No encoder available for " + plan.chosenCodec);

    m_ctx.reset(avcodec_alloc_context3(codec));
    if (!m_ctx)
        throw std::runtime_error("Failed to allocate encoder context");

    EncoderVariant variant;
    variant.codecString = plan.chosenCodec;
    variant.width = plan.targetWidth;
    variant.height = plan.targetHeight;
    variant.bitrate = plan.targetBitrate;
    variant.frameRate = plan.frameRate;
    variant.tier = plan.hardwareTier;
    configure_encoder_context(m_ctx.get(), codec, variant);

    // Forced I frames must be IDR so every forced keyframe is a sync sample
    int ret = av_opt_set_int(m_ctx->priv_data, "forced-idr", 1, 0);
    if (ret < 0)
        LOG_DEBUG("Encoder %s has no forced-idr option: %s", codec->name, ff_error_string(ret).c_str());

    ff_check(avcodec_open2(m_ctx.get(), codec, nullptr), "open video encoder");

    m_packet = make_packet();
    m_codecString = plan.chosenCodec;
    double fps = plan.frameRate > 0.0 ? plan.frameRate : 30.0;
    m_nominalDurationUs = std::max<int64_t>(1, std::llround(1e6 / fps));
    m_configSent = false;
    m_failed = false;

    LOG_VERBOSE("Video encoder: %s (%s) %dx%d %s @ %.2f Mbps, %s", codec->name, plan.chosenCodec.c_str(),
                plan.targetWidth, plan.targetHeight, av_get_pix_fmt_name(m_ctx->pix_fmt),
                plan.targetBitrate / 1e6, hardware_tier_name(plan.hardwareTier));
}

AVPixelFormat FfmpegVideoEncoder::pixelFormat() const
{
    return m_ctx ? m_ctx->pix_fmt : AV_PIX_FMT_NONE;
}

void FfmpegVideoEncoder::encode(FramePtr frame, bool keyFrame)
{
    m_pending.emplace_back(std::move(frame), keyFrame);
}

bool FfmpegVideoEncoder::pump()
{
    if (m_pending.empty())
        return false;

    std::pair<FramePtr, bool> item = std::move(m_pending.front());
    m_pending.pop_front();
    if (m_failed || !m_ctx)
        return true;

    AVFrame *frame = item.first.get();
    if (item.second)
    {
        frame->pict_type = AV_PICTURE_TYPE_I;
        frame->flags |= AV_FRAME_FLAG_KEY;
    }
    else
    {
        frame->pict_type = AV_PICTURE_TYPE_NONE;
        frame->flags &= ~AV_FRAME_FLAG_KEY;
    }
    sendFrame(frame);
    return true;
}

bool FfmpegVideoEncoder::sendFrame(AVFrame *frame)
{
    int ret = avcodec_send_frame(m_ctx.get(), frame);
    if (ret == AVERROR(EAGAIN))
    {
        if (!receivePackets())
            return false;
        ret = avcodec_send_frame(m_ctx.get(), frame);
    }
    if (ret < 0 && ret != AVERROR_EOF)
    {
        fail("Video encode failed: " + ff_error_string(ret));
        return false;
    }
    return receivePackets();
}

bool FfmpegVideoEncoder::receivePackets()
{
    while (true)
    {
        int ret = avcodec_receive_packet(m_ctx.get(), m_packet.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            return true;
        if (ret < 0)
        {
            fail("Video encode failed: " + ff_error_string(ret));
            return false;
        }

        EncodedChunk chunk;
        chunk.data.assign(m_packet->data, m_packet->data + m_packet->size);
        chunk.timestampUs = m_packet->pts;
        chunk.decodeTimestampUs = m_packet->dts != AV_NOPTS_VALUE ? m_packet->dts : m_packet->pts;
        chunk.durationUs = m_packet->duration > 0 ? m_packet->duration : m_nominalDurationUs;
        chunk.isKey = (m_packet->flags & AV_PKT_FLAG_KEY) != 0;
        av_packet_unref(m_packet.get());

        if (!m_configSent)
        {
            VideoDecoderConfig config;
            config.codecString = m_codecString;
            config.codecId = m_ctx->codec_id;
            if (m_ctx->extradata && m_ctx->extradata_size > 0)
                config.description.assign(m_ctx->extradata, m_ctx->extradata + m_ctx->extradata_size);
            config.width = m_ctx->width;
            config.height = m_ctx->height;
            m_configSent = true;
            m_onChunk(std::move(chunk), &config);
        }
        else
        {
            m_onChunk(std::move(chunk), nullptr);
        }
    }
}

void FfmpegVideoEncoder::flush()
{
    while (pump())
    {
    }
    if (m_failed || !m_ctx)
        return;
    sendFrame(nullptr);
}

void FfmpegVideoEncoder::close()
{
    m_pending.clear();
    m_packet.reset();
    m_ctx.reset();
}

void FfmpegVideoEncoder::fail(const std::string &message)
{
    if (m_failed)
        return;
    m_failed = true;
    m_pending.clear();
    if (m_onError)
        m_onError(message);
}

VideoDecoderFactory ffmpeg_decoder_factory()
{
    return [](DecodedFrameCallback onFrame, CodecErrorCallback onError) -> std::unique_ptr<IVideoDecoder>
    {
        return std::make_unique<FfmpegVideoDecoder>(std::move(onFrame), std::move(onError));
    };
}

VideoEncoderFactory ffmpeg_encoder_factory()
{
    return [](EncodedChunkCallback onChunk, CodecErrorCallback onError) -> std::unique_ptr<IVideoEncoder>
    {
        return std::make_unique<FfmpegVideoEncoder>(std::move(onChunk), std::move(onError));
    };
}
