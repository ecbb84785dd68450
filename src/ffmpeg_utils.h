#pragma once

extern "C"
{
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}

#include <memory>
#include <stdexcept>
#include <string>

#include "pipeline_types.h"

inline void ff_check(int err, const char *what)
{
    if (err < 0)
    {
        char buf[256];
        av_strerror(err, buf, sizeof(buf));
        throw std::runtime_error(std::string(what) + ": " + buf);
    }
}

inline std::string ff_error_string(int err)
{
    char buf[256];
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

// RAII deleters for FFmpeg types that require ** double-pointer frees
static inline void av_frame_free_single(AVFrame *f)
{
    if (f)
        av_frame_free(&f);
}
static inline void av_packet_free_single(AVPacket *p)
{
    if (p)
        av_packet_free(&p);
}
static inline void avcodec_free_context_single(AVCodecContext *c)
{
    if (c)
        avcodec_free_context(&c);
}

using FramePtr = std::unique_ptr<AVFrame, void (*)(AVFrame *)>;
using PacketPtr = std::unique_ptr<AVPacket, void (*)(AVPacket *)>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, void (*)(AVCodecContext *)>;

inline FramePtr make_frame()
{
    FramePtr f(av_frame_alloc(), &av_frame_free_single);
    if (!f)
        throw std::runtime_error("av_frame_alloc failed");
    return f;
}

inline PacketPtr make_packet()
{
    PacketPtr p(av_packet_alloc(), &av_packet_free_single);
    if (!p)
        throw std::runtime_error("av_packet_alloc failed");
    return p;
}

// All pipeline timestamps are carried in microseconds
constexpr AVRational kMicrosecondTimeBase = {1, 1000000};

inline int64_t rescale_to_us(int64_t ts, AVRational tb)
{
    if (ts == AV_NOPTS_VALUE)
        return AV_NOPTS_VALUE;
    return av_rescale_q(ts, tb, kMicrosecondTimeBase);
}

CodecFamily codec_family_from_id(AVCodecID id);
CodecFamily codec_family_from_string(const std::string &codec);

// Parsed form of an RFC 6381 codec string ("avc1.640029", "hvc1.1.6.L153.B0", ...)
struct CodecStringInfo
{
    AVCodecID codecId = AV_CODEC_ID_NONE;
    int profile = AV_PROFILE_UNKNOWN;
    int level = AV_LEVEL_UNKNOWN;
};

CodecStringInfo parse_codec_string(const std::string &codec);

// Build the codec string for a demuxed stream, from avcC/hvcC when present
std::string codec_string_from_parameters(const AVCodecParameters *par);

// Preferred software pixel format accepted by an encoder (yuv420p, then nv12, then its first)
AVPixelFormat choose_encoder_pixel_format(const AVCodec *codec);

// Route libav* log output through Logger, with the FFmpeg level matched to -v/-d
void install_ffmpeg_log_bridge(bool verbose, bool debug);
