#pragma once

extern "C"
{
#include <libavcodec/avcodec.h>
}

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "pipeline_types.h"

// Platform capability queries used to pick encoder/decoder configurations
class ICodecCapabilityProbe
{
public:
    virtual ~ICodecCapabilityProbe() = default;
    // Name of an encoder implementation that accepts the variant, nothing when unsupported
    virtual std::optional<std::string> probeEncoder(const EncoderVariant &variant) = 0;
    virtual bool isDecoderSupported(const TrackDescriptor &track) = 0;
};

// Probes libavcodec by test-opening encoders. Hardware tier maps to the vendor
// encoders (nvenc, qsv, videotoolbox, amf), no-preference to the default encoder
// for the codec, software tier to the CPU libraries.
class FfmpegCapabilityProbe : public ICodecCapabilityProbe
{
public:
    std::optional<std::string> probeEncoder(const EncoderVariant &variant) override;
    bool isDecoderSupported(const TrackDescriptor &track) override;

private:
    bool tryOpen(const AVCodec *codec, const EncoderVariant &variant);

    std::map<std::string, bool> m_openCache;
};

// Encoder implementations tried for a codec and tier, in order
std::vector<std::string> encoder_names_for_tier(AVCodecID codecId, HardwareTier tier);

// Apply a variant to an encoder context: size, pixel format, microsecond time base,
// frame rate, bitrate, no B-frames, global headers and the codec string's profile/level
void configure_encoder_context(AVCodecContext *ctx, const AVCodec *codec, const EncoderVariant &variant);

std::vector<std::string> avc_codec_candidates(int width, int height);

// Source-compatible codecs first, H.264 profiles as the universal fallback
std::vector<std::string> encoder_codec_candidates(CodecFamily sourceFamily, int width, int height);

// Resolution-only bitrate floor: 4K 35 Mbps, 1080p 15, 720p 8, else 5
int64_t bitrate_baseline(int width, int height);

// Source bitrate scaled by the pixel ratio, floored by the baseline, clamped to [5, 140] Mbps
int64_t estimate_target_bitrate(const VideoMeta &source, int targetWidth, int targetHeight);

// Shrink to at most maxArea pixels keeping aspect ratio, at least 2 px per side
void scale_to_max_area(int width, int height, int64_t maxArea, int &outWidth, int &outHeight);

class CodecNegotiator
{
public:
    explicit CodecNegotiator(ICodecCapabilityProbe &probe, int64_t downscaleMaxPixels = 2097152);

    // Throws PipelineError(UnsupportedConfiguration) when nothing is accepted even after downscale
    EncoderPlan negotiate(const VideoMeta &source) const;

private:
    std::optional<EncoderPlan> tryCandidates(const VideoMeta &source, int width, int height) const;

    ICodecCapabilityProbe &m_probe;
    int64_t m_downscaleMaxPixels;
};
