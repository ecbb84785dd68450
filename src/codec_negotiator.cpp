#include "codec_negotiator.h"
#include "ffmpeg_utils.h"
#include "logger.h"
#include "pipeline_error.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>

static constexpr int64_t kMinBitrate = 5000000;
static constexpr int64_t kMaxBitrate = 140000000;

std::vector<std::string> encoder_names_for_tier(AVCodecID codecId, HardwareTier tier)
{
    switch (tier)
    {
    case HardwareTier::PreferHardware:
        switch (codecId)
        {
        case AV_CODEC_ID_H264:
            return {"h264_nvenc", "h264_qsv", "h264_videotoolbox", "h264_amf"};
        case AV_CODEC_ID_HEVC:
            return {"hevc_nvenc", "hevc_qsv", "hevc_videotoolbox", "hevc_amf"};
        case AV_CODEC_ID_AV1:
            return {"av1_nvenc", "av1_qsv", "av1_amf"};
        case AV_CODEC_ID_VP9:
            return {"vp9_qsv"};
        default:
            return {};
        }
    case HardwareTier::NoPreference:
    {
        const AVCodec *codec = avcodec_find_encoder(codecId);
        if (!codec)
            return {};
        return {codec->name};
    }
    case HardwareTier::PreferSoftware:
        switch (codecId)
        {
        case AV_CODEC_ID_H264:
            return {"libx264", "libopenh264"};
        case AV_CODEC_ID_HEVC:
            return {"libx265"};
        case AV_CODEC_ID_AV1:
            return {"libsvtav1", "libaom-av1", "librav1e"};
        case AV_CODEC_ID_VP9:
            return {"libvpx-vp9"};
        default:
            return {};
        }
    default:
        return {};
    }
}

void configure_encoder_context(AVCodecContext *ctx, const AVCodec *codec, const EncoderVariant &variant)
{
    CodecStringInfo info = parse_codec_string(variant.codecString);

    ctx->width = variant.width;
    ctx->height = variant.height;
    ctx->pix_fmt = choose_encoder_pixel_format(codec);
    ctx->time_base = kMicrosecondTimeBase;
    ctx->framerate = av_d2q(variant.frameRate > 0 ? variant.frameRate : 30.0, 1000000);
    ctx->bit_rate = variant.bitrate;
    ctx->rc_max_rate = variant.bitrate;
    ctx->rc_buffer_size = static_cast<int>(std::min<int64_t>(variant.bitrate * 2, INT32_MAX));
    ctx->max_b_frames = 0;
    ctx->sample_aspect_ratio = AVRational{1, 1};
    // MP4 carries the parameter sets out of band
    ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    if (info.codecId == AV_CODEC_ID_H264 || info.codecId == AV_CODEC_ID_HEVC)
    {
        if (info.profile != AV_PROFILE_UNKNOWN)
            ctx->profile = info.profile;
        if (info.level != AV_LEVEL_UNKNOWN)
            ctx->level = info.level;
    }
}

bool FfmpegCapabilityProbe::tryOpen(const AVCodec *codec, const EncoderVariant &variant)
{
    char key[256];
    snprintf(key, sizeof(key), "%s|%s|%dx%d|%lld", codec->name, variant.codecString.c_str(),
             variant.width, variant.height, static_cast<long long>(variant.bitrate));
    auto cached = m_openCache.find(key);
    if (cached != m_openCache.end())
        return cached->second;

    CodecContextPtr ctx(avcodec_alloc_context3(codec), &avcodec_free_context_single);
    if (!ctx)
        throw std::runtime_error("avcodec_alloc_context3 failed");
    configure_encoder_context(ctx.get(), codec, variant);

    // Probing failures are expected; keep libav quiet while trying
    int previousLevel = av_log_get_level();
    av_log_set_level(AV_LOG_QUIET);
    int err = avcodec_open2(ctx.get(), codec, nullptr);
    av_log_set_level(previousLevel);

    bool ok = err >= 0;
    LOG_DEBUG("Encoder probe %s %s %dx%d: %s", codec->name, variant.codecString.c_str(),
              variant.width, variant.height, ok ? "accepted" : ff_error_string(err).c_str());
    m_openCache[key] = ok;
    return ok;
}

std::optional<std::string> FfmpegCapabilityProbe::probeEncoder(const EncoderVariant &variant)
{
    CodecStringInfo info = parse_codec_string(variant.codecString);
    if (info.codecId == AV_CODEC_ID_NONE)
        return std::nullopt;

    for (const std::string &name : encoder_names_for_tier(info.codecId, variant.tier))
    {
        const AVCodec *codec = avcodec_find_encoder_by_name(name.c_str());
        if (!codec)
            continue;
        if (tryOpen(codec, variant))
            return name;
    }
    return std::nullopt;
}

bool FfmpegCapabilityProbe::isDecoderSupported(const TrackDescriptor &track)
{
    const AVCodec *codec = avcodec_find_decoder(track.codecId);
    if (!codec)
        return false;

    CodecContextPtr ctx(avcodec_alloc_context3(codec), &avcodec_free_context_single);
    if (!ctx)
        throw std::runtime_error("avcodec_alloc_context3 failed");
    ctx->width = track.width;
    ctx->height = track.height;
    if (!track.decoderDescription.empty())
    {
        ctx->extradata = static_cast<uint8_t *>(av_mallocz(track.decoderDescription.size() + AV_INPUT_BUFFER_PADDING_SIZE));
        if (!ctx->extradata)
            throw std::runtime_error("av_mallocz failed");
        std::copy(track.decoderDescription.begin(), track.decoderDescription.end(), ctx->extradata);
        ctx->extradata_size = static_cast<int>(track.decoderDescription.size());
    }

    int err = avcodec_open2(ctx.get(), codec, nullptr);
    if (err < 0)
    {
        LOG_VERBOSE("Decoder %s rejected %s: %s", codec->name, track.codecString.c_str(), ff_error_string(err).c_str());
        return false;
    }
    return true;
}

std::vector<std::string> avc_codec_candidates(int width, int height)
{
    int64_t pixels = static_cast<int64_t>(width) * height;
    if (pixels > 4096LL * 2304)
        return {"avc1.640034", "avc1.640033", "avc1.640032", "avc1.64002A", "avc1.640029", "avc1.640028"};
    if (pixels > 1920LL * 1080)
        return {"avc1.640033", "avc1.640032", "avc1.64002A", "avc1.640029", "avc1.640028"};
    return {"avc1.640029", "avc1.640028"};
}

std::vector<std::string> encoder_codec_candidates(CodecFamily sourceFamily, int width, int height)
{
    std::vector<std::string> candidates;
    switch (sourceFamily)
    {
    case CodecFamily::Hevc:
        candidates = {"hvc1.1.6.L153.B0", "hev1.1.6.L153.B0", "hvc1.1.6.L123.B0", "hev1.1.6.L123.B0"};
        break;
    case CodecFamily::Av1:
        candidates = {"av01.0.12M.08"};
        break;
    case CodecFamily::Vp9:
        candidates = {"vp09.00.41.08"};
        break;
    default:
        break;
    }
    std::vector<std::string> avc = avc_codec_candidates(width, height);
    candidates.insert(candidates.end(), avc.begin(), avc.end());
    return candidates;
}

int64_t bitrate_baseline(int width, int height)
{
    int64_t pixels = static_cast<int64_t>(width) * height;
    if (pixels >= 3840LL * 2160)
        return 35000000;
    if (pixels >= 1920LL * 1080)
        return 15000000;
    if (pixels >= 1280LL * 720)
        return 8000000;
    return 5000000;
}

int64_t estimate_target_bitrate(const VideoMeta &source, int targetWidth, int targetHeight)
{
    double duration = std::max(1.0, source.durationSeconds > 0 ? source.durationSeconds : 1.0);
    double sourceBitrate = std::round(static_cast<double>(source.fileSizeBytes) * 8.0 / duration);

    double sourcePixels = std::max(1.0, static_cast<double>(source.width) * source.height);
    double targetPixels = std::max(1.0, static_cast<double>(targetWidth) * targetHeight);
    double scaled = std::round(sourceBitrate * std::min(1.0, targetPixels / sourcePixels));

    int64_t target = std::max(static_cast<int64_t>(scaled), bitrate_baseline(targetWidth, targetHeight));
    return std::clamp(target, kMinBitrate, kMaxBitrate);
}

void scale_to_max_area(int width, int height, int64_t maxArea, int &outWidth, int &outHeight)
{
    int64_t area = static_cast<int64_t>(width) * height;
    if (area <= maxArea)
    {
        outWidth = width;
        outHeight = height;
        return;
    }
    // 4:2:0 encoders need even dimensions
    double scale = std::sqrt(static_cast<double>(maxArea) / static_cast<double>(area));
    outWidth = std::max(2, static_cast<int>(std::floor(width * scale)) & ~1);
    outHeight = std::max(2, static_cast<int>(std::floor(height * scale)) & ~1);
}

CodecNegotiator::CodecNegotiator(ICodecCapabilityProbe &probe, int64_t downscaleMaxPixels)
    : m_probe(probe), m_downscaleMaxPixels(downscaleMaxPixels)
{
}

std::optional<EncoderPlan> CodecNegotiator::tryCandidates(const VideoMeta &source, int width, int height) const
{
    static const HardwareTier tiers[] = {HardwareTier::PreferHardware, HardwareTier::NoPreference, HardwareTier::PreferSoftware};
    int64_t bitrate = estimate_target_bitrate(source, width, height);

    for (const std::string &codec : encoder_codec_candidates(source.codecFamily, width, height))
    {
        for (HardwareTier tier : tiers)
        {
            EncoderVariant variant;
            variant.codecString = codec;
            variant.width = width;
            variant.height = height;
            variant.bitrate = bitrate;
            variant.frameRate = source.fps;
            variant.tier = tier;

            std::optional<std::string> encoder = m_probe.probeEncoder(variant);
            if (!encoder)
                continue;

            EncoderPlan plan;
            plan.targetWidth = width;
            plan.targetHeight = height;
            plan.targetBitrate = bitrate;
            plan.chosenCodec = codec;
            plan.encoderName = *encoder;
            plan.hardwareTier = tier;
            plan.frameRate = source.fps;
            return plan;
        }
    }
    return std::nullopt;
}

EncoderPlan CodecNegotiator::negotiate(const VideoMeta &source) const
{
    std::optional<EncoderPlan> plan = tryCandidates(source, source.width, source.height);
    if (!plan)
    {
        int w = 0, h = 0;
        scale_to_max_area(source.width, source.height, m_downscaleMaxPixels, w, h);
        LOG_WARN("No encoder accepted %dx%d, retrying at %dx%d", source.width, source.height, w, h);
        plan = tryCandidates(source, w, h);
    }
    if (!plan)
    {
        throw PipelineError(ErrorKind::UnsupportedConfiguration,
                            "Unable to find a supported codec configuration for this resolution. Try reducing the video size.");
    }

    LOG_VERBOSE("Encoder plan: %s via %s (%s), %dx%d @ %.2f Mbps",
                plan->chosenCodec.c_str(), plan->encoderName.c_str(), hardware_tier_name(plan->hardwareTier),
                plan->targetWidth, plan->targetHeight, plan->targetBitrate / 1e6);
    return *plan;
}
