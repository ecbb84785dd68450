#include "ffmpeg_utils.h"
#include "logger.h"
#include "utils.h"

extern "C"
{
#include <libavutil/log.h>
#include <libavutil/pixdesc.h>
}

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

CodecFamily codec_family_from_id(AVCodecID id)
{
    switch (id)
    {
    case AV_CODEC_ID_H264:
        return CodecFamily::Avc;
    case AV_CODEC_ID_HEVC:
        return CodecFamily::Hevc;
    case AV_CODEC_ID_AV1:
        return CodecFamily::Av1;
    case AV_CODEC_ID_VP9:
        return CodecFamily::Vp9;
    default:
        return CodecFamily::Other;
    }
}

CodecFamily codec_family_from_string(const std::string &codec)
{
    std::string lower = lowercase_copy(codec);
    if (startsWith(lower, "avc1") || startsWith(lower, "avc3"))
        return CodecFamily::Avc;
    if (startsWith(lower, "hvc1") || startsWith(lower, "hev1"))
        return CodecFamily::Hevc;
    if (startsWith(lower, "av01"))
        return CodecFamily::Av1;
    if (startsWith(lower, "vp09"))
        return CodecFamily::Vp9;
    return CodecFamily::Other;
}

// Split "a.b.c" into its dot separated parts
static std::vector<std::string> split_dots(const std::string &s)
{
    std::vector<std::string> parts;
    size_t start = 0;
    while (true)
    {
        size_t dot = s.find('.', start);
        parts.push_back(s.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos)
            break;
        start = dot + 1;
    }
    return parts;
}

static int parse_int_or(const std::string &s, int base, int fallback)
{
    if (s.empty())
        return fallback;
    char *end = nullptr;
    long v = std::strtol(s.c_str(), &end, base);
    if (!end || end == s.c_str())
        return fallback;
    return static_cast<int>(v);
}

CodecStringInfo parse_codec_string(const std::string &codec)
{
    CodecStringInfo info;
    std::string lower = lowercase_copy(codec);
    std::vector<std::string> parts = split_dots(lower);

    switch (codec_family_from_string(lower))
    {
    case CodecFamily::Avc:
        info.codecId = AV_CODEC_ID_H264;
        // avc1.PPCCLL: profile_idc, constraint flags, level_idc in hex
        if (parts.size() >= 2 && parts[1].size() == 6)
        {
            info.profile = parse_int_or(parts[1].substr(0, 2), 16, AV_PROFILE_UNKNOWN);
            info.level = parse_int_or(parts[1].substr(4, 2), 16, AV_LEVEL_UNKNOWN);
        }
        break;
    case CodecFamily::Hevc:
        info.codecId = AV_CODEC_ID_HEVC;
        // hvc1.P.C.Lxxx.B0
        if (parts.size() >= 2)
            info.profile = parse_int_or(parts[1], 10, AV_PROFILE_UNKNOWN);
        if (parts.size() >= 4 && parts[3].size() > 1 && (parts[3][0] == 'l' || parts[3][0] == 'h'))
            info.level = parse_int_or(parts[3].substr(1), 10, AV_LEVEL_UNKNOWN);
        break;
    case CodecFamily::Av1:
        info.codecId = AV_CODEC_ID_AV1;
        // av01.P.LLT.DD
        if (parts.size() >= 2)
            info.profile = parse_int_or(parts[1], 10, AV_PROFILE_UNKNOWN);
        if (parts.size() >= 3 && parts[2].size() >= 2)
            info.level = parse_int_or(parts[2].substr(0, 2), 10, AV_LEVEL_UNKNOWN);
        break;
    case CodecFamily::Vp9:
        info.codecId = AV_CODEC_ID_VP9;
        // vp09.PP.LL.DD
        if (parts.size() >= 2)
            info.profile = parse_int_or(parts[1], 10, AV_PROFILE_UNKNOWN);
        if (parts.size() >= 3)
            info.level = parse_int_or(parts[2], 10, AV_LEVEL_UNKNOWN);
        break;
    default:
        if (startsWith(lower, "mp4a"))
            info.codecId = AV_CODEC_ID_AAC;
        else if (lower == "opus")
            info.codecId = AV_CODEC_ID_OPUS;
        else if (lower == "mp3")
            info.codecId = AV_CODEC_ID_MP3;
        else if (lower == "flac")
            info.codecId = AV_CODEC_ID_FLAC;
        else if (lower == "vp8")
            info.codecId = AV_CODEC_ID_VP8;
        break;
    }
    return info;
}

static int bit_depth_of(const AVCodecParameters *par)
{
    const AVPixFmtDescriptor *desc = av_pix_fmt_desc_get(static_cast<AVPixelFormat>(par->format));
    if (desc && desc->comp[0].depth > 8)
        return desc->comp[0].depth;
    return 8;
}

std::string codec_string_from_parameters(const AVCodecParameters *par)
{
    char buf[64];
    switch (par->codec_id)
    {
    case AV_CODEC_ID_H264:
        // avcC: configurationVersion, AVCProfileIndication, profile_compatibility, AVCLevelIndication
        if (par->extradata && par->extradata_size >= 4 && par->extradata[0] == 1)
        {
            snprintf(buf, sizeof(buf), "avc1.%02X%02X%02X", par->extradata[1], par->extradata[2], par->extradata[3]);
            return buf;
        }
        if (par->profile != AV_PROFILE_UNKNOWN && par->level != AV_LEVEL_UNKNOWN)
        {
            snprintf(buf, sizeof(buf), "avc1.%02X00%02X", par->profile & 0xFF, par->level & 0xFF);
            return buf;
        }
        return "avc1.640028";
    case AV_CODEC_ID_HEVC:
    {
        const char *tag = (par->codec_tag == MKTAG('h', 'e', 'v', '1')) ? "hev1" : "hvc1";
        int level = par->level != AV_LEVEL_UNKNOWN ? par->level : 123;
        if (par->profile == AV_PROFILE_HEVC_MAIN_10)
            snprintf(buf, sizeof(buf), "%s.2.4.L%d.B0", tag, level);
        else
            snprintf(buf, sizeof(buf), "%s.1.6.L%d.B0", tag, level);
        return buf;
    }
    case AV_CODEC_ID_AV1:
        snprintf(buf, sizeof(buf), "av01.%d.%02dM.%02d",
                 par->profile != AV_PROFILE_UNKNOWN ? par->profile : 0,
                 par->level != AV_LEVEL_UNKNOWN ? par->level : 8,
                 bit_depth_of(par));
        return buf;
    case AV_CODEC_ID_VP9:
        snprintf(buf, sizeof(buf), "vp09.%02d.%02d.%02d",
                 par->profile != AV_PROFILE_UNKNOWN ? par->profile : 0,
                 par->level != AV_LEVEL_UNKNOWN ? par->level : 41,
                 bit_depth_of(par));
        return buf;
    case AV_CODEC_ID_VP8:
        return "vp8";
    case AV_CODEC_ID_AAC:
        snprintf(buf, sizeof(buf), "mp4a.40.%d", par->profile != AV_PROFILE_UNKNOWN ? par->profile + 1 : 2);
        return buf;
    case AV_CODEC_ID_MP3:
        return "mp3";
    case AV_CODEC_ID_OPUS:
        return "opus";
    case AV_CODEC_ID_FLAC:
        return "flac";
    case AV_CODEC_ID_AC3:
        return "ac-3";
    case AV_CODEC_ID_EAC3:
        return "ec-3";
    default:
        return avcodec_get_name(par->codec_id);
    }
}

AVPixelFormat choose_encoder_pixel_format(const AVCodec *codec)
{
    const AVPixelFormat *formats = nullptr;
#if LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(61, 13, 100)
    int count = 0;
    if (avcodec_get_supported_config(nullptr, codec, AV_CODEC_CONFIG_PIX_FORMAT, 0,
                                     reinterpret_cast<const void **>(&formats), &count) < 0)
        formats = nullptr;
#else
    formats = codec->pix_fmts;
#endif
    if (!formats)
        return AV_PIX_FMT_YUV420P;

    for (const AVPixelFormat *f = formats; *f != AV_PIX_FMT_NONE; ++f)
    {
        if (*f == AV_PIX_FMT_YUV420P)
            return *f;
    }
    for (const AVPixelFormat *f = formats; *f != AV_PIX_FMT_NONE; ++f)
    {
        if (*f == AV_PIX_FMT_NV12)
            return *f;
    }
    // Hardware surface formats need a device context, skip them
    for (const AVPixelFormat *f = formats; *f != AV_PIX_FMT_NONE; ++f)
    {
        const AVPixFmtDescriptor *desc = av_pix_fmt_desc_get(*f);
        if (desc && !(desc->flags & AV_PIX_FMT_FLAG_HWACCEL))
            return *f;
    }
    return formats[0];
}

static void ffmpeg_log_callback(void *avcl, int level, const char *fmt, va_list vl)
{
    if (level > av_log_get_level())
        return;

    static thread_local int print_prefix = 1;
    char line[1024];
    av_log_format_line2(avcl, level, fmt, vl, line, sizeof(line), &print_prefix);

    size_t len = std::strlen(line);
    while (len > 0 && (line[len - 1] == '\n' || line[len - 1] == '\r'))
        line[--len] = '\0';
    if (len == 0)
        return;

    LogLevel mapped = LogLevel::Debug;
    if (level <= AV_LOG_ERROR)
        mapped = LogLevel::Error;
    else if (level <= AV_LOG_WARNING)
        mapped = LogLevel::Warn;
    else if (level <= AV_LOG_INFO)
        mapped = LogLevel::Verbose;

    Logger::instance().log(mapped, "[ffmpeg] %s", line);
}

void install_ffmpeg_log_bridge(bool verbose, bool debug)
{
    if (debug)
    {
        av_log_set_level(AV_LOG_VERBOSE); // Show detailed FFmpeg internal logs
    }
    else if (verbose)
    {
        av_log_set_level(AV_LOG_INFO);
    }
    else
    {
        av_log_set_level(AV_LOG_WARNING); // Default: only warnings and errors
    }
    av_log_set_callback(&ffmpeg_log_callback);
}
