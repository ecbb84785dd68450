#pragma once

extern "C"
{
#include <libavcodec/codec_id.h>
}

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

using ByteBuffer = std::vector<uint8_t>;

// Video codec family as far as the pipeline cares (NAL parsing and candidate selection)
enum class CodecFamily
{
    Avc,
    Hevc,
    Av1,
    Vp9,
    Other
};

// One encoded access unit in a normalized microsecond timescale
struct EncodedSample
{
    ByteBuffer data;
    int64_t durationUs = 1;
    int64_t timestampUs = 0;
    int64_t decodeTimestampUs = 0;
    bool isRandomAccessPoint = false;
};

struct TrackDescriptor
{
    std::string codecString; // e.g. "avc1.64002A", "hvc1.1.6.L153.B0", "mp4a.40.2"
    CodecFamily codecFamily = CodecFamily::Other;
    AVCodecID codecId = AV_CODEC_ID_NONE;
    ByteBuffer decoderDescription; // avcC / hvcC / codec extradata, may be empty
    int timescale = 1000000;

    // Video
    int width = 0;
    int height = 0;
    double frameRate = 0.0;

    // Audio
    int sampleRate = 0;
    int channels = 0;
    int frameSize = 0;
    int64_t bitRate = 0;
};

struct DemuxResult
{
    TrackDescriptor videoTrack;
    std::optional<TrackDescriptor> audioTrack;
    std::vector<EncodedSample> videoSamples;
    std::vector<EncodedSample> audioSamples;
    double durationSeconds = 0.0;
};

// Description of the source used to plan the encode
struct VideoMeta
{
    int width = 0;
    int height = 0;
    double fps = 30.0;
    double durationSeconds = 0.0;
    uint64_t fileSizeBytes = 0;
    std::string codecString;
    CodecFamily codecFamily = CodecFamily::Other;
};

enum class HardwareTier
{
    PreferHardware,
    NoPreference,
    PreferSoftware
};

// One immutable candidate configuration queried against the platform
struct EncoderVariant
{
    std::string codecString;
    int width = 0;
    int height = 0;
    int64_t bitrate = 0;
    double frameRate = 30.0;
    HardwareTier tier = HardwareTier::NoPreference;
};

struct EncoderPlan
{
    int targetWidth = 0;
    int targetHeight = 0;
    int64_t targetBitrate = 0;
    std::string chosenCodec;
    std::string encoderName; // libavcodec encoder implementation accepted by the probe
    HardwareTier hardwareTier = HardwareTier::NoPreference;
    double frameRate = 30.0;
};

struct EncodedChunk
{
    ByteBuffer data;
    int64_t timestampUs = 0;
    int64_t decodeTimestampUs = 0;
    int64_t durationUs = 1;
    bool isKey = false;
};

// Stream configuration reported by the encoder alongside its first chunk
struct VideoDecoderConfig
{
    std::string codecString;
    AVCodecID codecId = AV_CODEC_ID_NONE;
    ByteBuffer description;
    int width = 0;
    int height = 0;
};

struct TelemetryFrame
{
    double timeOffsetSeconds = 0.0;
    std::optional<int> hr;
    std::optional<double> paceSecondsPerKm;
    double distanceKm = 0.0;
    std::optional<double> elevationM;
    std::string elapsedTime;
    double movingTimeSeconds = 0.0;
};

enum class OverlayPosition
{
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight
};

struct OverlayConfig
{
    std::string templateId = "classic";
    OverlayPosition position = OverlayPosition::BottomLeft;
    double backgroundOpacity = 0.6;
    int fontSizePercent = 100;
    bool showHr = true;
    bool showPace = true;
    bool showDistance = true;
    bool showTime = true;
};

enum class ProcessingPhase
{
    Demuxing,
    Encoding,
    Processing,
    Muxing,
    Complete
};

struct ProcessingProgress
{
    ProcessingPhase phase = ProcessingPhase::Demuxing;
    int percent = 0;
    int64_t framesProcessed = 0;
    int64_t totalFrames = 0;
    std::optional<double> estimatedRemainingSeconds;
};

using ProgressCallback = std::function<void(const ProcessingProgress &)>;
using PercentCallback = std::function<void(int percent)>;

// Tuning constants of the processing run; defaults match the shipped behavior
struct PipelineTuning
{
    size_t queueWatermark = 24;
    size_t maxInflightFrameTasks = 3;
    uint64_t streamingThresholdBytes = 512ull * 1024 * 1024;
    uint64_t repackMaxBytes = 1024ull * 1024 * 1024;
    int64_t downscaleMaxPixels = 2097152;
    size_t gopSampleLimit = 16;
    size_t keyframeSearchLimit = 0; // 0 = search every sample
    std::chrono::milliseconds progressInterval{120};
};

const char *phase_name(ProcessingPhase phase);
const char *hardware_tier_name(HardwareTier tier);
