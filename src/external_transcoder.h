#pragma once

#include <string>
#include <vector>

#include "media_source.h"
#include "pipeline_types.h"

struct ForcedKeyframeOptions
{
    int gopSize = 30;
    double fps = 30.0;
    double durationSeconds = 0.0; // used to turn transcoder time into a percentage
};

// Repair tool used when the pipeline cannot read a source as-is
class IExternalTranscoder
{
public:
    virtual ~IExternalTranscoder() = default;

    // Full container repack: stream copy with metadata stripped
    virtual MediaSource repackContainer(const MediaSource &input) = 0;

    // Re-encode video with a keyframe every gopSize frames; audio copied, or AAC when copy fails
    virtual MediaSource transcodeWithForcedKeyframes(const MediaSource &input,
                                                     const ForcedKeyframeOptions &options,
                                                     const PercentCallback &onProgress) = 0;
};

// Runs the ffmpeg command line tool as a child process. Failures throw
// PipelineError(TranscodeFailure) with the last log lines as detail.
class FfmpegCliTranscoder : public IExternalTranscoder
{
public:
    explicit FfmpegCliTranscoder(std::string ffmpegBinary = "ffmpeg");

    MediaSource repackContainer(const MediaSource &input) override;
    MediaSource transcodeWithForcedKeyframes(const MediaSource &input,
                                             const ForcedKeyframeOptions &options,
                                             const PercentCallback &onProgress) override;

    static std::vector<std::string> repackArguments(const std::string &input, const std::string &output);
    static std::vector<std::string> forcedKeyframeArguments(const std::string &input, const std::string &output,
                                                            int gopSize, bool copyAudio);

private:
    struct RunResult
    {
        int exitCode = -1;
        std::vector<std::string> logTail;
    };

    RunResult run(const std::vector<std::string> &args, const std::string &label,
                  double durationSeconds, const PercentCallback &onProgress);

    std::string m_binary;
};

// Number of transcoder log lines kept as diagnostics
constexpr size_t kTranscoderLogTailLines = 50;

// Last maxLines non-empty lines of a text file
std::vector<std::string> read_log_tail(const std::string &path, size_t maxLines);

// Percent of durationSeconds reached according to an ffmpeg -progress file, or -1
int parse_progress_percent(const std::string &progressText, double durationSeconds);
