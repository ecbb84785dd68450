#include "config_parser.h"
#include "overlay_renderer.h"
#include "utils.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

#ifndef BUILD_VERSION
#define BUILD_VERSION "dev"
#endif

static constexpr uint64_t kMiB = 1024ull * 1024;

bool parse_overlay_position(const std::string &value, OverlayPosition &out)
{
    std::string v = lowercase_copy(trim_copy(value));
    if (v == "top-left" || v == "tl")
        out = OverlayPosition::TopLeft;
    else if (v == "top-right" || v == "tr")
        out = OverlayPosition::TopRight;
    else if (v == "bottom-left" || v == "bl")
        out = OverlayPosition::BottomLeft;
    else if (v == "bottom-right" || v == "br")
        out = OverlayPosition::BottomRight;
    else
        return false;
    return true;
}

const char *overlay_position_name(OverlayPosition position)
{
    switch (position)
    {
    case OverlayPosition::TopLeft:
        return "top-left";
    case OverlayPosition::TopRight:
        return "top-right";
    case OverlayPosition::BottomLeft:
        return "bottom-left";
    case OverlayPosition::BottomRight:
    default:
        return "bottom-right";
    }
}

bool parse_double_value(const std::string &value, double &out)
{
    try
    {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size() || !std::isfinite(v))
            return false;
        out = v;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool parse_int64_value(const std::string &value, int64_t &out)
{
    try
    {
        size_t used = 0;
        long long v = std::stoll(value, &used);
        if (used != value.size())
            return false;
        out = v;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

// Helper function: get environment variable as string
static const char *get_env_var(const char *name)
{
    return std::getenv(name);
}

// Helper function: get environment variable as integer with default
static int64_t get_env_int(const char *name, int64_t default_value)
{
    const char *value = std::getenv(name);
    if (!value)
        return default_value;
    int64_t parsed = 0;
    if (!parse_int64_value(value, parsed))
    {
        fprintf(stderr, "Warning: Invalid integer value for %s: %s (using default: %lld)\n", name, value,
                static_cast<long long>(default_value));
        return default_value;
    }
    return parsed;
}

// Helper function: get environment variable as floating point with default
static double get_env_double(const char *name, double default_value)
{
    const char *value = std::getenv(name);
    if (!value)
        return default_value;
    double parsed = 0.0;
    if (!parse_double_value(value, parsed))
    {
        fprintf(stderr, "Warning: Invalid number for %s: %s (using default: %g)\n", name, value, default_value);
        return default_value;
    }
    return parsed;
}

// Helper function: get environment variable as boolean (1/true/yes = true, 0/false/no = false)
static bool get_env_bool(const char *name, bool default_value)
{
    const char *value = std::getenv(name);
    if (!value)
        return default_value;
    std::string lower = lowercase_copy(value);
    if (lower == "1" || lower == "true" || lower == "yes")
        return true;
    if (lower == "0" || lower == "false" || lower == "no")
        return false;
    fprintf(stderr, "Warning: Invalid boolean value for %s: %s (using default: %s)\n",
            name, value, default_value ? "true" : "false");
    return default_value;
}

void print_help(const char *argv0)
{
    fprintf(stderr, "TelemetryOverlay build %s\n", BUILD_VERSION);
    fprintf(stderr, "Usage: %s input output.{mp4|-} [options]\n", argv0);
    fprintf(stderr, "\nBurns a telemetry overlay (heart rate, pace, distance, time) into a video.\n");
    fprintf(stderr, "\nOutput can be:\n");
    fprintf(stderr, "  - Local file: output.mp4\n");
    fprintf(stderr, "  - Stdout pipe: - or pipe:1\n");
    fprintf(stderr, "\nOptions:\n");
    fprintf(stderr, "  -v, --verbose Enable verbose logging\n");
    fprintf(stderr, "  -d, --debug Enable debug logging\n");
    fprintf(stderr, "  --no-progress Do not draw the progress bar (env: TOVL_NO_PROGRESS=1)\n");
    fprintf(stderr, "\nTelemetry options:\n");
    fprintf(stderr, "  --telemetry <csv>     Telemetry timeline (env: TOVL_TELEMETRY)\n");
    fprintf(stderr, "                        columns: time_offset_s,hr,pace_s_per_km,distance_km,elevation_m,elapsed,moving_time_s\n");
    fprintf(stderr, "  --sync-offset <s>     Seconds added to video time to find telemetry, default 0 (env: TOVL_SYNC_OFFSET)\n");
    fprintf(stderr, "\nOverlay options:\n");
    fprintf(stderr, "  --template <id>       classic or minimal, default classic (env: TOVL_TEMPLATE)\n");
    fprintf(stderr, "  --position <pos>      top-left, top-right, bottom-left, bottom-right, default bottom-left (env: TOVL_POSITION)\n");
    fprintf(stderr, "  --opacity <0..1>      Panel background opacity, default 0.6 (env: TOVL_OPACITY)\n");
    fprintf(stderr, "  --font-size <pct>     Text size in percent, default 100 (env: TOVL_FONT_SIZE)\n");
    fprintf(stderr, "  --no-hr               Hide heart rate (env: TOVL_NO_HR=1)\n");
    fprintf(stderr, "  --no-pace             Hide pace (env: TOVL_NO_PACE=1)\n");
    fprintf(stderr, "  --no-distance         Hide distance (env: TOVL_NO_DISTANCE=1)\n");
    fprintf(stderr, "  --no-time             Hide elapsed time (env: TOVL_NO_TIME=1)\n");
    fprintf(stderr, "\nPipeline tuning:\n");
    fprintf(stderr, "  --queue-watermark <n>        Codec queue depth that pauses input, default 24 (env: TOVL_QUEUE_WATERMARK)\n");
    fprintf(stderr, "  --max-inflight <n>           Decoded frames waiting for the overlay, default 3 (env: TOVL_MAX_INFLIGHT)\n");
    fprintf(stderr, "  --streaming-threshold-mb <n> Mux while encoding from this source size, default 512 (env: TOVL_STREAMING_THRESHOLD_MB)\n");
    fprintf(stderr, "  --repack-max-mb <n>          Largest source repaired automatically, default 1024 (env: TOVL_REPACK_MAX_MB)\n");
    fprintf(stderr, "  --downscale-pixels <n>       Pixel budget when no encoder accepts the source size, default 2097152 (env: TOVL_DOWNSCALE_PIXELS)\n");
    fprintf(stderr, "\nExternal tools:\n");
    fprintf(stderr, "  --ffmpeg <path>       ffmpeg binary used to repair sources, default ffmpeg (env: TOVL_FFMPEG)\n");
    fprintf(stderr, "  --final-remux         Repack the finished file with ffmpeg to strip metadata (env: TOVL_FINAL_REMUX=1)\n");
    fprintf(stderr, "\nEnvironment variables can be used to set defaults. Command-line flags override environment variables.\n");
}

static const char *require_value(int argc, char **argv, int &i, const std::string &arg)
{
    if (i + 1 >= argc)
    {
        fprintf(stderr, "Missing argument for %s\n", arg.c_str());
        print_help(argv[0]);
        exit(1);
    }
    return argv[++i];
}

static int64_t require_int(int argc, char **argv, int &i, const std::string &arg, int64_t minValue)
{
    const char *value = require_value(argc, argv, i, arg);
    int64_t parsed = 0;
    if (!parse_int64_value(value, parsed) || parsed < minValue)
    {
        fprintf(stderr, "Invalid value for %s: %s\n", arg.c_str(), value);
        exit(1);
    }
    return parsed;
}

static double require_double(int argc, char **argv, int &i, const std::string &arg)
{
    const char *value = require_value(argc, argv, i, arg);
    double parsed = 0.0;
    if (!parse_double_value(value, parsed))
    {
        fprintf(stderr, "Invalid value for %s: %s\n", arg.c_str(), value);
        exit(1);
    }
    return parsed;
}

static void load_env_defaults(PipelineConfig *cfg)
{
    cfg->showProgress = !get_env_bool("TOVL_NO_PROGRESS", false);

    const char *env_telemetry = get_env_var("TOVL_TELEMETRY");
    if (env_telemetry)
        cfg->telemetryPath = env_telemetry;
    cfg->syncOffsetSeconds = get_env_double("TOVL_SYNC_OFFSET", 0.0);

    const char *env_template = get_env_var("TOVL_TEMPLATE");
    cfg->overlay.templateId = env_template ? env_template : "classic";
    const char *env_position = get_env_var("TOVL_POSITION");
    if (env_position && !parse_overlay_position(env_position, cfg->overlay.position))
        fprintf(stderr, "Warning: Invalid position for TOVL_POSITION: %s (using default: bottom-left)\n", env_position);
    cfg->overlay.backgroundOpacity = get_env_double("TOVL_OPACITY", 0.6);
    cfg->overlay.fontSizePercent = static_cast<int>(get_env_int("TOVL_FONT_SIZE", 100));
    cfg->overlay.showHr = !get_env_bool("TOVL_NO_HR", false);
    cfg->overlay.showPace = !get_env_bool("TOVL_NO_PACE", false);
    cfg->overlay.showDistance = !get_env_bool("TOVL_NO_DISTANCE", false);
    cfg->overlay.showTime = !get_env_bool("TOVL_NO_TIME", false);

    cfg->tuning.queueWatermark = static_cast<size_t>(get_env_int("TOVL_QUEUE_WATERMARK", 24));
    cfg->tuning.maxInflightFrameTasks = static_cast<size_t>(get_env_int("TOVL_MAX_INFLIGHT", 3));
    cfg->tuning.streamingThresholdBytes = static_cast<uint64_t>(get_env_int("TOVL_STREAMING_THRESHOLD_MB", 512)) * kMiB;
    cfg->tuning.repackMaxBytes = static_cast<uint64_t>(get_env_int("TOVL_REPACK_MAX_MB", 1024)) * kMiB;
    cfg->tuning.downscaleMaxPixels = get_env_int("TOVL_DOWNSCALE_PIXELS", 2097152);

    const char *env_ffmpeg = get_env_var("TOVL_FFMPEG");
    cfg->ffmpegBinary = env_ffmpeg ? env_ffmpeg : "ffmpeg";
    cfg->finalRemux = get_env_bool("TOVL_FINAL_REMUX", false);
}

static void validate_config(const PipelineConfig *cfg)
{
    if (!is_known_overlay_template(cfg->overlay.templateId))
    {
        fprintf(stderr, "Unknown overlay template: %s (expected classic or minimal)\n", cfg->overlay.templateId.c_str());
        exit(1);
    }
    if (cfg->overlay.backgroundOpacity < 0.0 || cfg->overlay.backgroundOpacity > 1.0)
    {
        fprintf(stderr, "Opacity must be between 0 and 1, got %g\n", cfg->overlay.backgroundOpacity);
        exit(1);
    }
    if (cfg->overlay.fontSizePercent < 10 || cfg->overlay.fontSizePercent > 1000)
    {
        fprintf(stderr, "Font size must be between 10 and 1000 percent, got %d\n", cfg->overlay.fontSizePercent);
        exit(1);
    }
    if (cfg->tuning.queueWatermark < 1 || cfg->tuning.maxInflightFrameTasks < 1 || cfg->tuning.downscaleMaxPixels < 4)
    {
        fprintf(stderr, "Pipeline tuning values must be positive\n");
        exit(1);
    }
}

void parse_arguments(int argc, char **argv, PipelineConfig *cfg)
{
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0)
        {
            print_help(argv[0]);
            exit(0);
        }
    }

    if (argc < 3)
    {
        print_help(argv[0]);
        exit(1);
    }

    // Set default values (with environment variable overrides)
    // Command-line flags will override these
    load_env_defaults(cfg);

    int i = 1;
    cfg->inputPath = argv[i++];
    cfg->outputPath = argv[i++];

    for (; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v")
            cfg->verbose = true;
        else if (arg == "--debug" || arg == "-d")
            cfg->debug = true;
        else if (arg == "--no-progress")
            cfg->showProgress = false;

        // Telemetry
        else if (arg == "--telemetry")
            cfg->telemetryPath = require_value(argc, argv, i, arg);
        else if (arg == "--sync-offset")
            cfg->syncOffsetSeconds = require_double(argc, argv, i, arg);

        // Overlay
        else if (arg == "--template")
            cfg->overlay.templateId = require_value(argc, argv, i, arg);
        else if (arg == "--position")
        {
            const char *value = require_value(argc, argv, i, arg);
            if (!parse_overlay_position(value, cfg->overlay.position))
            {
                fprintf(stderr, "Invalid value for --position: %s\n", value);
                exit(1);
            }
        }
        else if (arg == "--opacity")
            cfg->overlay.backgroundOpacity = require_double(argc, argv, i, arg);
        else if (arg == "--font-size")
            cfg->overlay.fontSizePercent = static_cast<int>(require_int(argc, argv, i, arg, 1));
        else if (arg == "--no-hr")
            cfg->overlay.showHr = false;
        else if (arg == "--no-pace")
            cfg->overlay.showPace = false;
        else if (arg == "--no-distance")
            cfg->overlay.showDistance = false;
        else if (arg == "--no-time")
            cfg->overlay.showTime = false;

        // Tuning
        else if (arg == "--queue-watermark")
            cfg->tuning.queueWatermark = static_cast<size_t>(require_int(argc, argv, i, arg, 1));
        else if (arg == "--max-inflight")
            cfg->tuning.maxInflightFrameTasks = static_cast<size_t>(require_int(argc, argv, i, arg, 1));
        else if (arg == "--streaming-threshold-mb")
            cfg->tuning.streamingThresholdBytes = static_cast<uint64_t>(require_int(argc, argv, i, arg, 0)) * kMiB;
        else if (arg == "--repack-max-mb")
            cfg->tuning.repackMaxBytes = static_cast<uint64_t>(require_int(argc, argv, i, arg, 0)) * kMiB;
        else if (arg == "--downscale-pixels")
            cfg->tuning.downscaleMaxPixels = require_int(argc, argv, i, arg, 4);

        // External tools
        else if (arg == "--ffmpeg")
            cfg->ffmpegBinary = require_value(argc, argv, i, arg);
        else if (arg == "--final-remux")
            cfg->finalRemux = true;
        else
        {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_help(argv[0]);
            exit(1);
        }
    }

    validate_config(cfg);
}
