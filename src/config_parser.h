#pragma once

#include <cstdint>
#include <string>

#include "pipeline_types.h"

// Configuration of one command-line run
struct PipelineConfig
{
    bool verbose = false;
    bool debug = false;
    bool showProgress = true;

    char *inputPath = nullptr;
    char *outputPath = nullptr; // file path, or - / pipe:1 for stdout

    // Telemetry timeline (CSV exported by the timeline builder) and its sync offset
    std::string telemetryPath;
    double syncOffsetSeconds = 0.0;

    OverlayConfig overlay;
    PipelineTuning tuning;

    bool finalRemux = false;
    std::string ffmpegBinary = "ffmpeg";
};

// Print usage/help information
void print_help(const char *argv0);

// Parse command-line arguments and initialize configuration.
// Environment variables (TOVL_*) give the defaults, flags override them.
// Exits the process on --help or invalid input.
void parse_arguments(int argc, char **argv, PipelineConfig *cfg);

// Value parsers shared by flags and environment variables; false on invalid input
bool parse_overlay_position(const std::string &value, OverlayPosition &out);
bool parse_double_value(const std::string &value, double &out);
bool parse_int64_value(const std::string &value, int64_t &out);

const char *overlay_position_name(OverlayPosition position);
