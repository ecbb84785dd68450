#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pipeline_types.h"

// Telemetry sample for a video instant. gpxTime = videoTimeSeconds + syncOffsetSeconds;
// instants outside the timeline yield nothing. Between two points values are interpolated.
std::optional<TelemetryFrame> telemetry_at_time(const std::vector<TelemetryFrame> &frames,
                                                double videoTimeSeconds,
                                                double syncOffsetSeconds);

// "M:SS", or "H:MM:SS" from one hour on
std::string format_elapsed_time(double totalSeconds);

// Pace as "M:SS" per km
std::string format_pace(double secondsPerKm);

// Load a telemetry timeline exported as CSV with the header
// time_offset_s,hr,pace_s_per_km,distance_km,elevation_m,elapsed,moving_time_s
// Empty cells are absent values. Throws std::runtime_error on malformed input
// or when offsets are not ascending.
std::vector<TelemetryFrame> load_telemetry_csv(const std::string &path);
std::vector<TelemetryFrame> parse_telemetry_csv(const std::string &text);
