#include "telemetry.h"
#include "utils.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

static double lerp(double a, double b, double t)
{
    return a + (b - a) * t;
}

template <typename T>
static std::optional<double> lerp_optional(const std::optional<T> &a, const std::optional<T> &b, double t)
{
    if (a && b)
        return lerp(static_cast<double>(*a), static_cast<double>(*b), t);
    if (a)
        return static_cast<double>(*a);
    if (b)
        return static_cast<double>(*b);
    return std::nullopt;
}

std::optional<TelemetryFrame> telemetry_at_time(const std::vector<TelemetryFrame> &frames,
                                                double videoTimeSeconds,
                                                double syncOffsetSeconds)
{
    if (frames.empty())
        return std::nullopt;
    if (!std::isfinite(videoTimeSeconds) || !std::isfinite(syncOffsetSeconds))
        return std::nullopt;

    double gpxTime = videoTimeSeconds + syncOffsetSeconds;
    if (!std::isfinite(gpxTime))
        return std::nullopt;
    if (gpxTime < frames.front().timeOffsetSeconds || gpxTime > frames.back().timeOffsetSeconds)
        return std::nullopt;

    size_t lo = 0;
    size_t hi = frames.size() - 1;
    while (lo + 1 < hi)
    {
        size_t mid = (lo + hi) / 2;
        if (frames[mid].timeOffsetSeconds <= gpxTime)
            lo = mid;
        else
            hi = mid;
    }

    const TelemetryFrame &before = frames[lo];
    const TelemetryFrame &after = frames[hi];
    if (lo == hi || after.timeOffsetSeconds == before.timeOffsetSeconds)
        return before;

    double t = (gpxTime - before.timeOffsetSeconds) / (after.timeOffsetSeconds - before.timeOffsetSeconds);

    TelemetryFrame out;
    out.timeOffsetSeconds = gpxTime;
    if (before.hr && after.hr)
        out.hr = static_cast<int>(std::lround(lerp(*before.hr, *after.hr, t)));
    else
        out.hr = before.hr ? before.hr : after.hr;
    out.paceSecondsPerKm = lerp_optional(before.paceSecondsPerKm, after.paceSecondsPerKm, t);
    out.distanceKm = lerp(before.distanceKm, after.distanceKm, t);
    out.elevationM = lerp_optional(before.elevationM, after.elevationM, t);
    out.movingTimeSeconds = lerp(before.movingTimeSeconds, after.movingTimeSeconds, t);
    out.elapsedTime = format_elapsed_time(gpxTime);
    return out;
}

std::string format_elapsed_time(double totalSeconds)
{
    if (!std::isfinite(totalSeconds) || totalSeconds < 0)
        totalSeconds = 0;
    long total = static_cast<long>(std::floor(totalSeconds));
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    long seconds = total % 60;

    char buf[32];
    if (hours > 0)
        snprintf(buf, sizeof(buf), "%ld:%02ld:%02ld", hours, minutes, seconds);
    else
        snprintf(buf, sizeof(buf), "%ld:%02ld", minutes, seconds);
    return buf;
}

std::string format_pace(double secondsPerKm)
{
    long rounded = std::lround(secondsPerKm);
    if (rounded < 0)
        rounded = 0;
    char buf[32];
    snprintf(buf, sizeof(buf), "%ld:%02ld", rounded / 60, rounded % 60);
    return buf;
}

static std::optional<double> parse_optional_number(const std::string &cell, size_t lineNo, const char *column)
{
    if (cell.empty())
        return std::nullopt;
    try
    {
        size_t used = 0;
        double v = std::stod(cell, &used);
        if (used != cell.size() || !std::isfinite(v))
            throw std::invalid_argument(cell);
        return v;
    }
    catch (const std::exception &)
    {
        throw std::runtime_error("telemetry line " + std::to_string(lineNo) + ": invalid " + column + " '" + cell + "'");
    }
}

std::vector<TelemetryFrame> parse_telemetry_csv(const std::string &text)
{
    std::vector<TelemetryFrame> frames;
    std::istringstream in(text);
    std::string line;
    size_t lineNo = 0;
    bool headerSeen = false;

    while (std::getline(in, line))
    {
        ++lineNo;
        line = trim_copy(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (!headerSeen)
        {
            headerSeen = true;
            if (startsWith(lowercase_copy(line), "time_offset"))
                continue;
        }

        std::vector<std::string> cells = split_csv_line(line);
        if (cells.size() < 4)
            throw std::runtime_error("telemetry line " + std::to_string(lineNo) + ": expected at least 4 columns");
        cells.resize(7);

        TelemetryFrame f;
        auto offset = parse_optional_number(cells[0], lineNo, "time_offset_s");
        if (!offset)
            throw std::runtime_error("telemetry line " + std::to_string(lineNo) + ": missing time_offset_s");
        f.timeOffsetSeconds = *offset;
        if (auto hr = parse_optional_number(cells[1], lineNo, "hr"))
            f.hr = static_cast<int>(std::lround(*hr));
        f.paceSecondsPerKm = parse_optional_number(cells[2], lineNo, "pace_s_per_km");
        f.distanceKm = parse_optional_number(cells[3], lineNo, "distance_km").value_or(0.0);
        f.elevationM = parse_optional_number(cells[4], lineNo, "elevation_m");
        f.elapsedTime = cells[5].empty() ? format_elapsed_time(f.timeOffsetSeconds) : cells[5];
        f.movingTimeSeconds = parse_optional_number(cells[6], lineNo, "moving_time_s").value_or(f.timeOffsetSeconds);

        if (!frames.empty() && f.timeOffsetSeconds < frames.back().timeOffsetSeconds)
            throw std::runtime_error("telemetry line " + std::to_string(lineNo) + ": time offsets must be ascending");
        frames.push_back(std::move(f));
    }
    return frames;
}

std::vector<TelemetryFrame> load_telemetry_csv(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("Cannot open telemetry file " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_telemetry_csv(ss.str());
}
