#include "external_transcoder.h"
#include "logger.h"
#include "pipeline_error.h"
#include "utils.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

static constexpr std::chrono::milliseconds kPollInterval{200};

#ifdef _WIN32
// Quote one argument for a CreateProcess command line
static std::string quote_windows_arg(const std::string &arg)
{
    if (arg.empty())
        return "\"\"";

    bool needs_quotes = arg.find_first_of(" \t\"") != std::string::npos;
    if (!needs_quotes)
        return arg;

    std::string result;
    result.reserve(arg.size() + 2);
    result.push_back('"');

    size_t backslash_count = 0;
    for (char ch : arg)
    {
        if (ch == '\\')
        {
            ++backslash_count;
        }
        else if (ch == '"')
        {
            result.append(backslash_count * 2 + 1, '\\');
            result.push_back('"');
            backslash_count = 0;
        }
        else
        {
            if (backslash_count > 0)
            {
                result.append(backslash_count, '\\');
                backslash_count = 0;
            }
            result.push_back(ch);
        }
    }

    if (backslash_count > 0)
        result.append(backslash_count * 2, '\\');

    result.push_back('"');
    return result;
}

static std::string format_windows_error(DWORD error_code)
{
    LPSTR buffer = nullptr;
    DWORD size = FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, error_code, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
        reinterpret_cast<LPSTR>(&buffer), 0, nullptr);

    std::string message = (size != 0 && buffer) ? std::string(buffer, size) : "Unknown error";
    while (!message.empty() && (message.back() == '\r' || message.back() == '\n'))
        message.pop_back();
    if (buffer)
        LocalFree(buffer);
    return message;
}
#endif

std::vector<std::string> read_log_tail(const std::string &path, size_t maxLines)
{
    std::deque<std::string> tail;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line))
    {
        line = trim_copy(line);
        // ffmpeg rewrites its status line with \r; keep only the last segment
        size_t cr = line.find_last_of('\r');
        if (cr != std::string::npos)
            line = trim_copy(line.substr(cr + 1));
        if (line.empty())
            continue;
        tail.push_back(line);
        if (tail.size() > maxLines)
            tail.pop_front();
    }
    return {tail.begin(), tail.end()};
}

int parse_progress_percent(const std::string &progressText, double durationSeconds)
{
    if (durationSeconds <= 0)
        return -1;

    // -progress emits blocks of key=value; out_time_us is the output position
    size_t pos = progressText.rfind("out_time_us=");
    if (pos == std::string::npos)
        return -1;
    long long outUs = std::atoll(progressText.c_str() + pos + std::strlen("out_time_us="));
    if (outUs < 0)
        return -1;
    double percent = 100.0 * (outUs / 1e6) / durationSeconds;
    return static_cast<int>(std::clamp(std::lround(percent), 0L, 100L));
}

FfmpegCliTranscoder::FfmpegCliTranscoder(std::string ffmpegBinary)
    : m_binary(std::move(ffmpegBinary))
{
}

std::vector<std::string> FfmpegCliTranscoder::repackArguments(const std::string &input, const std::string &output)
{
    return {"-hide_banner", "-nostdin", "-y",
            "-i", input,
            "-c", "copy",
            "-map_metadata", "-1",
            output};
}

std::vector<std::string> FfmpegCliTranscoder::forcedKeyframeArguments(const std::string &input, const std::string &output,
                                                                      int gopSize, bool copyAudio)
{
    std::string gop = std::to_string(std::max(1, gopSize));
    std::vector<std::string> args = {
        "-hide_banner", "-nostdin", "-y",
        "-i", input,
        "-c:v", "libx264",
        "-preset", "ultrafast",
        "-crf", "23",
        "-tune", "zerolatency",
        "-pix_fmt", "yuv420p",
        "-g", gop,
        "-keyint_min", gop,
        "-sc_threshold", "0",
        "-bf", "0",
        "-refs", "1",
        "-x264-params", "keyint=" + gop + ":min-keyint=" + gop + ":scenecut=0:open-gop=0",
        "-force_key_frames", "expr:gte(t,n_forced*1)",
        "-movflags", "+faststart"};

    if (copyAudio)
    {
        args.insert(args.end(), {"-c:a", "copy"});
    }
    else
    {
        args.insert(args.end(), {"-c:a", "aac", "-b:a", "256k"});
    }
    args.push_back(output);
    return args;
}

FfmpegCliTranscoder::RunResult FfmpegCliTranscoder::run(const std::vector<std::string> &args, const std::string &label,
                                                        double durationSeconds, const PercentCallback &onProgress)
{
    const std::string logPath = make_temp_path(".log");
    const std::string progressPath = make_temp_path(".progress");

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 3);
    argv_storage.push_back(m_binary);
    argv_storage.insert(argv_storage.end(), {"-progress", progressPath});
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    LOG_VERBOSE("Running ffmpeg %s", label.c_str());
    if (Logger::instance().debugEnabled())
    {
        std::string cmd;
        for (const auto &a : argv_storage)
            cmd += (cmd.empty() ? "" : " ") + a;
        LOG_DEBUG("ffmpeg command: %s", cmd.c_str());
    }

    int lastPercent = -1;
    auto poll_progress = [&]()
    {
        if (!onProgress)
            return;
        std::ifstream in(progressPath);
        if (!in)
            return;
        std::stringstream ss;
        ss << in.rdbuf();
        int percent = parse_progress_percent(ss.str(), durationSeconds);
        if (percent >= 0 && percent != lastPercent)
        {
            lastPercent = percent;
            onProgress(percent);
        }
    };

    RunResult result;

#ifdef _WIN32
    std::string command_line;
    for (size_t i = 0; i < argv_storage.size(); ++i)
    {
        if (i > 0)
            command_line.push_back(' ');
        command_line.append(quote_windows_arg(argv_storage[i]));
    }
    std::vector<char> command_line_buffer(command_line.begin(), command_line.end());
    command_line_buffer.push_back('\0');

    SECURITY_ATTRIBUTES sa;
    ZeroMemory(&sa, sizeof(sa));
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    HANDLE log_handle = CreateFileA(logPath.c_str(), GENERIC_WRITE, FILE_SHARE_READ, &sa,
                                    CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (log_handle == INVALID_HANDLE_VALUE)
        throw PipelineError(ErrorKind::TranscodeFailure, "Cannot create transcoder log file",
                            format_windows_error(GetLastError()));

    STARTUPINFOA si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    ZeroMemory(&pi, sizeof(pi));
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = nullptr;
    si.hStdOutput = log_handle;
    si.hStdError = log_handle;

    BOOL success = CreateProcessA(nullptr, command_line_buffer.data(), nullptr, nullptr, TRUE,
                                  CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);
    CloseHandle(log_handle);
    if (!success)
    {
        DWORD err = GetLastError();
        throw PipelineError(ErrorKind::TranscodeFailure, "Failed to launch " + m_binary,
                            format_windows_error(err));
    }

    while (WaitForSingleObject(pi.hProcess, static_cast<DWORD>(kPollInterval.count())) == WAIT_TIMEOUT)
        poll_progress();

    DWORD exit_code = 1;
    if (!GetExitCodeProcess(pi.hProcess, &exit_code))
        exit_code = 1;
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    result.exitCode = static_cast<int>(exit_code);
#else
    std::vector<char *> exec_argv;
    exec_argv.reserve(argv_storage.size() + 1);
    for (auto &stored : argv_storage)
        exec_argv.push_back(const_cast<char *>(stored.c_str()));
    exec_argv.push_back(nullptr);

    int log_fd = open(logPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (log_fd < 0)
        throw PipelineError(ErrorKind::TranscodeFailure, "Cannot create transcoder log file", std::strerror(errno));

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        close(log_fd);
        throw PipelineError(ErrorKind::TranscodeFailure, "Failed to fork for ffmpeg", std::strerror(err));
    }
    if (pid == 0)
    {
        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0)
            dup2(null_fd, STDIN_FILENO);
        dup2(log_fd, STDOUT_FILENO);
        dup2(log_fd, STDERR_FILENO);
        execvp(m_binary.c_str(), exec_argv.data());
        fprintf(stderr, "Failed to exec '%s': %s\n", m_binary.c_str(), std::strerror(errno));
        _exit(127);
    }
    close(log_fd);

    int status = 0;
    while (true)
    {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid)
            break;
        if (r < 0)
        {
            if (errno == EINTR)
                continue;
            int err = errno;
            throw PipelineError(ErrorKind::TranscodeFailure, "Failed to wait for ffmpeg", std::strerror(err));
        }
        poll_progress();
        std::this_thread::sleep_for(kPollInterval);
    }

    if (WIFEXITED(status))
        result.exitCode = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exitCode = 128 + WTERMSIG(status);
    else
        result.exitCode = 1;
#endif

    poll_progress();
    result.logTail = read_log_tail(logPath, kTranscoderLogTailLines);

    std::error_code ec;
    std::filesystem::remove(logPath, ec);
    std::filesystem::remove(progressPath, ec);

    if (result.exitCode != 0)
    {
        LOG_WARN("ffmpeg %s failed with exit code %d", label.c_str(), result.exitCode);
        for (const auto &line : result.logTail)
            LOG_DEBUG("[ffmpeg %s] %s", label.c_str(), line.c_str());
    }
    return result;
}

static std::string join_lines(const std::vector<std::string> &lines)
{
    std::string out;
    for (const auto &l : lines)
    {
        if (!out.empty())
            out.push_back('\n');
        out += l;
    }
    return out;
}

// Materialize an in-memory source as a temporary file the child process can read
static MediaSource stage_input(const MediaSource &input)
{
    if (input.isFile())
        return input;
    std::string path = make_temp_path(".input");
    write_file_bytes(path, input.bytes());
    return MediaSource::fromTemporaryFile(path);
}

static bool output_ready(const std::string &path)
{
    std::error_code ec;
    return std::filesystem::exists(path, ec) && std::filesystem::file_size(path, ec) > 0 && !ec;
}

static void discard_output(const std::string &path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

MediaSource FfmpegCliTranscoder::repackContainer(const MediaSource &input)
{
    MediaSource staged = stage_input(input);
    std::string output = make_temp_path(".mp4");

    LOG_INFO("Repacking container of %s (%s)", input.name().c_str(), format_bytes(input.size()).c_str());
    RunResult r = run(repackArguments(staged.path(), output), "repack", 0.0, {});
    if (r.exitCode != 0 || !output_ready(output))
    {
        discard_output(output);
        throw PipelineError(ErrorKind::TranscodeFailure,
                            "Container repack failed (ffmpeg exit code " + std::to_string(r.exitCode) + ")",
                            join_lines(r.logTail));
    }
    return MediaSource::fromTemporaryFile(output);
}

MediaSource FfmpegCliTranscoder::transcodeWithForcedKeyframes(const MediaSource &input,
                                                              const ForcedKeyframeOptions &options,
                                                              const PercentCallback &onProgress)
{
    MediaSource staged = stage_input(input);
    std::string output = make_temp_path(".keyframes.mp4");
    std::vector<std::string> attemptLogs;

    LOG_INFO("Re-encoding %s with a keyframe every %d frames", input.name().c_str(), options.gopSize);

    static const bool audioModes[] = {true, false};
    for (bool copyAudio : audioModes)
    {
        const char *label = copyAudio ? "audio-copy" : "audio-aac";
        RunResult r = run(forcedKeyframeArguments(staged.path(), output, options.gopSize, copyAudio),
                          label, options.durationSeconds, onProgress);
        if (r.exitCode == 0 && output_ready(output))
            return MediaSource::fromTemporaryFile(output);

        attemptLogs.push_back(std::string("[") + label + "]\n" + join_lines(r.logTail));
        discard_output(output);
    }

    std::string detail;
    for (const auto &log : attemptLogs)
        detail += (detail.empty() ? "" : "\n\n") + log;
    throw PipelineError(ErrorKind::TranscodeFailure, "FFmpeg transcode failed for both audio modes", detail);
}
