#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <chrono>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "codec_negotiator.h"
#include "config_parser.h"
#include "container_writer.h"
#include "external_transcoder.h"
#include "ffmpeg_utils.h"
#include "frame_compositor.h"
#include "logger.h"
#include "media_source.h"
#include "overlay_renderer.h"
#include "pipeline_error.h"
#include "pipeline_orchestrator.h"
#include "telemetry.h"
#include "utils.h"
#include "video_codecs.h"

static std::atomic<bool> g_abort{false};

static void handle_interrupt(int)
{
    g_abort.store(true);
}

// Progress display, drawn on stderr so stdout stays free for piped output
static void show_progress(const ProcessingProgress &p)
{
    int bar_width = 50;
    int pos = bar_width * p.percent / 100;

    std::string bar = "[";
    bar.reserve(bar_width + 10);
    for (int i = 0; i < bar_width; ++i)
    {
        if (i < pos)
            bar += "=";
        else if (i == pos)
            bar += ">";
        else
            bar += " ";
    }
    bar += "] ";

    std::ostringstream oss;
    oss << bar;
    oss << std::setw(5) << std::fixed << std::setprecision(1) << static_cast<double>(p.percent) << "% ";
    oss << std::setw(10) << std::left << phase_name(p.phase) << std::right << " ";
    if (p.totalFrames > 0 && p.phase == ProcessingPhase::Processing)
        oss << "[" << p.framesProcessed << "/" << p.totalFrames << "] ";
    if (p.estimatedRemainingSeconds)
    {
        int remaining = static_cast<int>(*p.estimatedRemainingSeconds);
        oss << "ETA: " << std::setw(2) << std::setfill('0') << remaining / 60 << ":"
            << std::setw(2) << std::setfill('0') << remaining % 60;
    }

    fprintf(stderr, "\r\033[2K"); // Clear the entire line and move cursor to start
    fprintf(stderr, "%s", oss.str().c_str());
    fflush(stderr);
    Logger::instance().setProgressLineActive(p.phase != ProcessingPhase::Complete);
    if (p.phase == ProcessingPhase::Complete)
        fprintf(stderr, "\n");
}

static void write_output(const char *outputPath, const ByteBuffer &bytes)
{
    if (!is_pipe_output(outputPath))
    {
        write_file_bytes(outputPath, bytes);
        return;
    }

    size_t written = fwrite(bytes.data(), 1, bytes.size(), stdout);
    if (written != bytes.size() || fflush(stdout) != 0)
        throw std::runtime_error("Failed to write output to stdout");
}

int run_pipeline(const PipelineConfig &cfg)
{
    Logger::instance().setVerbose(cfg.verbose || cfg.debug);
    Logger::instance().setDebug(cfg.debug);
    install_ffmpeg_log_bridge(cfg.verbose, cfg.debug);

    LOG_VERBOSE("Starting telemetry overlay pipeline");
    LOG_DEBUG("Input: %s", cfg.inputPath);
    LOG_DEBUG("Output: %s", cfg.outputPath);
    LOG_DEBUG("Overlay: template=%s position=%s opacity=%.2f font=%d%%",
              cfg.overlay.templateId.c_str(), overlay_position_name(cfg.overlay.position),
              cfg.overlay.backgroundOpacity, cfg.overlay.fontSizePercent);

    try
    {
        PipelineRequest request;
        request.source = MediaSource::fromFile(cfg.inputPath);
        request.syncOffsetSeconds = cfg.syncOffsetSeconds;
        request.finalRemux = cfg.finalRemux;
        if (!cfg.telemetryPath.empty())
        {
            request.telemetry = load_telemetry_csv(cfg.telemetryPath);
            LOG_VERBOSE("Loaded %zu telemetry samples from %s", request.telemetry.size(), cfg.telemetryPath.c_str());
        }
        else
        {
            LOG_WARN("No telemetry given, the overlay will be empty");
        }

        FfmpegCapabilityProbe probe;
        FfmpegCliTranscoder transcoder(cfg.ffmpegBinary);
        PanelOverlayRenderer renderer;

        PipelineResources resources;
        resources.decoderFactory = ffmpeg_decoder_factory();
        resources.encoderFactory = ffmpeg_encoder_factory();
        resources.compositorFactory = sws_compositor_factory(renderer, cfg.overlay);
        resources.writerFactory = ffmpeg_mp4_writer_factory();
        resources.probe = &probe;
        resources.transcoder = &transcoder;

        PipelineOrchestrator orchestrator(resources, cfg.tuning);

        ProgressCallback onProgress;
        if (cfg.showProgress)
            onProgress = show_progress;

        auto start_time = std::chrono::steady_clock::now();
        ByteBuffer output = orchestrator.run(request, onProgress, g_abort);
        Logger::instance().setProgressLineActive(false);

        write_output(cfg.outputPath, output);

        auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count();
        const PipelineStats &stats = orchestrator.stats();
        double total_sec = total_ms / 1000.0;
        double avg_fps = (total_sec > 0) ? stats.framesEncoded / total_sec : 0.0;

        LOG_VERBOSE("Wrote %s to %s", format_bytes(output.size()).c_str(), cfg.outputPath);
        LOG_DEBUG("Processing completed in %.1fs @ %.1f fps", total_sec, avg_fps);
        LOG_DEBUG("Encoder: %s (%s, %s) %dx%d @ %lld bps",
                  stats.plan.encoderName.c_str(), stats.plan.chosenCodec.c_str(),
                  hardware_tier_name(stats.plan.hardwareTier), stats.plan.targetWidth,
                  stats.plan.targetHeight, static_cast<long long>(stats.plan.targetBitrate));
        LOG_DEBUG("Frame stats: submitted=%zu decoded=%zu encoded=%zu discarded=%zu gop=%d",
                  stats.samplesSubmitted, stats.framesDecoded, stats.framesEncoded,
                  stats.framesDiscarded, stats.gopSize);
        LOG_DEBUG("Pipeline path: %s%s", stats.streaming ? "streaming mux" : "buffered mux",
                  stats.repaired ? ", source repaired" : "");
        return 0;
    }
    catch (const PipelineError &ex)
    {
        Logger::instance().setProgressLineActive(false);
        fprintf(stderr, "\nError: %s\n", ex.what());
        if (!ex.detail().empty())
            fprintf(stderr, "%s\n", ex.detail().c_str());
        return ex.kind() == ErrorKind::Cancelled ? 130 : 2;
    }
    catch (const std::exception &ex)
    {
        Logger::instance().setProgressLineActive(false);
        fprintf(stderr, "\nError: %s\n", ex.what());
        return 2;
    }
}

int main(int argc, char **argv)
{
#ifdef _WIN32
    setvbuf(stderr, NULL, _IONBF, 0); /* win32 runtime needs this */
#endif

    PipelineConfig cfg;

    parse_arguments(argc, argv, &cfg);

    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    return run_pipeline(cfg);
}
