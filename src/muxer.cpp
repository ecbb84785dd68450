#include "muxer.h"
#include "logger.h"
#include "pipeline_error.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

void sanitize_timing(int64_t &timestampUs, int64_t &decodeTimestampUs, int64_t &durationUs)
{
    timestampUs = std::max<int64_t>(0, timestampUs);
    decodeTimestampUs = std::clamp<int64_t>(decodeTimestampUs, 0, timestampUs);
    durationUs = std::max<int64_t>(1, durationUs);
}

static EncodedChunk sanitized(const EncodedChunk &chunk)
{
    EncodedChunk out = chunk;
    sanitize_timing(out.timestampUs, out.decodeTimestampUs, out.durationUs);
    return out;
}

static EncodedSample sanitized(const EncodedSample &sample)
{
    EncodedSample out = sample;
    sanitize_timing(out.timestampUs, out.decodeTimestampUs, out.durationUs);
    return out;
}

// Calls onProgress only when the value changes
class PercentReporter
{
public:
    explicit PercentReporter(const PercentCallback &cb) : m_cb(cb) {}

    void operator()(int percent)
    {
        if (!m_cb || percent == m_last)
            return;
        m_last = percent;
        m_cb(percent);
    }

private:
    const PercentCallback &m_cb;
    int m_last = -1;
};

StreamingMuxSession::StreamingMuxSession(ContainerWriterFactory writerFactory,
                                         std::optional<TrackDescriptor> audioTrack,
                                         double frameRate,
                                         const std::atomic<bool> &abortFlag)
    : m_writerFactory(std::move(writerFactory)), m_audioTrack(std::move(audioTrack)),
      m_frameRate(frameRate), m_abortFlag(abortFlag)
{
}

void StreamingMuxSession::enqueueVideoChunk(EncodedChunk chunk, const VideoDecoderConfig *config)
{
    QueuedChunk item;
    item.chunk = std::move(chunk);
    if (config)
        item.config = *config;
    m_queue.push_back(std::move(item));

    // A chunk produced while the queue is being written is picked up by the running drain
    if (!m_draining)
        drain();
}

void StreamingMuxSession::drain()
{
    m_draining = true;
    while (!m_queue.empty())
    {
        QueuedChunk item = std::move(m_queue.front());
        m_queue.pop_front();
        if (m_error || m_abortFlag.load())
            continue;
        try
        {
            writeChunk(item);
        }
        catch (const std::exception &e)
        {
            m_error = e.what();
            LOG_DEBUG("Streaming mux error latched: %s", e.what());
        }
    }
    m_draining = false;
}

void StreamingMuxSession::openWriter(const VideoDecoderConfig &config)
{
    if (m_audioTrack)
    {
        try
        {
            m_writer = m_writerFactory();
            m_writer->addVideoTrack(config, m_frameRate);
            m_writer->addAudioTrack(*m_audioTrack);
            m_writer->start();
            return;
        }
        catch (const ContainerMuxError &e)
        {
            LOG_WARN("Audio track rejected by the container (%s), continuing without audio", e.what());
            m_audioTrack.reset();
        }
    }

    m_writer = m_writerFactory();
    m_writer->addVideoTrack(config, m_frameRate);
    m_writer->start();
}

void StreamingMuxSession::writeChunk(QueuedChunk &item)
{
    if (!m_started)
    {
        if (!item.config)
            throw ContainerMuxError("first video chunk carries no decoder configuration");
        openWriter(*item.config);
        m_started = true;
    }
    m_writer->writeVideo(sanitized(item.chunk));
    ++m_videoWritten;
}

void StreamingMuxSession::flushVideoQueue()
{
    if (!m_draining)
        drain();
    if (m_error && !m_abortFlag.load())
        throw PipelineError(ErrorKind::MuxFailure, "Streaming mux failed while writing video packets: " + *m_error);
}

ByteBuffer StreamingMuxSession::finalize(const std::vector<EncodedSample> &audioSamples, const PercentCallback &onProgress)
{
    if (m_finalized)
        throw std::logic_error("StreamingMuxSession finalized twice");
    m_finalized = true;

    flushVideoQueue();
    if (!m_started || m_videoWritten == 0)
        throw PipelineError(ErrorKind::EmptyOutput, "No video frames were written to the output");

    PercentReporter report(onProgress);
    report(40);

    try
    {
        if (m_audioTrack && !audioSamples.empty())
        {
            size_t done = 0;
            for (const EncodedSample &sample : audioSamples)
            {
                m_writer->writeAudio(sanitized(sample));
                ++done;
                int pct = 40 + static_cast<int>(std::lround(static_cast<double>(done) / audioSamples.size() * 50.0));
                report(std::min(90, pct));
            }
        }
        report(95);

        ByteBuffer bytes = m_writer->finalize();
        if (bytes.empty())
            throw PipelineError(ErrorKind::EmptyOutput, "The muxer produced an empty file");
        report(100);
        return bytes;
    }
    catch (const ContainerMuxError &e)
    {
        throw PipelineError(ErrorKind::MuxFailure, "Could not finalize the output container", e.what());
    }
}

Mp4Muxer::Mp4Muxer(ContainerWriterFactory writerFactory)
    : m_writerFactory(std::move(writerFactory))
{
}

ByteBuffer Mp4Muxer::writeBuffered(const DemuxResult &demux,
                                   const std::vector<EncodedChunk> &chunks,
                                   const VideoDecoderConfig &decoderConfig,
                                   const VideoMeta &meta,
                                   bool withAudio,
                                   const PercentCallback &onProgress)
{
    PercentReporter report(onProgress);

    std::unique_ptr<IContainerWriter> writer = m_writerFactory();
    writer->addVideoTrack(decoderConfig, meta.fps);
    if (withAudio)
        writer->addAudioTrack(*demux.audioTrack);
    writer->start();
    report(2);

    const std::vector<EncodedSample> noAudio;
    const std::vector<EncodedSample> &audio = withAudio ? demux.audioSamples : noAudio;
    size_t total = chunks.size() + audio.size();
    size_t done = 0;
    size_t vi = 0;
    size_t ai = 0;

    // Interleave by decode time
    while (vi < chunks.size() || ai < audio.size())
    {
        bool takeVideo = ai >= audio.size() ||
                         (vi < chunks.size() && chunks[vi].decodeTimestampUs <= audio[ai].decodeTimestampUs);
        if (takeVideo)
            writer->writeVideo(sanitized(chunks[vi++]));
        else
            writer->writeAudio(sanitized(audio[ai++]));

        ++done;
        report(std::min(95, static_cast<int>(std::lround(static_cast<double>(done) / total * 95.0))));
    }

    report(98);
    ByteBuffer bytes = writer->finalize();
    if (bytes.empty())
        throw PipelineError(ErrorKind::EmptyOutput, "The muxer produced an empty file");
    report(100);
    return bytes;
}

ByteBuffer Mp4Muxer::muxMp4(const DemuxResult &demux,
                            const std::vector<EncodedChunk> &chunks,
                            const VideoDecoderConfig &decoderConfig,
                            const VideoMeta &meta,
                            const PercentCallback &onProgress)
{
    if (chunks.empty())
        throw PipelineError(ErrorKind::EmptyOutput, "No video frames were encoded");

    bool withAudio = demux.audioTrack.has_value();
    try
    {
        return writeBuffered(demux, chunks, decoderConfig, meta, withAudio, onProgress);
    }
    catch (const ContainerMuxError &e)
    {
        if (!withAudio)
            throw PipelineError(ErrorKind::MuxFailure, "Could not write the output container", e.what());
        LOG_WARN("Muxing with audio failed (%s), retrying video-only", e.what());
    }

    try
    {
        return writeBuffered(demux, chunks, decoderConfig, meta, false, onProgress);
    }
    catch (const ContainerMuxError &e)
    {
        throw PipelineError(ErrorKind::MuxFailure, "Could not write the output container", e.what());
    }
}

std::unique_ptr<StreamingMuxSession> Mp4Muxer::startStreamingSession(const DemuxResult &demux,
                                                                     const VideoMeta &meta,
                                                                     const std::atomic<bool> &abortFlag)
{
    LOG_VERBOSE("Streaming mux session started (%s audio)", demux.audioTrack ? "with" : "without");
    return std::make_unique<StreamingMuxSession>(m_writerFactory, demux.audioTrack, meta.fps, abortFlag);
}
