#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "container_writer.h"
#include "pipeline_types.h"

// Clamp timing the way the container expects it: timestamp >= 0, decode
// timestamp in [0, timestamp], duration >= 1
void sanitize_timing(int64_t &timestampUs, int64_t &decodeTimestampUs, int64_t &durationUs);

// Streaming session: video chunks are written as they are produced, audio at finalize.
// Chunks go through one ordered queue that is drained by a single consumer; the
// first write error is latched and reported by flushVideoQueue().
class StreamingMuxSession
{
public:
    StreamingMuxSession(ContainerWriterFactory writerFactory,
                        std::optional<TrackDescriptor> audioTrack,
                        double frameRate,
                        const std::atomic<bool> &abortFlag);

    // config must accompany the first chunk
    void enqueueVideoChunk(EncodedChunk chunk, const VideoDecoderConfig *config);

    // Write everything queued; throws PipelineError(MuxFailure) for a latched error unless aborted
    void flushVideoQueue();

    // Drain video, append audio, write the trailer. Progress: 40 after video, 40-90 audio, 95, 100.
    ByteBuffer finalize(const std::vector<EncodedSample> &audioSamples, const PercentCallback &onProgress);

    const std::optional<std::string> &error() const { return m_error; }
    size_t videoChunksWritten() const { return m_videoWritten; }

private:
    struct QueuedChunk
    {
        EncodedChunk chunk;
        std::optional<VideoDecoderConfig> config;
    };

    void drain();
    void writeChunk(QueuedChunk &item);
    void openWriter(const VideoDecoderConfig &config);

    ContainerWriterFactory m_writerFactory;
    std::unique_ptr<IContainerWriter> m_writer;
    std::optional<TrackDescriptor> m_audioTrack;
    double m_frameRate;
    const std::atomic<bool> &m_abortFlag;

    std::deque<QueuedChunk> m_queue;
    bool m_draining = false;
    bool m_started = false;
    bool m_finalized = false;
    std::optional<std::string> m_error;
    size_t m_videoWritten = 0;
};

class Mp4Muxer
{
public:
    explicit Mp4Muxer(ContainerWriterFactory writerFactory);

    // Buffered: audio+video, and one video-only retry when the container rejects
    // the audio path. Throws PipelineError(MuxFailure or EmptyOutput).
    ByteBuffer muxMp4(const DemuxResult &demux,
                      const std::vector<EncodedChunk> &chunks,
                      const VideoDecoderConfig &decoderConfig,
                      const VideoMeta &meta,
                      const PercentCallback &onProgress);

    std::unique_ptr<StreamingMuxSession> startStreamingSession(const DemuxResult &demux,
                                                               const VideoMeta &meta,
                                                               const std::atomic<bool> &abortFlag);

private:
    ByteBuffer writeBuffered(const DemuxResult &demux,
                             const std::vector<EncodedChunk> &chunks,
                             const VideoDecoderConfig &decoderConfig,
                             const VideoMeta &meta,
                             bool withAudio,
                             const PercentCallback &onProgress);

    ContainerWriterFactory m_writerFactory;
};
