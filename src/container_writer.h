#pragma once

#include <functional>
#include <memory>

#include "pipeline_types.h"

// Sequential MP4 writer: tracks, then start(), then packets, then finalize().
// Every failure of the container layer is raised as ContainerMuxError.
class IContainerWriter
{
public:
    virtual ~IContainerWriter() = default;

    virtual void addVideoTrack(const VideoDecoderConfig &config, double frameRate) = 0;
    virtual void addAudioTrack(const TrackDescriptor &track) = 0;
    virtual void start() = 0;
    virtual void writeVideo(const EncodedChunk &chunk) = 0;
    virtual void writeAudio(const EncodedSample &sample) = 0;
    // Writes the trailer and hands over the finished file
    virtual ByteBuffer finalize() = 0;
};

using ContainerWriterFactory = std::function<std::unique_ptr<IContainerWriter>()>;

// libavformat mp4 muxer writing into a seekable in-memory buffer
class FfmpegMp4Writer : public IContainerWriter
{
public:
    FfmpegMp4Writer();
    ~FfmpegMp4Writer() override;

    FfmpegMp4Writer(const FfmpegMp4Writer &) = delete;
    FfmpegMp4Writer &operator=(const FfmpegMp4Writer &) = delete;

    void addVideoTrack(const VideoDecoderConfig &config, double frameRate) override;
    void addAudioTrack(const TrackDescriptor &track) override;
    void start() override;
    void writeVideo(const EncodedChunk &chunk) override;
    void writeAudio(const EncodedSample &sample) override;
    ByteBuffer finalize() override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

ContainerWriterFactory ffmpeg_mp4_writer_factory();
