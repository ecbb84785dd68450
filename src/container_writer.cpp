#include "container_writer.h"
#include "ffmpeg_utils.h"
#include "logger.h"
#include "pipeline_error.h"
#include "utils.h"

#include <algorithm>
#include <cstring>

static constexpr int kAvioBufferSize = 64 * 1024;

// write_packet takes a const buffer from libavformat 61 on
#if LIBAVFORMAT_VERSION_MAJOR >= 61
#define AVIO_WRITE_BUF const uint8_t *
#else
#define AVIO_WRITE_BUF uint8_t *
#endif

struct MemoryWriter
{
    ByteBuffer data;
    size_t pos = 0;
};

static int memory_write(void *opaque, AVIO_WRITE_BUF buf, int size)
{
    auto *writer = static_cast<MemoryWriter *>(opaque);
    size_t end = writer->pos + static_cast<size_t>(size);
    if (end > writer->data.size())
        writer->data.resize(end);
    std::memcpy(writer->data.data() + writer->pos, buf, size);
    writer->pos = end;
    return size;
}

static int64_t memory_seek(void *opaque, int64_t offset, int whence)
{
    auto *writer = static_cast<MemoryWriter *>(opaque);
    if (whence & AVSEEK_SIZE)
        return static_cast<int64_t>(writer->data.size());

    int64_t base = 0;
    switch (whence & ~AVSEEK_FORCE)
    {
    case SEEK_SET:
        base = 0;
        break;
    case SEEK_CUR:
        base = static_cast<int64_t>(writer->pos);
        break;
    case SEEK_END:
        base = static_cast<int64_t>(writer->data.size());
        break;
    default:
        return AVERROR(EINVAL);
    }
    int64_t target = base + offset;
    if (target < 0)
        return AVERROR(EINVAL);
    writer->pos = static_cast<size_t>(target);
    return target;
}

static void mux_check(int err, const char *what)
{
    if (err < 0)
        throw ContainerMuxError(std::string(what) + ": " + ff_error_string(err));
}

static void set_extradata(AVCodecParameters *par, const ByteBuffer &data)
{
    if (data.empty())
        return;
    par->extradata = static_cast<uint8_t *>(av_mallocz(data.size() + AV_INPUT_BUFFER_PADDING_SIZE));
    if (!par->extradata)
        throw std::runtime_error("av_mallocz failed");
    std::memcpy(par->extradata, data.data(), data.size());
    par->extradata_size = static_cast<int>(data.size());
}

struct FfmpegMp4Writer::Impl
{
    MemoryWriter sink;
    AVFormatContext *fmt = nullptr;
    AVIOContext *avio = nullptr;
    AVStream *video = nullptr;
    AVStream *audio = nullptr;
    int64_t lastVideoDts = AV_NOPTS_VALUE;
    int64_t lastAudioDts = AV_NOPTS_VALUE;
    bool headerWritten = false;
    bool finished = false;
    PacketPtr pkt{nullptr, &av_packet_free_single};

    ~Impl()
    {
        if (fmt)
            avformat_free_context(fmt);
        if (avio)
        {
            av_freep(&avio->buffer);
            avio_context_free(&avio);
        }
    }

    void write(AVStream *st, int64_t &lastDts, const uint8_t *data, size_t size,
               int64_t ptsUs, int64_t dtsUs, int64_t durationUs, bool key, const char *label)
    {
        if (!headerWritten)
            throw ContainerMuxError(std::string("write ") + label + " packet before header");

        av_packet_unref(pkt.get());
        mux_check(av_new_packet(pkt.get(), static_cast<int>(size)), "allocate packet");
        if (size > 0)
            std::memcpy(pkt->data, data, size);
        pkt->stream_index = st->index;
        pkt->pts = ptsUs;
        pkt->dts = dtsUs;
        pkt->duration = durationUs;
        if (key)
            pkt->flags |= AV_PKT_FLAG_KEY;
        av_packet_rescale_ts(pkt.get(), kMicrosecondTimeBase, st->time_base);
        if (pkt->duration <= 0)
            pkt->duration = 1;

        // DTS monotonicity fix (mirrors fftools/ffmpeg_mux.c:mux_fixup_ts)
        if (lastDts != AV_NOPTS_VALUE && pkt->dts != AV_NOPTS_VALUE)
        {
            int64_t minDts = lastDts + 1;
            if (pkt->dts < minDts)
            {
                LOG_DEBUG("DTS monotonicity: adjusting %s packet DTS from %lld to %lld", label,
                          static_cast<long long>(pkt->dts), static_cast<long long>(minDts));
                pkt->dts = minDts;
                if (pkt->pts != AV_NOPTS_VALUE && pkt->pts < pkt->dts)
                    pkt->pts = pkt->dts;
            }
        }
        lastDts = pkt->dts;

        int err = av_write_frame(fmt, pkt.get());
        av_packet_unref(pkt.get());
        if (err < 0)
            throw ContainerMuxError(std::string("write ") + label + " packet: " + ff_error_string(err));
    }
};

FfmpegMp4Writer::FfmpegMp4Writer() : m_impl(std::make_unique<Impl>())
{
    mux_check(avformat_alloc_output_context2(&m_impl->fmt, nullptr, "mp4", nullptr), "alloc output context");
    if (!m_impl->fmt)
        throw ContainerMuxError("Failed to allocate output format context");

    auto *buffer = static_cast<uint8_t *>(av_malloc(kAvioBufferSize));
    if (!buffer)
        throw std::runtime_error("Failed to allocate AVIO buffer");
    m_impl->avio = avio_alloc_context(buffer, kAvioBufferSize, 1, &m_impl->sink, nullptr, memory_write, memory_seek);
    if (!m_impl->avio)
    {
        av_free(buffer);
        throw std::runtime_error("Failed to allocate AVIOContext");
    }
    m_impl->fmt->pb = m_impl->avio;
    m_impl->fmt->flags |= AVFMT_FLAG_CUSTOM_IO;
    m_impl->pkt = make_packet();
}

FfmpegMp4Writer::~FfmpegMp4Writer() = default;

void FfmpegMp4Writer::addVideoTrack(const VideoDecoderConfig &config, double frameRate)
{
    if (m_impl->video)
        throw ContainerMuxError("video track already added");

    AVStream *st = avformat_new_stream(m_impl->fmt, nullptr);
    if (!st)
        throw ContainerMuxError("Failed to create video stream");

    AVCodecParameters *par = st->codecpar;
    par->codec_type = AVMEDIA_TYPE_VIDEO;
    par->codec_id = config.codecId;
    par->width = config.width;
    par->height = config.height;
    set_extradata(par, config.description);
    if (startsWith(config.codecString, "hvc1"))
        par->codec_tag = MKTAG('h', 'v', 'c', '1');
    else if (startsWith(config.codecString, "hev1"))
        par->codec_tag = MKTAG('h', 'e', 'v', '1');

    st->time_base = kMicrosecondTimeBase;
    if (frameRate > 0.0)
        st->avg_frame_rate = av_d2q(frameRate, 1000000);
    m_impl->video = st;
    LOG_DEBUG("Output video track: %s %dx%d", config.codecString.c_str(), config.width, config.height);
}

void FfmpegMp4Writer::addAudioTrack(const TrackDescriptor &track)
{
    if (m_impl->audio)
        throw ContainerMuxError("audio track already added");
    if (avformat_query_codec(m_impl->fmt->oformat, track.codecId, FF_COMPLIANCE_NORMAL) != 1)
        throw ContainerMuxError(std::string("audio codec ") + avcodec_get_name(track.codecId) + " is not supported in MP4");

    AVStream *st = avformat_new_stream(m_impl->fmt, nullptr);
    if (!st)
        throw ContainerMuxError("Failed to create audio stream");

    AVCodecParameters *par = st->codecpar;
    par->codec_type = AVMEDIA_TYPE_AUDIO;
    par->codec_id = track.codecId;
    par->sample_rate = track.sampleRate;
    par->frame_size = track.frameSize;
    par->bit_rate = track.bitRate;
    av_channel_layout_default(&par->ch_layout, track.channels > 0 ? track.channels : 2);
    set_extradata(par, track.decoderDescription);

    st->time_base = track.sampleRate > 0 ? AVRational{1, track.sampleRate} : kMicrosecondTimeBase;
    m_impl->audio = st;
    LOG_DEBUG("Output audio track: %s %d Hz, %d channels", track.codecString.c_str(), track.sampleRate, track.channels);
}

void FfmpegMp4Writer::start()
{
    if (!m_impl->video)
        throw ContainerMuxError("write header: no video track");
    mux_check(avformat_write_header(m_impl->fmt, nullptr), "write header");
    m_impl->headerWritten = true;
}

void FfmpegMp4Writer::writeVideo(const EncodedChunk &chunk)
{
    m_impl->write(m_impl->video, m_impl->lastVideoDts, chunk.data.data(), chunk.data.size(),
                  chunk.timestampUs, chunk.decodeTimestampUs, chunk.durationUs, chunk.isKey, "video");
}

void FfmpegMp4Writer::writeAudio(const EncodedSample &sample)
{
    if (!m_impl->audio)
        throw ContainerMuxError("write audio packet: no audio track");
    m_impl->write(m_impl->audio, m_impl->lastAudioDts, sample.data.data(), sample.data.size(),
                  sample.timestampUs, sample.decodeTimestampUs, sample.durationUs, sample.isRandomAccessPoint, "audio");
}

ByteBuffer FfmpegMp4Writer::finalize()
{
    if (!m_impl->headerWritten)
        throw ContainerMuxError("write trailer: header was never written");
    if (m_impl->finished)
        throw ContainerMuxError("write trailer: already finalized");

    mux_check(av_write_trailer(m_impl->fmt), "write trailer");
    avio_flush(m_impl->avio);
    m_impl->finished = true;
    LOG_VERBOSE("MP4 finalized: %s", format_bytes(m_impl->sink.data.size()).c_str());
    return std::move(m_impl->sink.data);
}

ContainerWriterFactory ffmpeg_mp4_writer_factory()
{
    return []() -> std::unique_ptr<IContainerWriter>
    { return std::make_unique<FfmpegMp4Writer>(); };
}
