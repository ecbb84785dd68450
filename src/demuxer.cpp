#include "demuxer.h"
#include "ffmpeg_utils.h"
#include "logger.h"
#include "pipeline_error.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <cstring>

static constexpr int kAvioBufferSize = 64 * 1024;

struct MemoryReader
{
    const uint8_t *data = nullptr;
    size_t size = 0;
    size_t pos = 0;
};

static int memory_read(void *opaque, uint8_t *buf, int bufSize)
{
    auto *reader = static_cast<MemoryReader *>(opaque);
    size_t remaining = reader->size - reader->pos;
    if (remaining == 0)
        return AVERROR_EOF;
    size_t n = std::min(remaining, static_cast<size_t>(bufSize));
    std::memcpy(buf, reader->data + reader->pos, n);
    reader->pos += n;
    return static_cast<int>(n);
}

static int64_t memory_seek(void *opaque, int64_t offset, int whence)
{
    auto *reader = static_cast<MemoryReader *>(opaque);
    if (whence & AVSEEK_SIZE)
        return static_cast<int64_t>(reader->size);

    int64_t base = 0;
    switch (whence & ~AVSEEK_FORCE)
    {
    case SEEK_SET:
        base = 0;
        break;
    case SEEK_CUR:
        base = static_cast<int64_t>(reader->pos);
        break;
    case SEEK_END:
        base = static_cast<int64_t>(reader->size);
        break;
    default:
        return AVERROR(EINVAL);
    }

    int64_t target = base + offset;
    if (target < 0 || target > static_cast<int64_t>(reader->size))
        return AVERROR(EINVAL);
    reader->pos = static_cast<size_t>(target);
    return target;
}

// Open demuxer over a file path or an in-memory buffer
class InputContainer
{
public:
    explicit InputContainer(const MediaSource &source)
    {
        if (source.isFile())
        {
            ff_check(avformat_open_input(&m_fmt, source.path().c_str(), nullptr, nullptr), "open input");
            return;
        }

        const ByteBuffer &bytes = source.bytes();
        m_reader.data = bytes.data();
        m_reader.size = bytes.size();

        auto *buffer = static_cast<uint8_t *>(av_malloc(kAvioBufferSize));
        if (!buffer)
            throw std::runtime_error("Failed to allocate AVIO buffer");
        m_avio = avio_alloc_context(buffer, kAvioBufferSize, 0, &m_reader, memory_read, nullptr, memory_seek);
        if (!m_avio)
        {
            av_free(buffer);
            throw std::runtime_error("Failed to allocate AVIOContext");
        }

        m_fmt = avformat_alloc_context();
        if (!m_fmt)
        {
            release();
            throw std::runtime_error("Failed to allocate AVFormatContext");
        }
        m_fmt->pb = m_avio;
        m_fmt->flags |= AVFMT_FLAG_CUSTOM_IO;

        // On failure avformat_open_input frees the format context but leaves our AVIO alone
        int err = avformat_open_input(&m_fmt, source.name().c_str(), nullptr, nullptr);
        if (err < 0)
            release();
        ff_check(err, "open input");
    }

    ~InputContainer() { release(); }

    InputContainer(const InputContainer &) = delete;
    InputContainer &operator=(const InputContainer &) = delete;

    AVFormatContext *get() const { return m_fmt; }

private:
    void release()
    {
        if (m_fmt)
            avformat_close_input(&m_fmt);
        if (m_avio)
        {
            av_freep(&m_avio->buffer);
            avio_context_free(&m_avio);
        }
    }

    MemoryReader m_reader;
    AVFormatContext *m_fmt = nullptr;
    AVIOContext *m_avio = nullptr;
};

static bool mp4_can_carry(AVCodecID id)
{
    const AVOutputFormat *mp4 = av_guess_format("mp4", nullptr, nullptr);
    return mp4 && avformat_query_codec(mp4, id, FF_COMPLIANCE_NORMAL) == 1;
}

static TrackDescriptor describe_stream(AVFormatContext *fmt, AVStream *st)
{
    const AVCodecParameters *par = st->codecpar;
    TrackDescriptor track;
    track.codecId = par->codec_id;
    track.codecString = codec_string_from_parameters(par);
    track.codecFamily = codec_family_from_id(par->codec_id);
    if (par->extradata && par->extradata_size > 0)
        track.decoderDescription.assign(par->extradata, par->extradata + par->extradata_size);
    track.bitRate = par->bit_rate;

    if (par->codec_type == AVMEDIA_TYPE_VIDEO)
    {
        track.width = par->width;
        track.height = par->height;
        AVRational fr = av_guess_frame_rate(fmt, st, nullptr);
        track.frameRate = (fr.num > 0 && fr.den > 0) ? av_q2d(fr) : 0.0;
    }
    else
    {
        track.sampleRate = par->sample_rate;
        track.channels = par->ch_layout.nb_channels;
        track.frameSize = par->frame_size;
    }
    return track;
}

// Duration of one sample when the container does not store it
static int64_t nominal_duration_us(const TrackDescriptor &track)
{
    if (track.frameRate > 0.0)
        return std::max<int64_t>(1, std::llround(1e6 / track.frameRate));
    if (track.sampleRate > 0 && track.frameSize > 0)
        return std::max<int64_t>(1, av_rescale(track.frameSize, 1000000, track.sampleRate));
    return 1;
}

static void append_sample(std::vector<EncodedSample> &samples, const AVPacket *pkt, AVStream *st,
                          int64_t startUs, int64_t nominalUs)
{
    EncodedSample sample;
    sample.data.assign(pkt->data, pkt->data + pkt->size);
    sample.isRandomAccessPoint = (pkt->flags & AV_PKT_FLAG_KEY) != 0;

    int64_t pts = pkt->pts != AV_NOPTS_VALUE ? pkt->pts : pkt->dts;
    int64_t dts = pkt->dts != AV_NOPTS_VALUE ? pkt->dts : pkt->pts;
    if (pts == AV_NOPTS_VALUE)
    {
        // No timing at all: continue from the previous sample
        int64_t next = samples.empty() ? 0 : samples.back().timestampUs + samples.back().durationUs;
        sample.timestampUs = next;
        sample.decodeTimestampUs = samples.empty() ? next : samples.back().decodeTimestampUs + samples.back().durationUs;
    }
    else
    {
        sample.timestampUs = rescale_to_us(pts, st->time_base) - startUs;
        sample.decodeTimestampUs = rescale_to_us(dts, st->time_base) - startUs;
    }

    int64_t duration = pkt->duration > 0 ? rescale_to_us(pkt->duration, st->time_base) : nominalUs;
    sample.durationUs = std::max<int64_t>(1, duration);
    samples.push_back(std::move(sample));
}

DemuxResult demux(const MediaSource &source)
{
    std::unique_ptr<InputContainer> input;
    try
    {
        input = std::make_unique<InputContainer>(source);
        ff_check(avformat_find_stream_info(input->get(), nullptr), "find stream info");
    }
    catch (const std::runtime_error &e)
    {
        throw PipelineError(ErrorKind::ParseFailure, "Could not read the video container", e.what());
    }

    AVFormatContext *fmt = input->get();
    int videoIndex = av_find_best_stream(fmt, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (videoIndex < 0)
        throw PipelineError(ErrorKind::NoVideoTrack, "The file does not contain a video track");

    DemuxResult result;
    AVStream *vst = fmt->streams[videoIndex];
    result.videoTrack = describe_stream(fmt, vst);

    int audioIndex = av_find_best_stream(fmt, AVMEDIA_TYPE_AUDIO, -1, videoIndex, nullptr, 0);
    AVStream *ast = nullptr;
    if (audioIndex >= 0)
    {
        AVStream *candidate = fmt->streams[audioIndex];
        AVCodecID id = candidate->codecpar->codec_id;
        if (id == AV_CODEC_ID_NONE || !avcodec_find_decoder(id))
            LOG_WARN("Audio track has no usable codec configuration, continuing without audio");
        else if (!mp4_can_carry(id))
            LOG_WARN("Audio codec %s cannot be stored in MP4, continuing without audio", avcodec_get_name(id));
        else
        {
            ast = candidate;
            result.audioTrack = describe_stream(fmt, ast);
        }
    }

    for (unsigned i = 0; i < fmt->nb_streams; ++i)
    {
        if (fmt->streams[i] != vst && fmt->streams[i] != ast)
            fmt->streams[i]->discard = AVDISCARD_ALL;
    }

    int64_t startUs = fmt->start_time != AV_NOPTS_VALUE ? fmt->start_time : 0;
    int64_t videoNominal = nominal_duration_us(result.videoTrack);
    int64_t audioNominal = result.audioTrack ? nominal_duration_us(*result.audioTrack) : 1;

    PacketPtr pkt = make_packet();
    while (true)
    {
        int ret = av_read_frame(fmt, pkt.get());
        if (ret == AVERROR_EOF)
            break;
        if (ret < 0)
        {
            if (result.videoSamples.empty())
                throw PipelineError(ErrorKind::ParseFailure, "Could not read the video container", ff_error_string(ret));
            LOG_WARN("Stopped reading %s after %zu video samples: %s", source.name().c_str(),
                     result.videoSamples.size(), ff_error_string(ret).c_str());
            break;
        }

        if (pkt->stream_index == videoIndex)
            append_sample(result.videoSamples, pkt.get(), vst, startUs, videoNominal);
        else if (ast && pkt->stream_index == audioIndex)
            append_sample(result.audioSamples, pkt.get(), ast, startUs, audioNominal);
        av_packet_unref(pkt.get());
    }

    if (fmt->duration != AV_NOPTS_VALUE && fmt->duration > 0)
        result.durationSeconds = static_cast<double>(fmt->duration) / AV_TIME_BASE;
    else if (!result.videoSamples.empty())
    {
        int64_t endUs = 0;
        for (const auto &s : result.videoSamples)
            endUs = std::max(endUs, s.timestampUs + s.durationUs);
        result.durationSeconds = endUs / 1e6;
    }

    if (result.videoTrack.frameRate <= 0.0 && result.durationSeconds > 0.0 && !result.videoSamples.empty())
        result.videoTrack.frameRate = result.videoSamples.size() / result.durationSeconds;

    LOG_VERBOSE("Demuxed %s: %s %dx%d @ %.3f fps, %zu video samples, %zu audio samples (%s)",
                source.name().c_str(), result.videoTrack.codecString.c_str(), result.videoTrack.width,
                result.videoTrack.height, result.videoTrack.frameRate, result.videoSamples.size(),
                result.audioSamples.size(), result.audioTrack ? result.audioTrack->codecString.c_str() : "no audio");
    return result;
}

DemuxResult demux_with_fallback(const MediaSource &source,
                                IExternalTranscoder &transcoder,
                                const ProgressCallback &onProgress,
                                uint64_t repackMaxBytes,
                                MediaSource *usedSource)
{
    std::string firstFailure;
    try
    {
        DemuxResult result = demux(source);
        if (!result.videoSamples.empty())
        {
            if (usedSource)
                *usedSource = source;
            return result;
        }
        firstFailure = "no video samples found";
    }
    catch (const PipelineError &e)
    {
        firstFailure = e.detail().empty() ? e.what() : std::string(e.what()) + ": " + e.detail();
    }

    LOG_WARN("Could not parse %s (%s), trying to repair the container", source.name().c_str(), firstFailure.c_str());

    if (source.size() >= repackMaxBytes)
    {
        throw PipelineError(ErrorKind::ParseFailure,
                            "The video could not be read and is too large to repair automatically (limit " +
                                format_bytes(repackMaxBytes) + ")",
                            firstFailure);
    }

    if (onProgress)
    {
        ProcessingProgress p;
        p.phase = ProcessingPhase::Demuxing;
        p.percent = 0;
        onProgress(p);
    }

    MediaSource repacked = transcoder.repackContainer(source);

    std::string retryFailure;
    try
    {
        DemuxResult result = demux(repacked);
        if (!result.videoSamples.empty())
        {
            LOG_INFO("Container repaired, %zu video samples recovered", result.videoSamples.size());
            if (usedSource)
                *usedSource = repacked;
            return result;
        }
        retryFailure = "no video samples found";
    }
    catch (const PipelineError &e)
    {
        retryFailure = e.detail().empty() ? e.what() : std::string(e.what()) + ": " + e.detail();
    }

    throw PipelineError(ErrorKind::ParseFailure,
                        "The video could not be read and automatic repair did not succeed",
                        "first attempt: " + firstFailure + "\nafter repair: " + retryFailure);
}

VideoMeta describe_video(const DemuxResult &result, uint64_t fileSizeBytes)
{
    VideoMeta meta;
    meta.width = result.videoTrack.width;
    meta.height = result.videoTrack.height;
    meta.fps = result.videoTrack.frameRate > 0.0 ? result.videoTrack.frameRate : 30.0;
    meta.durationSeconds = result.durationSeconds;
    meta.fileSizeBytes = fileSizeBytes;
    meta.codecString = result.videoTrack.codecString;
    meta.codecFamily = result.videoTrack.codecFamily;
    return meta;
}
