#include "bitstream_inspector.h"

#include <algorithm>
#include <cmath>

static constexpr int kMinGop = 1;
static constexpr int kMaxGop = 300;

static uint32_t read_be(const uint8_t *p, int bytes)
{
    uint32_t v = 0;
    for (int i = 0; i < bytes; ++i)
        v = (v << 8) | p[i];
    return v;
}

int nal_length_size_from_description(CodecFamily family, const ByteBuffer &description)
{
    // Both records start with configurationVersion = 1; Annex-B extradata does not
    if (description.empty() || description[0] != 1)
        return 0;
    if (family == CodecFamily::Avc && description.size() >= 5)
        return (description[4] & 0x03) + 1;
    if (family == CodecFamily::Hevc && description.size() >= 22)
        return (description[21] & 0x03) + 1;
    return 0;
}

int probe_nal_length_size(const uint8_t *data, size_t size)
{
    if (!data || size < 5)
        return 0;

    static const int candidates[] = {4, 3, 2, 1};
    for (int lengthSize : candidates)
    {
        if (size <= static_cast<size_t>(lengthSize))
            continue;

        size_t nalSize = read_be(data, lengthSize);
        if (nalSize == 0 || lengthSize + nalSize > size)
            continue;

        size_t next = lengthSize + nalSize;
        if (next + lengthSize > size)
            return lengthSize; // single NAL filling the sample

        size_t nextSize = read_be(data + next, lengthSize);
        if (nextSize > 0 && next + lengthSize + nextSize <= size)
            return lengthSize;
    }
    return 0;
}

bool is_keyframe_nal(uint8_t nalHeader, CodecFamily family)
{
    if (family == CodecFamily::Avc)
        return (nalHeader & 0x1f) == 5;
    if (family == CodecFamily::Hevc)
    {
        // BLA 16-18, IDR 19-20, CRA 21
        int type = (nalHeader >> 1) & 0x3f;
        return type >= 16 && type <= 21;
    }
    return false;
}

bool contains_keyframe_nal(const uint8_t *data, size_t size, int nalLengthSize, CodecFamily family)
{
    if (nalLengthSize <= 0)
        return false;

    size_t offset = 0;
    while (offset + nalLengthSize <= size)
    {
        size_t nalSize = read_be(data + offset, nalLengthSize);
        offset += nalLengthSize;
        if (nalSize == 0 || offset + nalSize > size)
            break;
        if (is_keyframe_nal(data[offset], family))
            return true;
        offset += nalSize;
    }
    return false;
}

bool contains_annexb_keyframe(const uint8_t *data, size_t size, CodecFamily family)
{
    size_t i = 0;
    while (i + 3 < size)
    {
        bool sc3 = data[i] == 0 && data[i + 1] == 0 && data[i + 2] == 1;
        bool sc4 = i + 4 < size && data[i] == 0 && data[i + 1] == 0 && data[i + 2] == 0 && data[i + 3] == 1;
        if (!sc3 && !sc4)
        {
            ++i;
            continue;
        }
        size_t header = i + (sc4 ? 4 : 3);
        if (header < size && is_keyframe_nal(data[header], family))
            return true;
        i = header;
    }
    return false;
}

KeyframeDetector::KeyframeDetector(CodecFamily family, const ByteBuffer &decoderDescription)
    : m_family(family), m_nalLengthSize(nal_length_size_from_description(family, decoderDescription))
{
}

bool KeyframeDetector::isKeyframe(const EncodedSample &sample)
{
    if (sample.isRandomAccessPoint)
        return true;
    if (m_family != CodecFamily::Avc && m_family != CodecFamily::Hevc)
        return false;

    const uint8_t *data = sample.data.data();
    size_t size = sample.data.size();
    if (size < 5)
        return false;

    if (m_nalLengthSize == 0)
        m_nalLengthSize = probe_nal_length_size(data, size);

    if (m_nalLengthSize > 0)
        return contains_keyframe_nal(data, size, m_nalLengthSize, m_family);
    return contains_annexb_keyframe(data, size, m_family);
}

bool is_keyframe(const EncodedSample &sample, CodecFamily family, const ByteBuffer &decoderDescription)
{
    KeyframeDetector detector(family, decoderDescription);
    return detector.isKeyframe(sample);
}

int detect_gop_size(const std::vector<EncodedSample> &samples, double fallbackFps, size_t sampleLimit)
{
    std::vector<size_t> raps;
    for (size_t i = 0; i < samples.size() && raps.size() < sampleLimit; ++i)
    {
        if (samples[i].isRandomAccessPoint)
            raps.push_back(i);
    }

    if (raps.size() >= 3)
    {
        double sum = 0.0;
        int count = 0;
        for (size_t i = 1; i < raps.size(); ++i)
        {
            size_t delta = raps[i] - raps[i - 1];
            if (delta > 0)
            {
                sum += static_cast<double>(delta);
                ++count;
            }
        }
        if (count > 0)
        {
            long average = std::lround(sum / count);
            return static_cast<int>(std::clamp<long>(average, kMinGop, kMaxGop));
        }
    }

    double fps = std::isfinite(fallbackFps) && fallbackFps > 0 ? fallbackFps : 0.0;
    long fallback = std::lround(fps / 2.0);
    return static_cast<int>(std::clamp<long>(fallback, kMinGop, kMaxGop));
}

std::optional<size_t> find_first_keyframe(const std::vector<EncodedSample> &samples,
                                          KeyframeDetector &detector,
                                          size_t searchLimit)
{
    size_t limit = searchLimit == 0 ? samples.size() : std::min(searchLimit, samples.size());
    for (size_t i = 0; i < limit; ++i)
    {
        if (detector.isKeyframe(samples[i]))
            return i;
    }
    return std::nullopt;
}
