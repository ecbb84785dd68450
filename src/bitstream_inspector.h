#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "pipeline_types.h"

// NAL length prefix size declared by an avcC (byte 4) or hvcC (byte 21) record; 0 when unknown
int nal_length_size_from_description(CodecFamily family, const ByteBuffer &description);

// Probe 4,3,2,1 byte length prefixes against a sample. A size is accepted when the first
// NAL fits and the NAL right after it (if there is room) also has a positive length that fits.
// Returns 0 when no prefix size is consistent.
int probe_nal_length_size(const uint8_t *data, size_t size);

// Whether a NAL header byte starts an IDR (H.264) or IRAP (HEVC) picture
bool is_keyframe_nal(uint8_t nalHeader, CodecFamily family);

bool contains_keyframe_nal(const uint8_t *data, size_t size, int nalLengthSize, CodecFamily family);
bool contains_annexb_keyframe(const uint8_t *data, size_t size, CodecFamily family);

// Keyframe detector for one track. The framing decision (length prefix size or Annex-B)
// is taken from the decoder description, otherwise probed once and reused for later samples.
class KeyframeDetector
{
public:
    KeyframeDetector(CodecFamily family, const ByteBuffer &decoderDescription);

    bool isKeyframe(const EncodedSample &sample);

    // 0 while the track is treated as Annex-B
    int nalLengthSize() const { return m_nalLengthSize; }

private:
    CodecFamily m_family;
    int m_nalLengthSize = 0;
};

bool is_keyframe(const EncodedSample &sample, CodecFamily family, const ByteBuffer &decoderDescription);

// Average distance between the first random access points, clamped to [1, 300].
// Fewer than 3 random access points fall back to round(fps / 2).
int detect_gop_size(const std::vector<EncodedSample> &samples, double fallbackFps, size_t sampleLimit = 16);

// Index of the first keyframe within the first searchLimit samples (0 = all samples)
std::optional<size_t> find_first_keyframe(const std::vector<EncodedSample> &samples,
                                          KeyframeDetector &detector,
                                          size_t searchLimit = 0);
