#include <catch2/catch.hpp>

#include "bitstream_inspector.h"

static EncodedSample make_sample(ByteBuffer data, bool rap = false)
{
    EncodedSample s;
    s.data = std::move(data);
    s.isRandomAccessPoint = rap;
    return s;
}

static std::vector<EncodedSample> samples_with_raps(size_t count, const std::vector<size_t> &raps)
{
    std::vector<EncodedSample> samples(count);
    for (size_t i : raps)
        samples[i].isRandomAccessPoint = true;
    return samples;
}

TEST_CASE("NAL header classification", "[bitstream]")
{
    CHECK(is_keyframe_nal(0x65, CodecFamily::Avc));  // IDR slice
    CHECK_FALSE(is_keyframe_nal(0x41, CodecFamily::Avc));
    CHECK_FALSE(is_keyframe_nal(0x67, CodecFamily::Avc)); // SPS

    CHECK(is_keyframe_nal(19 << 1, CodecFamily::Hevc)); // IDR_W_RADL
    CHECK(is_keyframe_nal(21 << 1, CodecFamily::Hevc)); // CRA
    CHECK(is_keyframe_nal(16 << 1, CodecFamily::Hevc)); // BLA
    CHECK_FALSE(is_keyframe_nal(1 << 1, CodecFamily::Hevc));
    CHECK_FALSE(is_keyframe_nal(32 << 1, CodecFamily::Hevc)); // VPS

    CHECK_FALSE(is_keyframe_nal(0x65, CodecFamily::Av1));
}

TEST_CASE("Length prefix size comes from avcC and hvcC records", "[bitstream]")
{
    ByteBuffer avcc = {1, 0x64, 0x00, 0x28, 0xff, 0xe1};
    CHECK(nal_length_size_from_description(CodecFamily::Avc, avcc) == 4);

    avcc[4] = 0xfd;
    CHECK(nal_length_size_from_description(CodecFamily::Avc, avcc) == 2);

    ByteBuffer hvcc(23, 0);
    hvcc[0] = 1;
    hvcc[21] = 0x0f;
    CHECK(nal_length_size_from_description(CodecFamily::Hevc, hvcc) == 4);

    // Annex-B extradata starts with a start code, not configurationVersion
    ByteBuffer annexb = {0, 0, 0, 1, 0x67, 0x64, 0x00, 0x28};
    CHECK(nal_length_size_from_description(CodecFamily::Avc, annexb) == 0);
    CHECK(nal_length_size_from_description(CodecFamily::Avc, {}) == 0);
}

TEST_CASE("Length-prefixed H.264 samples", "[bitstream]")
{
    KeyframeDetector detector(CodecFamily::Avc, {});

    CHECK(detector.isKeyframe(make_sample({0, 0, 0, 2, 0x65, 0x88})));
    CHECK(detector.nalLengthSize() == 4);
    CHECK_FALSE(detector.isKeyframe(make_sample({0, 0, 0, 2, 0x41, 0x9a})));

    // SPS, PPS, then the IDR slice
    ByteBuffer withParams = {0, 0, 0, 2, 0x67, 0x64, 0, 0, 0, 2, 0x68, 0xee, 0, 0, 0, 3, 0x65, 0x88, 0x84};
    CHECK(detector.isKeyframe(make_sample(withParams)));
}

TEST_CASE("Declared length size is used without probing", "[bitstream]")
{
    ByteBuffer avcc = {1, 0x64, 0x00, 0x28, 0xfd}; // 2 byte lengths
    KeyframeDetector detector(CodecFamily::Avc, avcc);
    CHECK(detector.nalLengthSize() == 2);
    CHECK(detector.isKeyframe(make_sample({0, 3, 0x65, 0x88, 0x84})));
    CHECK_FALSE(detector.isKeyframe(make_sample({0, 3, 0x41, 0x9a, 0x84})));
}

TEST_CASE("Annex-B samples are scanned for start codes", "[bitstream]")
{
    KeyframeDetector detector(CodecFamily::Avc, {});

    ByteBuffer idr = {0, 0, 0, 1, 0x65, 0x88, 0x84, 0x00, 0x10, 0xff, 0xaa};
    CHECK(probe_nal_length_size(idr.data(), idr.size()) == 0);
    CHECK(detector.isKeyframe(make_sample(idr)));
    CHECK(detector.nalLengthSize() == 0);

    ByteBuffer nonIdr = {0, 0, 0, 1, 0x41, 0x9a, 0x84, 0x00, 0x10, 0xff, 0xaa};
    CHECK_FALSE(detector.isKeyframe(make_sample(nonIdr)));

    ByteBuffer threeByteStart = {0x09, 0xf0, 0, 0, 1, 0x65, 0x88};
    CHECK(contains_annexb_keyframe(threeByteStart.data(), threeByteStart.size(), CodecFamily::Avc));
}

TEST_CASE("HEVC keyframes", "[bitstream]")
{
    KeyframeDetector detector(CodecFamily::Hevc, {});
    CHECK(detector.isKeyframe(make_sample({0, 0, 0, 3, 19 << 1, 0x01, 0xaf})));
    CHECK(detector.isKeyframe(make_sample({0, 0, 0, 3, 21 << 1, 0x01, 0xaf})));
    CHECK_FALSE(detector.isKeyframe(make_sample({0, 0, 0, 3, 1 << 1, 0x01, 0xd0})));
}

TEST_CASE("Random access flag and other codecs", "[bitstream]")
{
    CHECK(is_keyframe(make_sample({0, 0, 0, 2, 0x41, 0x9a}, true), CodecFamily::Avc, {}));
    CHECK(is_keyframe(make_sample({0x12, 0x00}, true), CodecFamily::Av1, {}));
    CHECK_FALSE(is_keyframe(make_sample({0, 0, 0, 2, 0x65, 0x88}), CodecFamily::Vp9, {}));

    // Too short to hold a NAL
    CHECK_FALSE(is_keyframe(make_sample({0, 0, 1, 0x65}), CodecFamily::Avc, {}));
}

TEST_CASE("GOP size from random access spacing", "[bitstream]")
{
    CHECK(detect_gop_size(samples_with_raps(120, {0, 30, 60, 90}), 30.0) == 30);
    CHECK(detect_gop_size(samples_with_raps(120, {0, 20, 60}), 30.0) == 30);

    SECTION("fallback to half the frame rate")
    {
        CHECK(detect_gop_size(samples_with_raps(120, {0}), 30.0) == 15);
        CHECK(detect_gop_size(samples_with_raps(120, {0, 60}), 59.94) == 30);
        CHECK(detect_gop_size(samples_with_raps(120, {}), 0.0) == 1);
        CHECK(detect_gop_size(samples_with_raps(120, {}), 1.0) == 1);
    }

    SECTION("clamped to [1, 300]")
    {
        CHECK(detect_gop_size(samples_with_raps(2100, {0, 1000, 2000}), 30.0) == 300);
        CHECK(detect_gop_size(samples_with_raps(10, {0, 1, 2, 3}), 30.0) == 1);
        CHECK(detect_gop_size(samples_with_raps(10, {}), 1000.0) == 300);
    }

    SECTION("only the first random access points count")
    {
        std::vector<size_t> raps;
        for (size_t i = 0; i < 16; ++i)
            raps.push_back(i * 10);
        raps.push_back(1000);
        CHECK(detect_gop_size(samples_with_raps(1001, raps), 30.0, 16) == 10);
    }
}

TEST_CASE("First keyframe search", "[bitstream]")
{
    std::vector<EncodedSample> samples = {
        make_sample({0, 0, 0, 2, 0x41, 0x9a}),
        make_sample({0, 0, 0, 2, 0x41, 0x9b}),
        make_sample({0, 0, 0, 2, 0x65, 0x88}),
        make_sample({0, 0, 0, 2, 0x41, 0x9c}),
    };

    KeyframeDetector detector(CodecFamily::Avc, {});
    auto first = find_first_keyframe(samples, detector);
    REQUIRE(first);
    CHECK(*first == 2);

    KeyframeDetector limited(CodecFamily::Avc, {});
    CHECK_FALSE(find_first_keyframe(samples, limited, 2));

    samples[2] = make_sample({0, 0, 0, 2, 0x41, 0x9d});
    KeyframeDetector none(CodecFamily::Avc, {});
    CHECK_FALSE(find_first_keyframe(samples, none));
}

static ByteBuffer as_annexb(const ByteBuffer &nal)
{
    ByteBuffer out = {0, 0, 0, 1};
    out.insert(out.end(), nal.begin(), nal.end());
    return out;
}

static ByteBuffer as_length_prefixed(const ByteBuffer &nal)
{
    uint32_t n = static_cast<uint32_t>(nal.size());
    ByteBuffer out = {static_cast<uint8_t>(n >> 24), static_cast<uint8_t>(n >> 16),
                      static_cast<uint8_t>(n >> 8), static_cast<uint8_t>(n)};
    out.insert(out.end(), nal.begin(), nal.end());
    return out;
}

TEST_CASE("Annex-B and length-prefixed framings agree", "[bitstream]")
{
    ByteBuffer avcc = {1, 0x64, 0x00, 0x28, 0xff, 0xe1};
    ByteBuffer hvcc(23, 0);
    hvcc[0] = 1;
    hvcc[21] = 0x0f;

    struct Case
    {
        CodecFamily family;
        ByteBuffer nal;
        bool key;
    };
    std::vector<Case> cases = {
        {CodecFamily::Avc, {0x65, 0x88, 0x84, 0x00, 0x10, 0xff, 0xaa}, true},
        {CodecFamily::Avc, {0x41, 0x9a, 0x84, 0x00, 0x10, 0xff, 0xaa}, false},
        {CodecFamily::Hevc, {19 << 1, 0x01, 0xaf, 0x00, 0x10, 0xff, 0xaa}, true},
        {CodecFamily::Hevc, {1 << 1, 0x01, 0xd0, 0x00, 0x10, 0xff, 0xaa}, false},
    };

    for (const Case &c : cases)
    {
        const ByteBuffer &description = c.family == CodecFamily::Avc ? avcc : hvcc;
        KeyframeDetector annexbDetector(c.family, {});
        KeyframeDetector prefixedDetector(c.family, description);

        bool fromAnnexb = annexbDetector.isKeyframe(make_sample(as_annexb(c.nal)));
        bool fromPrefixed = prefixedDetector.isKeyframe(make_sample(as_length_prefixed(c.nal)));
        CHECK(fromAnnexb == fromPrefixed);
        CHECK(fromAnnexb == c.key);
        CHECK(annexbDetector.nalLengthSize() == 0);
        CHECK(prefixedDetector.nalLengthSize() == 4);
    }
}
