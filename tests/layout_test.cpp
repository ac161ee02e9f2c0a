#include "header_test_fixture.hpp"

class LayoutTest : public HeaderTest {};

// Field masks must tile the word exactly: no overlap, no gaps
TEST_F(LayoutTest, FieldMasksCoverWordWithoutOverlap) {
    using namespace framehdr::header;

    const uint32_t masks[] = {
        layout_v2.magic_mask(),
        sample_rate_mask << sample_rate_shift,
        bits_mask << bits_shift,
        indicator_bit_mask << pts_present_shift,
        indicator_bit_mask << id_present_shift,
        encoding_mask << encoding_shift,
        endianness_mask << endianness_shift,
        channels_mask << channels_shift,
        sample_size_mask << sample_size_shift,
    };

    uint32_t seen = 0;
    for (uint32_t mask : masks) {
        EXPECT_EQ(seen & mask, 0U) << "Overlapping mask 0x" << std::hex << mask;
        seen |= mask;
    }
    EXPECT_EQ(seen, 0xFFFFFFFFU);
}

TEST_F(LayoutTest, CanonicalMagicOccupiesTopSixBits) {
    EXPECT_EQ(layout_v2.magic_word, 0x2AU);
    EXPECT_EQ(layout_v2.magic_mask(), 0xFC000000U);
    EXPECT_EQ(layout_v2.magic_bits(), 0xA8000000U);
    EXPECT_TRUE(layout_v2.supports_pts);
}

TEST_F(LayoutTest, LegacyMagicOccupiesTopFiveBits) {
    EXPECT_EQ(layout_v1.magic_word, 0x19U);
    EXPECT_EQ(layout_v1.magic_mask(), 0xF8000000U);
    EXPECT_EQ(layout_v1.magic_bits(), 0xC8000000U);
    EXPECT_FALSE(layout_v1.supports_pts);
}

// A word can't carry both magics
TEST_F(LayoutTest, MagicPatternsAreDisjoint) {
    EXPECT_FALSE(layout_v1.has_magic(layout_v2.magic_bits()));
    EXPECT_FALSE(layout_v2.has_magic(layout_v1.magic_bits()));
}

// One layout's magic, moved one bit and then hit by any single bit flip,
// still never passes as the other layout's magic
TEST_F(LayoutTest, ShiftedMagicNeverMatchesOtherLayout) {
    struct Pair {
        const WireLayout* reader;
        const WireLayout* writer;
    };
    const Pair pairs[] = {{&layout_v1, &layout_v2}, {&layout_v2, &layout_v1}};

    for (const auto& pair : pairs) {
        const uint32_t bits = pair.writer->magic_bits();
        for (uint32_t shifted : {bits, bits << 1, bits >> 1}) {
            EXPECT_FALSE(pair.reader->has_magic(shifted)) << std::hex << shifted;
            for (uint32_t bit = 26; bit < 32; ++bit) {
                EXPECT_FALSE(pair.reader->has_magic(shifted ^ (1U << bit)))
                    << std::hex << shifted << " flip " << std::dec << bit;
            }
        }
    }
}

TEST_F(LayoutTest, LayoutForVersion) {
    EXPECT_EQ(&layout_for(LayoutVersion::v1), &layout_v1);
    EXPECT_EQ(&layout_for(LayoutVersion::v2), &layout_v2);
}

TEST_F(LayoutTest, SampleRateCodeTable) {
    EXPECT_EQ(header::sample_rate_code(16000), 0U);
    EXPECT_EQ(header::sample_rate_code(44100), 1U);
    EXPECT_EQ(header::sample_rate_code(48000), 2U);
    EXPECT_EQ(header::sample_rate_code(96000), 3U);
    EXPECT_FALSE(header::sample_rate_code(88200).has_value());
    EXPECT_FALSE(header::sample_rate_from_code(4).has_value());
}

TEST_F(LayoutTest, BitDepthCodeTable) {
    EXPECT_EQ(header::bits_code(16), 0U);
    EXPECT_EQ(header::bits_code(24), 1U);
    EXPECT_EQ(header::bits_code(32), 2U);
    EXPECT_FALSE(header::bits_code(8).has_value());
    EXPECT_FALSE(header::bits_from_code(3).has_value());
}

TEST_F(LayoutTest, EncodingCodeTable) {
    EXPECT_EQ(header::encoding_code(Encoding::pcm_signed), 0U);
    EXPECT_EQ(header::encoding_code(Encoding::aac), 4U);
    EXPECT_FALSE(header::encoding_code(Encoding::h264).has_value());
    EXPECT_EQ(header::encoding_from_code(3), Encoding::flac);
    EXPECT_FALSE(header::encoding_from_code(5).has_value());
    EXPECT_FALSE(header::encoding_from_code(7).has_value());
}

// Opus, 960 samples, 48 kHz, stereo, 16-bit, little, PTS only
TEST_F(LayoutTest, KnownWordForOpusHeader) {
    auto hdr = make_header(Encoding::opus, 960, 48000, 2, 16, Endianness::little, std::nullopt,
                           1000);
    auto bytes = encode_bytes(hdr);

    ASSERT_EQ(bytes.size(), 12U);
    EXPECT_EQ(read_word(bytes), 0xAA2413C0U);
}

// Every field at its maximum, both optional fields present
TEST_F(LayoutTest, KnownWordForMaximalHeader) {
    auto hdr = make_header(Encoding::aac, 0xFFF, 96000, 16, 32, Endianness::big, 1, 1);
    auto bytes = encode_bytes(hdr);

    ASSERT_EQ(bytes.size(), 20U);
    EXPECT_EQ(read_word(bytes), 0xABB9FFFFU);

    auto decoded = decode_bytes(bytes);
    EXPECT_EQ(decoded.sample_size(), 0xFFF);
    EXPECT_EQ(decoded.channels(), 16);
    EXPECT_EQ(decoded.bits_per_sample(), 32);
    EXPECT_EQ(decoded.endianness(), Endianness::big);
    EXPECT_TRUE(decoded.id().has_value());
    EXPECT_TRUE(decoded.pts().has_value());
}

TEST_F(LayoutTest, SetFieldLeavesOtherBitsAlone) {
    uint32_t word = 0xFFFFFFFF;
    word = header::set_field<header::channels_shift, header::channels_mask>(word, 0);
    EXPECT_EQ(word, 0xFFFF0FFFU);

    // Values wider than the field are truncated to the field
    word = header::set_field<header::channels_shift, header::channels_mask>(word, 0x1F);
    EXPECT_EQ(word, 0xFFFFFFFFU);
}
