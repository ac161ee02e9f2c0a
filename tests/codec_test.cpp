#include <array>
#include <sstream>

#include "header_test_fixture.hpp"

class CodecTest : public HeaderTest {};

// Mixed field combinations survive encode/decode, and the byte count matches size()
TEST_F(CodecTest, RoundTripAcrossFieldCombinations) {
    const Encoding encodings[] = {Encoding::pcm_signed, Encoding::pcm_float, Encoding::opus,
                                  Encoding::flac, Encoding::aac};
    const uint16_t sample_sizes[] = {0, 80, 960, 2880, 4095};
    const uint8_t channel_counts[] = {1, 2, 8, 16};
    const std::optional<uint64_t> ids[] = {std::nullopt, 0, 0xDEADBEEF, UINT64_MAX};
    const std::optional<uint64_t> pts_values[] = {std::nullopt, 1'670'000'000'000'000ULL};

    size_t i = 0;
    for (Encoding encoding : encodings) {
        for (uint16_t sample_size : sample_sizes) {
            for (const auto& id : ids) {
                for (const auto& pts : pts_values) {
                    uint32_t rate = header::sample_rates[i % header::sample_rates.size()];
                    uint8_t bits = header::bit_depths[i % header::bit_depths.size()];
                    uint8_t channels = channel_counts[i % std::size(channel_counts)];
                    Endianness endianness = (i % 2) ? Endianness::big : Endianness::little;
                    ++i;

                    auto hdr = make_header(encoding, sample_size, rate, channels, bits,
                                           endianness, id, pts);
                    auto bytes = encode_bytes(hdr);
                    EXPECT_EQ(bytes.size(), hdr.size());
                    EXPECT_EQ(decode_bytes(bytes), hdr);
                }
            }
        }
    }
}

// ID comes before PTS on the wire, both big-endian
TEST_F(CodecTest, OptionalFieldOrder) {
    auto hdr = make_header(Encoding::flac, 1024, 44100, 2, 16, Endianness::little,
                           0x0102030405060708ULL, 0x1112131415161718ULL);
    auto bytes = encode_bytes(hdr);

    ASSERT_EQ(bytes.size(), 20U);
    EXPECT_EQ(bytes[4], 0x01);
    EXPECT_EQ(bytes[11], 0x08);
    EXPECT_EQ(bytes[12], 0x11);
    EXPECT_EQ(bytes[19], 0x18);
}

// Payload endianness never changes the header's own byte order
TEST_F(CodecTest, HeaderByteOrderIgnoresPayloadEndianness) {
    auto little = encode_bytes(make_header(Encoding::opus, 960, 48000, 2, 16, Endianness::little));
    auto big = encode_bytes(make_header(Encoding::opus, 960, 48000, 2, 16, Endianness::big));

    EXPECT_EQ(read_word(big) ^ read_word(little), 1U << header::endianness_shift);
    EXPECT_EQ(little[0], big[0]);
}

TEST_F(CodecTest, EveryMagicBitFlipIsRejected) {
    auto valid = encode_bytes(make_header());

    for (uint32_t bit = 26; bit < 32; ++bit) {
        auto bytes = valid;
        write_word(bytes, read_word(bytes) ^ (1U << bit));

        auto result = decode(std::span<const uint8_t>(bytes));
        EXPECT_EQ(error_code(result), ValidationError::invalid_magic) << "bit " << bit;
    }
}

TEST_F(CodecTest, MagicOffByOneIsRejected) {
    auto valid = encode_bytes(make_header());
    const uint32_t mask = layout_v2.magic_mask();
    const uint32_t magic = layout_v2.magic_word;

    for (uint32_t wrong : {magic + 1, magic - 1, magic >> 1, (magic << 1) & 0x3F}) {
        auto bytes = valid;
        corrupt_word(bytes, mask, wrong << layout_v2.magic_shift);

        EXPECT_EQ(error_code(decode(std::span<const uint8_t>(bytes))),
                  ValidationError::invalid_magic)
            << "magic 0x" << std::hex << wrong;
        EXPECT_EQ(validate(bytes), Result<bool>(false)) << "magic 0x" << std::hex << wrong;
    }
}

TEST_F(CodecTest, UndefinedEncodingCodeIsRejected) {
    auto bytes = encode_bytes(make_header());

    for (uint32_t code = 5; code <= 7; ++code) {
        corrupt_word(bytes, header::encoding_mask << header::encoding_shift,
                     code << header::encoding_shift);
        EXPECT_EQ(error_code(decode(std::span<const uint8_t>(bytes))),
                  ValidationError::invalid_encoding)
            << "code " << code;
    }
}

TEST_F(CodecTest, UndefinedBitsCodeIsRejected) {
    auto bytes = encode_bytes(make_header());
    corrupt_word(bytes, header::bits_mask << header::bits_shift, 3U << header::bits_shift);

    auto result = decode(std::span<const uint8_t>(bytes));
    EXPECT_EQ(error_code(result), ValidationError::invalid_bits_per_sample);
    EXPECT_EQ(error_of(result)->value, 3U);
    EXPECT_TRUE(error_of(result)->wire_code);
    EXPECT_EQ(error_of(result)->error_message(),
              "Invalid bits per sample code: 3. Wire codes 0..2 are defined");
}

// The same error from an argument names the value, not a code
TEST_F(CodecTest, ArgumentErrorsAreNotWireCodes) {
    auto result = FrameHeader::create(Encoding::opus, 960, 48000, 2, 3, Endianness::little,
                                      std::nullopt, std::nullopt);

    ASSERT_EQ(error_code(result), ValidationError::invalid_bits_per_sample);
    EXPECT_FALSE(error_of(result)->wire_code);
    EXPECT_EQ(error_of(result)->error_message(),
              "Invalid bits per sample: 3. Must be one of: [16, 24, 32]");
}

TEST_F(CodecTest, ShortFixedWordIsEndOfInput) {
    auto bytes = encode_bytes(make_header());

    for (size_t len = 0; len < 4; ++len) {
        auto result = decode(std::span<const uint8_t>(bytes.data(), len));
        EXPECT_EQ(error_code(result), ValidationError::end_of_input) << "len " << len;
    }
}

// Presence bits promise trailing fields the source doesn't have
TEST_F(CodecTest, TruncatedOptionalFieldsAreEndOfInput) {
    auto bytes = encode_bytes(
        make_header(Encoding::opus, 960, 48000, 2, 16, Endianness::little, 5, 6));

    for (size_t len : {4U, 11U, 12U, 19U}) {
        auto result = decode(std::span<const uint8_t>(bytes.data(), len));
        EXPECT_EQ(error_code(result), ValidationError::end_of_input) << "len " << len;
    }
    EXPECT_TRUE(is_ok(decode(std::span<const uint8_t>(bytes.data(), 20))));
}

// Decoding consumes exactly the header, leaving the payload in the source
TEST_F(CodecTest, DecodeStopsAtEndOfHeader) {
    auto hdr = make_header(Encoding::aac, 1024, 44100, 2, 16, Endianness::little, 77);
    auto bytes = encode_bytes(hdr);
    bytes.push_back(0xEE);
    bytes.push_back(0xFF);

    SpanSource source(bytes);
    auto result = decode(source);

    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(std::get<FrameHeader>(result), hdr);
    EXPECT_EQ(source.position(), hdr.size());
    EXPECT_EQ(source.remaining(), 2U);
}

TEST_F(CodecTest, BackToBackHeadersInOneStream) {
    auto first = make_header(Encoding::opus, 960, 48000, 2, 16, Endianness::little, std::nullopt, 0);
    auto second = make_header(Encoding::flac, 4096 - 1, 96000, 8, 24, Endianness::big, 9, 960);

    std::stringstream stream;
    OstreamSink sink(stream);
    ASSERT_FALSE(encode(first, sink).has_value());
    ASSERT_FALSE(encode(second, sink).has_value());

    IstreamSource source(stream);
    auto a = decode(source);
    auto b = decode(source);
    auto c = decode(source);

    ASSERT_TRUE(is_ok(a));
    ASSERT_TRUE(is_ok(b));
    EXPECT_EQ(std::get<FrameHeader>(a), first);
    EXPECT_EQ(std::get<FrameHeader>(b), second);
    EXPECT_EQ(error_code(c), ValidationError::end_of_input);
}

// A sink that can't take the bytes reports a stream error and receives nothing
TEST_F(CodecTest, EncodeIntoTooSmallSpanFails) {
    auto hdr = make_header(Encoding::opus, 960, 48000, 2, 16, Endianness::little, 1, 2);

    std::array<uint8_t, 12> small{};
    SpanSink sink(small);
    auto status = encode(hdr, sink);

    EXPECT_EQ(error_code(status), ValidationError::stream_error);
    EXPECT_EQ(sink.bytes_written(), 0U);

    std::array<uint8_t, 20> exact{};
    SpanSink exact_sink(exact);
    EXPECT_FALSE(encode(hdr, exact_sink).has_value());
    EXPECT_EQ(exact_sink.bytes_written(), 20U);
}

TEST_F(CodecTest, ToHeaderMatchesDecode) {
    auto hdr = make_header(Encoding::pcm_float, 256, 16000, 1, 32, Endianness::big, 3, 4);
    auto bytes = encode_bytes(hdr);

    auto viewed = ConstHeaderView(bytes).to_header();
    ASSERT_TRUE(is_ok(viewed));
    EXPECT_EQ(std::get<FrameHeader>(viewed), hdr);
}
