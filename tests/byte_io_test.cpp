#include <array>
#include <sstream>
#include <vector>

#include <cstdint>
#include <gtest/gtest.h>
#include <framehdr/codec/byte_io.hpp>

using namespace framehdr;

TEST(ByteIoTest, VectorSinkAppends) {
    std::vector<uint8_t> out{0xAA};
    VectorSink sink(out);

    const std::array<uint8_t, 3> bytes{1, 2, 3};
    EXPECT_TRUE(sink.write(bytes));
    EXPECT_TRUE(sink.write(bytes));

    EXPECT_EQ(out, (std::vector<uint8_t>{0xAA, 1, 2, 3, 1, 2, 3}));
}

TEST(ByteIoTest, SpanSinkRejectsOverflowWhole) {
    std::array<uint8_t, 5> buffer{};
    SpanSink sink(buffer);

    const std::array<uint8_t, 4> bytes{1, 2, 3, 4};
    EXPECT_TRUE(sink.write(bytes));
    EXPECT_FALSE(sink.write(bytes));

    EXPECT_EQ(sink.bytes_written(), 4U);
    EXPECT_EQ(buffer[4], 0);
    ASSERT_EQ(sink.written().size(), 4U);
    EXPECT_EQ(sink.written()[3], 4);
}

TEST(ByteIoTest, SpanSourceShortReadConsumesNothing) {
    const std::array<uint8_t, 6> data{1, 2, 3, 4, 5, 6};
    SpanSource source(data);

    std::array<uint8_t, 4> out{};
    EXPECT_EQ(source.read_exact(out), ReadStatus::ok);
    EXPECT_EQ(out[0], 1);
    EXPECT_EQ(source.remaining(), 2U);

    EXPECT_EQ(source.read_exact(out), ReadStatus::end_of_input);
    EXPECT_EQ(source.position(), 4U);

    std::array<uint8_t, 2> tail{};
    EXPECT_EQ(source.read_exact(tail), ReadStatus::ok);
    EXPECT_EQ(tail[1], 6);
}

TEST(ByteIoTest, IstreamSourceReportsEndOfInput) {
    std::istringstream stream(std::string("\x01\x02\x03", 3));
    IstreamSource source(stream);

    std::array<uint8_t, 2> out{};
    EXPECT_EQ(source.read_exact(out), ReadStatus::ok);
    EXPECT_EQ(out[1], 0x02);
    EXPECT_EQ(source.read_exact(out), ReadStatus::end_of_input);
}

// A stream already in a failed state is an error, not end of input
TEST(ByteIoTest, IstreamSourceReportsStreamFailure) {
    std::istringstream stream(std::string("\x01\x02\x03\x04", 4));
    stream.setstate(std::ios::failbit);
    IstreamSource source(stream);

    std::array<uint8_t, 2> out{};
    EXPECT_EQ(source.read_exact(out), ReadStatus::error);
}

TEST(ByteIoTest, OstreamSinkWritesBytes) {
    std::ostringstream stream;
    OstreamSink sink(stream);

    const std::array<uint8_t, 2> bytes{0x41, 0x42};
    EXPECT_TRUE(sink.write(bytes));
    EXPECT_EQ(stream.str(), "AB");

    stream.setstate(std::ios::badbit);
    EXPECT_FALSE(sink.write(bytes));
}
