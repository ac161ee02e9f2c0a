#pragma once

#include <charconv>
#include <concepts>
#include <optional>
#include <string>
#include <system_error>

#include <cstdint>

#include "../core/error.hpp"
#include "../core/frame_header.hpp"
#include "../core/types.hpp"

namespace framehdr {

/**
 * @brief Concept for ID transport codecs
 *
 * Maps the 64-bit ID to and from the representation a host transport uses.
 * decode() returns std::nullopt for a representation that doesn't name a
 * 64-bit value. The choice of codec belongs to the embedding environment; the
 * wire header always carries the raw 64-bit ID.
 *
 * @tparam T The type to check
 */
template <typename T>
concept IdCodec = requires(uint64_t value, const typename T::representation& repr) {
    { T::encode(value) } -> std::same_as<typename T::representation>;
    { T::decode(repr) } -> std::same_as<std::optional<uint64_t>>;
};

/**
 * ID carried as a plain 64-bit integer
 */
struct NumericIdCodec {
    using representation = uint64_t;

    static uint64_t encode(uint64_t value) noexcept { return value; }
    static std::optional<uint64_t> decode(const uint64_t& value) noexcept { return value; }
};

/**
 * ID carried as base-10 text, for hosts whose numbers can't hold 64 bits
 * exactly (e.g. IEEE doubles above 2^53)
 *
 * decode() accepts only plain digits: no sign, whitespace or trailing text,
 * and nothing above 2^64 - 1.
 */
struct DecimalStringIdCodec {
    using representation = std::string;

    static std::string encode(uint64_t value) {
        char buf[20];
        // 20 digits hold any uint64_t, so to_chars can't fail here
        auto result = std::to_chars(buf, buf + sizeof(buf), value);
        return std::string(buf, result.ptr);
    }

    static std::optional<uint64_t> decode(const std::string& text) noexcept {
        if (text.empty()) {
            return std::nullopt;
        }
        uint64_t value = 0;
        const char* first = text.data();
        const char* last = first + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return value;
    }
};

static_assert(IdCodec<NumericIdCodec>);
static_assert(IdCodec<DecimalStringIdCodec>);

/**
 * @brief Field-by-field transport record of a header
 *
 * The form a header takes when handed to a host environment as a plain
 * object, with the ID in the codec's representation.
 */
template <IdCodec Codec>
struct HeaderRecord {
    Encoding encoding{Encoding::pcm_signed};
    uint16_t sample_size{0};
    uint32_t sample_rate{0};
    uint8_t channels{0};
    uint8_t bits_per_sample{0};
    Endianness endianness{Endianness::little};
    std::optional<typename Codec::representation> id;
    std::optional<uint64_t> pts;

    friend bool operator==(const HeaderRecord&, const HeaderRecord&) = default;
};

template <IdCodec Codec>
HeaderRecord<Codec> to_record(const FrameHeader& hdr) {
    HeaderRecord<Codec> record;
    record.encoding = hdr.encoding();
    record.sample_size = hdr.sample_size();
    record.sample_rate = hdr.sample_rate();
    record.channels = hdr.channels();
    record.bits_per_sample = hdr.bits_per_sample();
    record.endianness = hdr.endianness();
    if (auto id = hdr.id()) {
        record.id = Codec::encode(*id);
    }
    record.pts = hdr.pts();
    return record;
}

/**
 * @brief Rebuild a header from a transport record
 *
 * Goes through FrameHeader::create(), so the record's fields face the same
 * rules as any other construction. An undecodable ID is invalid_id.
 */
template <IdCodec Codec>
Result<FrameHeader> from_record(const HeaderRecord<Codec>& record) {
    std::optional<uint64_t> id;
    if (record.id) {
        id = Codec::decode(*record.id);
        if (!id) {
            return make_error(ValidationError::invalid_id);
        }
    }
    return FrameHeader::create(record.encoding, record.sample_size, record.sample_rate,
                               record.channels, record.bits_per_sample, record.endianness, id,
                               record.pts);
}

} // namespace framehdr
