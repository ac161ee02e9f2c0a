#pragma once

#include <optional>

#include <cstddef>
#include <cstdint>

#include "detail/field_checks.hpp"
#include "detail/word_decode.hpp"
#include "error.hpp"
#include "layout.hpp"
#include "types.hpp"

namespace framehdr {

/**
 * @brief Decoded, validated media frame header
 *
 * Instances only come from FrameHeader::create() or from decoding, so every
 * live FrameHeader satisfies the field rules. The object is immutable; to
 * change a field of an encoded header, patch its bytes through HeaderView.
 *
 * Usage:
 *   auto result = FrameHeader::create(Encoding::opus, 960, 48000, 2, 16,
 *                                     Endianness::little, std::nullopt, 1000);
 *   if (auto* hdr = std::get_if<FrameHeader>(&result)) {
 *       auto bytes = encode_to_vector(*hdr);
 *   }
 */
class FrameHeader {
public:
    /**
     * @brief Validate fields and build a header
     *
     * Checks run in a fixed order: channels, bits per sample, sample size,
     * sample rate. The first failure is returned; nothing is clamped.
     */
    static Result<FrameHeader> create(Encoding encoding, uint16_t sample_size,
                                      uint32_t sample_rate, uint8_t channels,
                                      uint8_t bits_per_sample, Endianness endianness,
                                      std::optional<uint64_t> id,
                                      std::optional<uint64_t> pts) noexcept {
        if (auto err = detail::check_channels(channels)) {
            return *err;
        }
        if (auto err = detail::check_bits_per_sample(bits_per_sample)) {
            return *err;
        }
        if (auto err = detail::check_sample_size(sample_size)) {
            return *err;
        }
        if (auto err = detail::check_sample_rate(sample_rate)) {
            return *err;
        }
        return FrameHeader(encoding, sample_size, sample_rate, channels, bits_per_sample,
                           endianness, id, pts);
    }

    Encoding encoding() const noexcept { return encoding_; }
    uint16_t sample_size() const noexcept { return sample_size_; }
    uint32_t sample_rate() const noexcept { return sample_rate_; }
    uint8_t channels() const noexcept { return channels_; }
    uint8_t bits_per_sample() const noexcept { return bits_per_sample_; }
    Endianness endianness() const noexcept { return endianness_; }
    std::optional<uint64_t> id() const noexcept { return id_; }
    std::optional<uint64_t> pts() const noexcept { return pts_; }

    /**
     * Encoded size in bytes: the fixed word plus 8 bytes per optional field
     */
    size_t size() const noexcept { return detail::header_size(id_.has_value(), pts_.has_value()); }

    friend bool operator==(const FrameHeader&, const FrameHeader&) = default;

private:
    FrameHeader(Encoding encoding, uint16_t sample_size, uint32_t sample_rate, uint8_t channels,
                uint8_t bits_per_sample, Endianness endianness, std::optional<uint64_t> id,
                std::optional<uint64_t> pts) noexcept
        : encoding_(encoding),
          sample_size_(sample_size),
          sample_rate_(sample_rate),
          channels_(channels),
          bits_per_sample_(bits_per_sample),
          endianness_(endianness),
          id_(id),
          pts_(pts) {}

    Encoding encoding_;
    uint16_t sample_size_;
    uint32_t sample_rate_;
    uint8_t channels_;
    uint8_t bits_per_sample_;
    Endianness endianness_;
    std::optional<uint64_t> id_;
    std::optional<uint64_t> pts_;
};

namespace detail {

/**
 * @brief Pack the fixed fields of a header into its word
 *
 * Fails if a field has no wire code in the given layout.
 */
inline Result<uint32_t> encode_word(const FrameHeader& hdr, const WireLayout& layout) noexcept {
    auto rate_code = header::sample_rate_code(hdr.sample_rate());
    if (!rate_code) {
        return make_error(ValidationError::invalid_sample_rate, hdr.sample_rate());
    }
    auto bits = header::bits_code(hdr.bits_per_sample());
    if (!bits) {
        return make_error(ValidationError::invalid_bits_per_sample, hdr.bits_per_sample());
    }
    auto enc = header::encoding_code(hdr.encoding());
    if (!enc) {
        return make_error(ValidationError::invalid_encoding,
                          static_cast<uint64_t>(hdr.encoding()));
    }
    if (hdr.pts() && !layout.supports_pts) {
        return make_error(ValidationError::unsupported_field, *hdr.pts());
    }

    uint32_t word = layout.magic_bits();
    word = header::set_field<header::sample_rate_shift, header::sample_rate_mask>(word, *rate_code);
    word = header::set_field<header::bits_shift, header::bits_mask>(word, *bits);
    word = header::set_bit<header::pts_present_shift>(word, hdr.pts().has_value());
    word = header::set_bit<header::id_present_shift>(word, hdr.id().has_value());
    word = header::set_field<header::encoding_shift, header::encoding_mask>(word, *enc);
    word = header::set_bit<header::endianness_shift>(word, hdr.endianness() == Endianness::big);
    word = header::set_field<header::channels_shift, header::channels_mask>(
        word, static_cast<uint32_t>(hdr.channels() - 1));
    word = header::set_field<header::sample_size_shift, header::sample_size_mask>(
        word, hdr.sample_size());
    return word;
}

/**
 * @brief Rebuild a header from a header word and its optional fields
 *
 * Intended for words that passed check_word(); any code that still fails to
 * map is reported rather than trusted.
 */
inline Result<FrameHeader> header_from_word(uint32_t word, const WireLayout& layout,
                                            std::optional<uint64_t> id,
                                            std::optional<uint64_t> pts) noexcept {
    auto decoded = decode_word(word, layout);

    auto encoding = header::encoding_from_code(decoded.encoding_code);
    if (!encoding) {
        return make_wire_error(ValidationError::invalid_encoding, decoded.encoding_code);
    }
    auto rate = header::sample_rate_from_code(decoded.sample_rate_code);
    if (!rate) {
        return make_wire_error(ValidationError::invalid_sample_rate, decoded.sample_rate_code);
    }
    auto bits = header::bits_from_code(decoded.bits_code);
    if (!bits) {
        return make_wire_error(ValidationError::invalid_bits_per_sample, decoded.bits_code);
    }
    return FrameHeader::create(*encoding, decoded.sample_size, *rate, decoded.channels, *bits,
                               decoded.endianness, id, pts);
}

} // namespace detail

} // namespace framehdr
