#pragma once

#include <cstddef>
#include <cstdint>

#include "../error.hpp"
#include "../layout.hpp"
#include "../types.hpp"

namespace framehdr::detail {

/**
 * @brief Raw fields extracted from a header word
 *
 * Codes are the undecoded wire values; use check_word() before trusting them.
 */
struct DecodedWord {
    uint32_t magic;            ///< Magic field for the layout in use
    uint32_t sample_rate_code; ///< Bits 25-24
    uint32_t bits_code;        ///< Bits 23-22
    bool has_pts;              ///< Bit 21 (always false for layouts without PTS)
    bool has_id;               ///< Bit 20
    uint32_t encoding_code;    ///< Bits 19-17
    Endianness endianness;     ///< Bit 16
    uint8_t channels;          ///< Bits 15-12, already +1
    uint16_t sample_size;      ///< Bits 11-0
};

inline DecodedWord decode_word(uint32_t word, const WireLayout& layout) noexcept {
    DecodedWord result{};

    result.magic = layout.magic_of(word);
    result.sample_rate_code =
        header::get_field<header::sample_rate_shift, header::sample_rate_mask>(word);
    result.bits_code = header::get_field<header::bits_shift, header::bits_mask>(word);
    result.has_pts = layout.supports_pts && header::get_bit<header::pts_present_shift>(word);
    result.has_id = header::get_bit<header::id_present_shift>(word);
    result.encoding_code = header::get_field<header::encoding_shift, header::encoding_mask>(word);
    result.endianness = header::get_bit<header::endianness_shift>(word) ? Endianness::big
                                                                        : Endianness::little;
    result.channels = static_cast<uint8_t>(
        header::get_field<header::channels_shift, header::channels_mask>(word) + 1);
    result.sample_size = static_cast<uint16_t>(
        header::get_field<header::sample_size_shift, header::sample_size_mask>(word));

    return result;
}

/**
 * @brief Structural check of a header word
 *
 * Order: magic, encoding, sample rate, channels, bits per sample, reserved
 * bits. The first failing check determines the error.
 */
inline Status check_word(uint32_t word, const WireLayout& layout) noexcept {
    if (!layout.has_magic(word)) {
        return make_error(ValidationError::invalid_magic, layout.magic_of(word));
    }

    auto decoded = decode_word(word, layout);

    if (decoded.encoding_code > header::max_encoding_code) {
        return make_wire_error(ValidationError::invalid_encoding, decoded.encoding_code);
    }
    if (!header::sample_rate_from_code(decoded.sample_rate_code)) {
        return make_wire_error(ValidationError::invalid_sample_rate, decoded.sample_rate_code);
    }
    // 4 bits + 1 always lands in range; kept so the rule lives in one place
    if (decoded.channels < min_channels || decoded.channels > max_channels) {
        return make_error(ValidationError::invalid_channels, decoded.channels);
    }
    if (!header::bits_from_code(decoded.bits_code)) {
        return make_wire_error(ValidationError::invalid_bits_per_sample, decoded.bits_code);
    }
    if (!layout.reserved_clear(word)) {
        return make_error(ValidationError::unsupported_field, word & layout.reserved_bits);
    }
    return std::nullopt;
}

// Byte offset of the ID field (fixed)
inline constexpr size_t id_offset = fixed_word_size;

// Byte offset of the PTS field, derived from the live ID-present bit
constexpr size_t pts_offset(bool has_id) noexcept {
    return fixed_word_size + (has_id ? optional_field_size : 0);
}

// Wire size implied by the presence bits
constexpr size_t header_size(bool has_id, bool has_pts) noexcept {
    return fixed_word_size + (has_id ? optional_field_size : 0) +
           (has_pts ? optional_field_size : 0);
}

} // namespace framehdr::detail
