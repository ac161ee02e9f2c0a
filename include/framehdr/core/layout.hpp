#pragma once

#include <array>
#include <optional>

#include <cstdint>

#include "types.hpp"

namespace framehdr {

/**
 * @brief Frame header bit positions, masks, and code tables
 *
 * Header word format (32 bits, big-endian on the wire, canonical layout):
 * - Bits 31-26: Magic word (6 bits, 0x2A)
 * - Bits 25-24: Sample rate code (0..3 -> 16000, 44100, 48000, 96000)
 * - Bits 23-22: Bits per sample code (0..2 -> 16, 24, 32)
 * - Bit 21: PTS present
 * - Bit 20: ID present
 * - Bits 19-17: Encoding code (0..4)
 * - Bit 16: Payload endianness (0 = little, 1 = big)
 * - Bits 15-12: Channels - 1
 * - Bits 11-0: Sample size
 *
 * Followed by the 64-bit ID (if present) and then the 64-bit PTS (if present).
 *
 * This is the single source of truth for all header bit manipulation.
 * Encoding, decoding, validation, extraction and patching all go through it.
 */
namespace header {

// ========================================================================
// Sample Rate Code (bits 25-24)
// ========================================================================
inline constexpr uint8_t sample_rate_shift = 24;
inline constexpr uint32_t sample_rate_mask = 0x3; // After shift (2 bits)

// ========================================================================
// Bits Per Sample Code (bits 23-22)
// ========================================================================
inline constexpr uint8_t bits_shift = 22;
inline constexpr uint32_t bits_mask = 0x3; // After shift (2 bits)

// ========================================================================
// Presence Indicators (bits 21, 20)
// ========================================================================
inline constexpr uint8_t pts_present_shift = 21;
inline constexpr uint8_t id_present_shift = 20;
inline constexpr uint32_t indicator_bit_mask = 0x1; // After shift (single bit)

// ========================================================================
// Encoding Code (bits 19-17)
// ========================================================================
inline constexpr uint8_t encoding_shift = 17;
inline constexpr uint32_t encoding_mask = 0x7; // After shift (3 bits)

// ========================================================================
// Payload Endianness (bit 16)
// ========================================================================
inline constexpr uint8_t endianness_shift = 16;
inline constexpr uint32_t endianness_mask = 0x1; // After shift

// ========================================================================
// Channels - 1 (bits 15-12)
// ========================================================================
inline constexpr uint8_t channels_shift = 12;
inline constexpr uint32_t channels_mask = 0xF; // After shift (4 bits)

// ========================================================================
// Sample Size (bits 11-0)
// ========================================================================
inline constexpr uint8_t sample_size_shift = 0;
inline constexpr uint32_t sample_size_mask = 0xFFF; // After shift (12 bits)

/**
 * Get a multi-bit field from a header word
 * @tparam Shift The starting bit position
 * @tparam Mask The bit mask (after shifting)
 */
template <uint32_t Shift, uint32_t Mask>
constexpr uint32_t get_field(uint32_t word) noexcept {
    return (word >> Shift) & Mask;
}

/**
 * Replace a multi-bit field in a header word, leaving every other bit intact
 * @tparam Shift The starting bit position
 * @tparam Mask The bit mask (after shifting)
 */
template <uint32_t Shift, uint32_t Mask>
constexpr uint32_t set_field(uint32_t word, uint32_t field_value) noexcept {
    return (word & ~(Mask << Shift)) | ((field_value & Mask) << Shift);
}

template <uint32_t Shift>
constexpr bool get_bit(uint32_t word) noexcept {
    static_assert(Shift < 32, "Bit position must be less than 32");
    return (word >> Shift) & indicator_bit_mask;
}

template <uint32_t Shift>
constexpr uint32_t set_bit(uint32_t word, bool bit_value) noexcept {
    static_assert(Shift < 32, "Bit position must be less than 32");
    return (word & ~(1U << Shift)) | (bit_value ? (1U << Shift) : 0);
}

// ========================================================================
// Code Tables (wire code = index)
// ========================================================================
inline constexpr std::array<uint32_t, 4> sample_rates{16000, 44100, 48000, 96000};
inline constexpr std::array<uint8_t, 3> bit_depths{16, 24, 32};
inline constexpr uint32_t max_encoding_code = static_cast<uint32_t>(Encoding::aac);

constexpr std::optional<uint32_t> sample_rate_code(uint32_t rate) noexcept {
    for (uint32_t code = 0; code < sample_rates.size(); ++code) {
        if (sample_rates[code] == rate) {
            return code;
        }
    }
    return std::nullopt;
}

constexpr std::optional<uint32_t> sample_rate_from_code(uint32_t code) noexcept {
    if (code >= sample_rates.size()) {
        return std::nullopt;
    }
    return sample_rates[code];
}

constexpr std::optional<uint32_t> bits_code(uint8_t bits) noexcept {
    for (uint32_t code = 0; code < bit_depths.size(); ++code) {
        if (bit_depths[code] == bits) {
            return code;
        }
    }
    return std::nullopt;
}

constexpr std::optional<uint8_t> bits_from_code(uint32_t code) noexcept {
    if (code >= bit_depths.size()) {
        return std::nullopt;
    }
    return bit_depths[code];
}

constexpr std::optional<uint32_t> encoding_code(Encoding encoding) noexcept {
    uint32_t code = static_cast<uint32_t>(encoding);
    if (code > max_encoding_code) {
        return std::nullopt;
    }
    return code;
}

constexpr std::optional<Encoding> encoding_from_code(uint32_t code) noexcept {
    if (code > max_encoding_code) {
        return std::nullopt;
    }
    return static_cast<Encoding>(code);
}

} // namespace header

// Wire layout revisions
enum class LayoutVersion : uint8_t {
    v1 = 1, // Legacy: 5-bit magic, ID only
    v2 = 2  // Canonical: 6-bit magic, ID and PTS
};

/**
 * @brief Per-revision part of the header word
 *
 * Both revisions share every field position listed in namespace header. They
 * differ in the magic field and in the optional-field set:
 *
 * - v2: magic 0x2A in bits 31-26, ID and PTS
 * - v1: magic 0x19 in bits 31-27, bit 26 unused, ID only; bit 21 (PTS
 *   present on v2) is reserved and must be zero
 *
 * Neither magic matches the other, even moved one bit in either direction,
 * so a word can never satisfy both layouts.
 */
struct WireLayout {
    LayoutVersion version;
    uint32_t magic_word;   ///< Magic value (after shift)
    uint8_t magic_width;   ///< Magic width in bits
    uint8_t magic_shift;   ///< Position of the magic's least-significant bit
    bool supports_pts;     ///< PTS-present bit and trailing PTS field exist
    uint32_t reserved_bits; ///< In-place mask of bits that must be zero

    constexpr uint32_t magic_mask() const noexcept {
        return ((1U << magic_width) - 1) << magic_shift;
    }

    constexpr uint32_t magic_bits() const noexcept { return magic_word << magic_shift; }

    constexpr uint32_t magic_of(uint32_t word) const noexcept {
        return (word & magic_mask()) >> magic_shift;
    }

    constexpr bool has_magic(uint32_t word) const noexcept {
        return (word & magic_mask()) == magic_bits();
    }

    constexpr bool reserved_clear(uint32_t word) const noexcept {
        return (word & reserved_bits) == 0;
    }
};

inline constexpr WireLayout layout_v2{LayoutVersion::v2, 0x2A, 6, 26, true, 0};
inline constexpr WireLayout layout_v1{LayoutVersion::v1, 0x19, 5, 27, false,
                                      1U << header::pts_present_shift};

namespace detail {

// True if layout accepts other's magic at its own position or one bit off
constexpr bool accepts_nearby_magic(const WireLayout& layout, const WireLayout& other) noexcept {
    const uint32_t bits = other.magic_bits();
    return layout.has_magic(bits) || layout.has_magic(bits << 1) || layout.has_magic(bits >> 1);
}

} // namespace detail

static_assert(layout_v2.magic_mask() == 0xFC000000U);
static_assert(layout_v1.magic_mask() == 0xF8000000U);
static_assert(!detail::accepts_nearby_magic(layout_v1, layout_v2));
static_assert(!detail::accepts_nearby_magic(layout_v2, layout_v1));

constexpr const WireLayout& layout_for(LayoutVersion version) noexcept {
    return version == LayoutVersion::v1 ? layout_v1 : layout_v2;
}

} // namespace framehdr
