#pragma once

#include <cstdint>

#include "../error.hpp"
#include "../layout.hpp"
#include "../types.hpp"

namespace framehdr::detail {

// Value rules shared by FrameHeader::create and the patch operations, so a
// header built with its final values and one patched into them are identical.

inline Status check_channels(uint8_t channels) noexcept {
    if (channels < min_channels || channels > max_channels) {
        return make_error(ValidationError::invalid_channels, channels);
    }
    return std::nullopt;
}

inline Status check_bits_per_sample(uint8_t bits) noexcept {
    if (!header::bits_code(bits)) {
        return make_error(ValidationError::invalid_bits_per_sample, bits);
    }
    return std::nullopt;
}

inline Status check_sample_size(uint16_t sample_size) noexcept {
    if (sample_size > max_sample_size) {
        return make_error(ValidationError::invalid_sample_size, sample_size);
    }
    return std::nullopt;
}

inline Status check_sample_rate(uint32_t sample_rate) noexcept {
    if (!header::sample_rate_code(sample_rate)) {
        return make_error(ValidationError::invalid_sample_rate, sample_rate);
    }
    return std::nullopt;
}

inline Status check_encoding(Encoding encoding) noexcept {
    if (!header::encoding_code(encoding)) {
        return make_error(ValidationError::invalid_encoding, static_cast<uint64_t>(encoding));
    }
    return std::nullopt;
}

} // namespace framehdr::detail
