#pragma once

#include <optional>
#include <span>
#include <variant>

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "detail/buffer_io.hpp"
#include "detail/field_checks.hpp"
#include "detail/word_decode.hpp"
#include "error.hpp"
#include "frame_header.hpp"
#include "layout.hpp"
#include "types.hpp"

namespace framehdr {

/**
 * @brief Read-only view over an encoded header
 *
 * Reads individual fields straight from the bytes without decoding the whole
 * header. Nothing is cached: presence bits and offsets are re-read from the
 * buffer on every call, so a view stays correct while the same bytes are
 * patched through a HeaderView.
 *
 * The view doesn't own the bytes; the caller keeps them alive. The layout is
 * copied, so a temporary WireLayout is fine.
 */
class ConstHeaderView {
public:
    explicit ConstHeaderView(std::span<const uint8_t> bytes,
                             const WireLayout& layout = layout_v2) noexcept
        : bytes_(bytes),
          layout_(layout) {}

    std::span<const uint8_t> bytes() const noexcept { return bytes_; }
    const WireLayout& layout() const noexcept { return layout_; }

    /**
     * @brief Structural check of the header word
     *
     * Only a buffer shorter than the fixed word is an error. Wrong magic or
     * an undefined field code yields false. Trailing fields are not checked
     * against the buffer length.
     */
    Result<bool> validate() const noexcept {
        auto word = raw_word();
        if (auto* err = std::get_if<HeaderError>(&word)) {
            return *err;
        }
        return !detail::check_word(std::get<uint32_t>(word), layout_).has_value();
    }

    /**
     * @brief Reason the header word fails validation
     * @return Empty if the word is well-formed, otherwise the first failing check
     */
    Status check() const noexcept {
        auto word = raw_word();
        if (auto* err = std::get_if<HeaderError>(&word)) {
            return *err;
        }
        return detail::check_word(std::get<uint32_t>(word), layout_);
    }

    /**
     * Header word in host order, after the magic check
     */
    Result<uint32_t> word() const noexcept {
        auto word = raw_word();
        if (auto* err = std::get_if<HeaderError>(&word)) {
            return *err;
        }
        uint32_t value = std::get<uint32_t>(word);
        if (!layout_.has_magic(value)) {
            return make_error(ValidationError::invalid_magic, layout_.magic_of(value));
        }
        return value;
    }

    Result<uint16_t> sample_count() const noexcept {
        auto w = word();
        if (auto* err = std::get_if<HeaderError>(&w)) {
            return *err;
        }
        return static_cast<uint16_t>(
            header::get_field<header::sample_size_shift, header::sample_size_mask>(
                std::get<uint32_t>(w)));
    }

    Result<Encoding> encoding() const noexcept {
        auto w = word();
        if (auto* err = std::get_if<HeaderError>(&w)) {
            return *err;
        }
        uint32_t code = header::get_field<header::encoding_shift, header::encoding_mask>(
            std::get<uint32_t>(w));
        auto encoding = header::encoding_from_code(code);
        if (!encoding) {
            return make_wire_error(ValidationError::invalid_encoding, code);
        }
        return *encoding;
    }

    /**
     * @brief ID field, if the ID-present bit is set
     *
     * Absent is not an error, whatever the buffer length. A set bit with
     * fewer than 12 bytes available is field_out_of_bounds.
     */
    Result<std::optional<uint64_t>> id() const noexcept {
        auto w = word();
        if (auto* err = std::get_if<HeaderError>(&w)) {
            return *err;
        }
        if (!header::get_bit<header::id_present_shift>(std::get<uint32_t>(w))) {
            return std::optional<uint64_t>{};
        }
        return read_field(detail::id_offset);
    }

    /**
     * @brief PTS field, if the PTS-present bit is set
     *
     * Located right after the fixed word, or after the ID when the ID-present
     * bit is also set.
     */
    Result<std::optional<uint64_t>> pts() const noexcept {
        auto w = word();
        if (auto* err = std::get_if<HeaderError>(&w)) {
            return *err;
        }
        uint32_t value = std::get<uint32_t>(w);
        if (!layout_.supports_pts || !header::get_bit<header::pts_present_shift>(value)) {
            return std::optional<uint64_t>{};
        }
        return read_field(detail::pts_offset(header::get_bit<header::id_present_shift>(value)));
    }

    /**
     * Wire size implied by the presence bits (4, 12 or 20)
     */
    Result<size_t> header_size() const noexcept {
        auto w = word();
        if (auto* err = std::get_if<HeaderError>(&w)) {
            return *err;
        }
        auto decoded = detail::decode_word(std::get<uint32_t>(w), layout_);
        return detail::header_size(decoded.has_id, decoded.has_pts);
    }

    /**
     * @brief Build an independent FrameHeader from the bytes
     *
     * Same checks as decode(), but a presence bit whose field lies past the
     * end of the buffer reports field_out_of_bounds.
     */
    Result<FrameHeader> to_header() const noexcept {
        if (auto err = check()) {
            return *err;
        }
        auto id_field = id();
        if (auto* err = std::get_if<HeaderError>(&id_field)) {
            return *err;
        }
        auto pts_field = pts();
        if (auto* err = std::get_if<HeaderError>(&pts_field)) {
            return *err;
        }
        return detail::header_from_word(detail::read_u32(bytes_.data(), 0), layout_,
                                        std::get<std::optional<uint64_t>>(id_field),
                                        std::get<std::optional<uint64_t>>(pts_field));
    }

protected:
    Result<uint32_t> raw_word() const noexcept {
        if (bytes_.size() < fixed_word_size) {
            return make_error(ValidationError::buffer_too_small, bytes_.size());
        }
        return detail::read_u32(bytes_.data(), 0);
    }

private:
    Result<std::optional<uint64_t>> read_field(size_t offset) const noexcept {
        if (bytes_.size() < offset + optional_field_size) {
            return make_error(ValidationError::field_out_of_bounds, bytes_.size());
        }
        return std::optional<uint64_t>{detail::read_u64(bytes_.data(), offset)};
    }

    std::span<const uint8_t> bytes_;
    WireLayout layout_;
};

/**
 * @brief Mutable view over an encoded header with field-level patching
 *
 * Every patch validates the whole header word and the new value before the
 * first byte changes; a failed patch leaves the buffer untouched. Fixed-field
 * patches rewrite only their own bits. Patches never grow the buffer.
 */
class HeaderView : public ConstHeaderView {
public:
    explicit HeaderView(std::span<uint8_t> bytes, const WireLayout& layout = layout_v2) noexcept
        : ConstHeaderView(bytes, layout),
          bytes_mut_(bytes) {}

    Status patch_sample_size(uint16_t sample_size) noexcept {
        if (auto err = detail::check_sample_size(sample_size)) {
            return err;
        }
        return modify([sample_size](uint32_t word) {
            return header::set_field<header::sample_size_shift, header::sample_size_mask>(
                word, sample_size);
        });
    }

    Status patch_encoding(Encoding encoding) noexcept {
        if (auto err = detail::check_encoding(encoding)) {
            return err;
        }
        uint32_t code = *header::encoding_code(encoding);
        return modify([code](uint32_t word) {
            return header::set_field<header::encoding_shift, header::encoding_mask>(word, code);
        });
    }

    Status patch_sample_rate(uint32_t sample_rate) noexcept {
        if (auto err = detail::check_sample_rate(sample_rate)) {
            return err;
        }
        uint32_t code = *header::sample_rate_code(sample_rate);
        return modify([code](uint32_t word) {
            return header::set_field<header::sample_rate_shift, header::sample_rate_mask>(word,
                                                                                         code);
        });
    }

    Status patch_bits_per_sample(uint8_t bits) noexcept {
        if (auto err = detail::check_bits_per_sample(bits)) {
            return err;
        }
        uint32_t code = *header::bits_code(bits);
        return modify([code](uint32_t word) {
            return header::set_field<header::bits_shift, header::bits_mask>(word, code);
        });
    }

    Status patch_channels(uint8_t channels) noexcept {
        if (auto err = detail::check_channels(channels)) {
            return err;
        }
        uint32_t stored = static_cast<uint32_t>(channels - 1);
        return modify([stored](uint32_t word) {
            return header::set_field<header::channels_shift, header::channels_mask>(word, stored);
        });
    }

    /**
     * @brief Set or clear the ID
     *
     * Setting writes 8 bytes at offset 4 and needs a 12-byte buffer. If a PTS
     * is present its bytes move with the ID-present bit so the PTS keeps its
     * value: setting the ID shifts it from offset 4 to 12 (needs 20 bytes),
     * clearing the ID shifts it back from 12 to 4. Bytes left behind are not
     * zeroed.
     */
    Status patch_id(std::optional<uint64_t> id) noexcept {
        auto checked = checked_word();
        if (auto* err = std::get_if<HeaderError>(&checked)) {
            return *err;
        }
        uint32_t word = std::get<uint32_t>(checked);
        auto decoded = detail::decode_word(word, layout());
        uint8_t* data = bytes_mut_.data();
        size_t size = bytes_mut_.size();

        if (id) {
            bool move_pts = decoded.has_pts && !decoded.has_id;
            size_t required = move_pts ? detail::header_size(true, true)
                                       : detail::id_offset + optional_field_size;
            if (size < required) {
                return make_error(ValidationError::insufficient_capacity, size);
            }
            if (move_pts) {
                std::memmove(data + detail::pts_offset(true), data + detail::pts_offset(false),
                             optional_field_size);
            }
            detail::write_u64(data, detail::id_offset, *id);
        } else if (decoded.has_id && decoded.has_pts) {
            if (size < detail::header_size(true, true)) {
                return make_error(ValidationError::field_out_of_bounds, size);
            }
            std::memmove(data + detail::pts_offset(false), data + detail::pts_offset(true),
                         optional_field_size);
        }

        detail::write_u32(data, 0, header::set_bit<header::id_present_shift>(word, id.has_value()));
        return std::nullopt;
    }

    /**
     * @brief Set or clear the PTS
     *
     * The PTS goes at offset 4, or 12 when the ID-present bit is set.
     * Layouts without a PTS field reject a value and accept clearing.
     */
    Status patch_pts(std::optional<uint64_t> pts) noexcept {
        auto checked = checked_word();
        if (auto* err = std::get_if<HeaderError>(&checked)) {
            return *err;
        }
        uint32_t word = std::get<uint32_t>(checked);

        if (!layout().supports_pts) {
            if (pts) {
                return make_error(ValidationError::unsupported_field, *pts);
            }
            return std::nullopt;
        }

        if (pts) {
            size_t offset = detail::pts_offset(header::get_bit<header::id_present_shift>(word));
            if (bytes_mut_.size() < offset + optional_field_size) {
                return make_error(ValidationError::insufficient_capacity, bytes_mut_.size());
            }
            detail::write_u64(bytes_mut_.data(), offset, *pts);
        }

        detail::write_u32(bytes_mut_.data(), 0,
                          header::set_bit<header::pts_present_shift>(word, pts.has_value()));
        return std::nullopt;
    }

private:
    // Header word after full structural validation
    Result<uint32_t> checked_word() const noexcept {
        auto word = raw_word();
        if (auto* err = std::get_if<HeaderError>(&word)) {
            return *err;
        }
        if (auto err = detail::check_word(std::get<uint32_t>(word), layout())) {
            return *err;
        }
        return word;
    }

    template <typename Func>
    Status modify(Func&& func) noexcept {
        auto checked = checked_word();
        if (auto* err = std::get_if<HeaderError>(&checked)) {
            return *err;
        }
        detail::write_u32(bytes_mut_.data(), 0, func(std::get<uint32_t>(checked)));
        return std::nullopt;
    }

    std::span<uint8_t> bytes_mut_;
};

// ========================================================================
// Free-function surface over raw byte spans
// ========================================================================

inline Result<bool> validate(std::span<const uint8_t> bytes,
                             const WireLayout& layout = layout_v2) noexcept {
    return ConstHeaderView(bytes, layout).validate();
}

inline Result<uint16_t> extract_sample_count(std::span<const uint8_t> bytes,
                                             const WireLayout& layout = layout_v2) noexcept {
    return ConstHeaderView(bytes, layout).sample_count();
}

inline Result<Encoding> extract_encoding(std::span<const uint8_t> bytes,
                                         const WireLayout& layout = layout_v2) noexcept {
    return ConstHeaderView(bytes, layout).encoding();
}

inline Result<std::optional<uint64_t>> extract_id(std::span<const uint8_t> bytes,
                                                  const WireLayout& layout = layout_v2) noexcept {
    return ConstHeaderView(bytes, layout).id();
}

inline Result<std::optional<uint64_t>> extract_pts(std::span<const uint8_t> bytes,
                                                   const WireLayout& layout = layout_v2) noexcept {
    return ConstHeaderView(bytes, layout).pts();
}

inline Result<size_t> extract_header_size(std::span<const uint8_t> bytes,
                                          const WireLayout& layout = layout_v2) noexcept {
    return ConstHeaderView(bytes, layout).header_size();
}

inline Status patch_sample_size(std::span<uint8_t> bytes, uint16_t sample_size,
                                const WireLayout& layout = layout_v2) noexcept {
    return HeaderView(bytes, layout).patch_sample_size(sample_size);
}

inline Status patch_encoding(std::span<uint8_t> bytes, Encoding encoding,
                             const WireLayout& layout = layout_v2) noexcept {
    return HeaderView(bytes, layout).patch_encoding(encoding);
}

inline Status patch_sample_rate(std::span<uint8_t> bytes, uint32_t sample_rate,
                                const WireLayout& layout = layout_v2) noexcept {
    return HeaderView(bytes, layout).patch_sample_rate(sample_rate);
}

inline Status patch_bits_per_sample(std::span<uint8_t> bytes, uint8_t bits,
                                    const WireLayout& layout = layout_v2) noexcept {
    return HeaderView(bytes, layout).patch_bits_per_sample(bits);
}

inline Status patch_channels(std::span<uint8_t> bytes, uint8_t channels,
                             const WireLayout& layout = layout_v2) noexcept {
    return HeaderView(bytes, layout).patch_channels(channels);
}

inline Status patch_id(std::span<uint8_t> bytes, std::optional<uint64_t> id,
                       const WireLayout& layout = layout_v2) noexcept {
    return HeaderView(bytes, layout).patch_id(id);
}

inline Status patch_pts(std::span<uint8_t> bytes, std::optional<uint64_t> pts,
                        const WireLayout& layout = layout_v2) noexcept {
    return HeaderView(bytes, layout).patch_pts(pts);
}

} // namespace framehdr
