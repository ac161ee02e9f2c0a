#pragma once

#include <array>
#include <optional>
#include <span>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../core/detail/buffer_io.hpp"
#include "../core/detail/word_decode.hpp"
#include "../core/error.hpp"
#include "../core/frame_header.hpp"
#include "../core/layout.hpp"
#include "byte_io.hpp"

namespace framehdr {

namespace detail {

inline HeaderError read_failure(ReadStatus status, size_t requested) noexcept {
    return make_error(status == ReadStatus::end_of_input ? ValidationError::end_of_input
                                                         : ValidationError::stream_error,
                      requested);
}

template <ByteSource Source>
Result<uint64_t> read_optional_field(Source& source) {
    std::array<uint8_t, optional_field_size> bytes{};
    ReadStatus status = source.read_exact(bytes);
    if (status != ReadStatus::ok) {
        return read_failure(status, bytes.size());
    }
    return read_u64(bytes.data(), 0);
}

} // namespace detail

/**
 * @brief Serialize a header to a byte sink
 *
 * Writes the big-endian header word, then the ID (if present), then the PTS
 * (if present). The bytes are assembled first and handed to the sink in a
 * single write, so a header that can't be encoded writes nothing.
 *
 * @param hdr Header to encode
 * @param sink Destination
 * @param layout Wire layout revision (canonical by default)
 * @return Empty on success, otherwise the error
 */
template <ByteSink Sink>
Status encode(const FrameHeader& hdr, Sink& sink, const WireLayout& layout = layout_v2) {
    auto word = detail::encode_word(hdr, layout);
    if (auto* err = std::get_if<HeaderError>(&word)) {
        return *err;
    }

    std::array<uint8_t, max_header_size> bytes{};
    size_t offset = 0;
    detail::write_u32(bytes.data(), offset, std::get<uint32_t>(word));
    offset += fixed_word_size;

    if (auto id = hdr.id()) {
        detail::write_u64(bytes.data(), offset, *id);
        offset += optional_field_size;
    }
    if (auto pts = hdr.pts()) {
        detail::write_u64(bytes.data(), offset, *pts);
        offset += optional_field_size;
    }

    if (!sink.write(std::span<const uint8_t>(bytes.data(), offset))) {
        return make_error(ValidationError::stream_error, offset);
    }
    return std::nullopt;
}

/**
 * @brief Deserialize a header from a byte source
 *
 * Reads exactly 4 bytes and checks the magic before anything else, then the
 * remaining fixed fields, then reads the ID and PTS the presence bits call
 * for. A source that runs dry reports end_of_input; a malformed word reports
 * the field that failed.
 *
 * @param source Byte source positioned at the header
 * @param layout Wire layout revision (canonical by default)
 * @return Decoded header or error
 */
template <ByteSource Source>
Result<FrameHeader> decode(Source& source, const WireLayout& layout = layout_v2) {
    std::array<uint8_t, fixed_word_size> word_bytes{};
    ReadStatus status = source.read_exact(word_bytes);
    if (status != ReadStatus::ok) {
        return detail::read_failure(status, word_bytes.size());
    }

    uint32_t word = detail::read_u32(word_bytes.data(), 0);
    if (auto err = detail::check_word(word, layout)) {
        return *err;
    }
    auto decoded = detail::decode_word(word, layout);

    std::optional<uint64_t> id;
    if (decoded.has_id) {
        auto value = detail::read_optional_field(source);
        if (auto* err = std::get_if<HeaderError>(&value)) {
            return *err;
        }
        id = std::get<uint64_t>(value);
    }

    std::optional<uint64_t> pts;
    if (decoded.has_pts) {
        auto value = detail::read_optional_field(source);
        if (auto* err = std::get_if<HeaderError>(&value)) {
            return *err;
        }
        pts = std::get<uint64_t>(value);
    }

    return detail::header_from_word(word, layout, id, pts);
}

/**
 * Decode a header from the start of a byte span
 */
inline Result<FrameHeader> decode(std::span<const uint8_t> bytes,
                                  const WireLayout& layout = layout_v2) {
    SpanSource source(bytes);
    return decode(source, layout);
}

/**
 * Encode a header into a freshly allocated vector of exactly hdr.size() bytes
 */
inline Result<std::vector<uint8_t>> encode_to_vector(const FrameHeader& hdr,
                                                     const WireLayout& layout = layout_v2) {
    std::vector<uint8_t> out;
    out.reserve(hdr.size());
    VectorSink sink(out);
    if (auto err = encode(hdr, sink, layout)) {
        return *err;
    }
    return out;
}

} // namespace framehdr
