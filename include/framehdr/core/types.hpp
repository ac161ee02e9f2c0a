#pragma once

#include <cstddef>
#include <cstdint>

namespace framehdr {

// Payload codec carried by the frame
enum class Encoding : uint8_t {
    pcm_signed = 0, // Signed integer PCM
    pcm_float = 1,  // IEEE float PCM
    opus = 2,
    flac = 3,
    aac = 4,
    h264 = 5 // Reserved: no wire code in the 3-bit field yet
};

// Byte order of the payload samples (never of the header itself)
enum class Endianness : uint8_t {
    little = 0,
    big = 1
};

// Header sizes in bytes
inline constexpr size_t fixed_word_size = 4;
inline constexpr size_t optional_field_size = 8;
inline constexpr size_t max_header_size = fixed_word_size + 2 * optional_field_size;

// Field ranges
inline constexpr uint16_t max_sample_size = 0xFFF;
inline constexpr uint8_t min_channels = 1;
inline constexpr uint8_t max_channels = 16;

// Error codes shared by construction, codec, inspection and patching
enum class ValidationError : uint8_t {
    none = 0,                // No error
    buffer_too_small,        // Fewer than 4 bytes for the fixed word
    invalid_magic,           // Magic field doesn't match the layout
    invalid_encoding,        // Encoding has no wire code
    invalid_sample_rate,     // Sample rate outside the legal set
    invalid_bits_per_sample, // Bit depth outside the legal set
    invalid_channels,        // Channel count outside [1, 16]
    invalid_sample_size,     // Sample size above 4095
    unsupported_field,       // Optional field the layout cannot carry
    field_out_of_bounds,     // Presence bit set but trailing bytes missing
    insufficient_capacity,   // Buffer has no room for the patched field
    end_of_input,            // Byte source ran dry
    stream_error,            // Byte source or sink failed
    invalid_id,              // Id representation could not be decoded
};

// Convert validation error to human-readable string
constexpr const char* validation_error_string(ValidationError err) noexcept {
    switch (err) {
        case ValidationError::none:
            return "No error";
        case ValidationError::buffer_too_small:
            return "Buffer smaller than the fixed header word";
        case ValidationError::invalid_magic:
            return "Invalid header magic word";
        case ValidationError::invalid_encoding:
            return "Invalid encoding flag";
        case ValidationError::invalid_sample_rate:
            return "Invalid sample rate";
        case ValidationError::invalid_bits_per_sample:
            return "Invalid bits per sample";
        case ValidationError::invalid_channels:
            return "Channel count must be between 1 and 16";
        case ValidationError::invalid_sample_size:
            return "Sample size exceeds maximum value (4095)";
        case ValidationError::unsupported_field:
            return "Field not supported by this header layout";
        case ValidationError::field_out_of_bounds:
            return "Header indicates a field the buffer is too small to hold";
        case ValidationError::insufficient_capacity:
            return "Buffer too small to hold the patched field";
        case ValidationError::end_of_input:
            return "Unexpected end of input";
        case ValidationError::stream_error:
            return "Byte stream failure";
        case ValidationError::invalid_id:
            return "Invalid id representation";
    }
    return "Unknown error";
}

constexpr const char* encoding_string(Encoding encoding) noexcept {
    switch (encoding) {
        case Encoding::pcm_signed:
            return "PCMSigned";
        case Encoding::pcm_float:
            return "PCMFloat";
        case Encoding::opus:
            return "Opus";
        case Encoding::flac:
            return "FLAC";
        case Encoding::aac:
            return "AAC";
        case Encoding::h264:
            return "H264";
    }
    return "Unknown";
}

constexpr const char* endianness_string(Endianness endianness) noexcept {
    return endianness == Endianness::big ? "BigEndian" : "LittleEndian";
}

} // namespace framehdr
