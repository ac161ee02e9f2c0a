#pragma once

#include <optional>
#include <string>
#include <variant>

#include <cstdint>

#include "layout.hpp"
#include "types.hpp"

namespace framehdr {

namespace detail {

template <typename Table>
std::string format_table(const Table& table) {
    std::string out = "[";
    for (size_t i = 0; i < table.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += std::to_string(static_cast<uint32_t>(table[i]));
    }
    out += "]";
    return out;
}

} // namespace detail

/**
 * @brief Error result for a failed header operation
 *
 * Carries the error code plus the offending value (the rejected argument, or
 * the raw field read from the wire) so callers can self-correct.
 */
struct HeaderError {
    ValidationError code;  ///< What went wrong
    uint64_t value{0};     ///< Offending value, meaning depends on code
    bool wire_code{false}; ///< value is a raw field code read from the wire

    /**
     * @brief Get a human-readable error message
     * @return Description naming the offending value and the legal set
     */
    std::string error_message() const {
        if (wire_code) {
            return wire_code_message();
        }
        switch (code) {
            case ValidationError::invalid_sample_rate:
                return "Invalid sample rate: " + std::to_string(value) +
                       ". Must be one of: " + detail::format_table(header::sample_rates);
            case ValidationError::invalid_bits_per_sample:
                return "Invalid bits per sample: " + std::to_string(value) +
                       ". Must be one of: " + detail::format_table(header::bit_depths);
            case ValidationError::invalid_channels:
                return "Invalid channel count: " + std::to_string(value) +
                       ". Must be between " + std::to_string(min_channels) + " and " +
                       std::to_string(max_channels);
            case ValidationError::invalid_sample_size:
                return "Sample size " + std::to_string(value) + " exceeds maximum value (" +
                       std::to_string(max_sample_size) + ")";
            case ValidationError::invalid_encoding:
                return "Invalid encoding flag: " + std::to_string(value) +
                       ". Wire codes 0.." + std::to_string(header::max_encoding_code) +
                       " are defined";
            case ValidationError::invalid_magic:
                return "Invalid header magic word: 0x" + to_hex(value);
            case ValidationError::buffer_too_small:
            case ValidationError::field_out_of_bounds:
            case ValidationError::insufficient_capacity:
                return std::string(validation_error_string(code)) + " (" +
                       std::to_string(value) + " bytes)";
            default:
                return validation_error_string(code);
        }
    }

    friend bool operator==(const HeaderError&, const HeaderError&) = default;

private:
    // Codes are reported as codes, next to the range the field defines
    std::string wire_code_message() const {
        switch (code) {
            case ValidationError::invalid_sample_rate:
                return "Invalid sample rate code: " + std::to_string(value) +
                       ". Wire codes 0.." + std::to_string(header::sample_rates.size() - 1) +
                       " are defined";
            case ValidationError::invalid_bits_per_sample:
                return "Invalid bits per sample code: " + std::to_string(value) +
                       ". Wire codes 0.." + std::to_string(header::bit_depths.size() - 1) +
                       " are defined";
            case ValidationError::invalid_encoding:
                return "Invalid encoding code: " + std::to_string(value) + ". Wire codes 0.." +
                       std::to_string(header::max_encoding_code) + " are defined";
            default:
                return std::string(validation_error_string(code)) + " (code " +
                       std::to_string(value) + ")";
        }
    }

    static std::string to_hex(uint64_t v) {
        static constexpr char digits[] = "0123456789ABCDEF";
        std::string out;
        do {
            out.insert(out.begin(), digits[v & 0xF]);
            v >>= 4;
        } while (v != 0);
        return out;
    }
};

/**
 * @brief Value-or-error result of a header operation
 *
 * Holds either the produced value or the HeaderError that prevented it.
 */
template <typename T>
using Result = std::variant<T, HeaderError>;

// Operations that produce nothing return an empty optional on success
using Status = std::optional<HeaderError>;

template <typename T>
bool is_ok(const Result<T>& result) noexcept {
    return std::holds_alternative<T>(result);
}

template <typename T>
std::optional<HeaderError> error_of(const Result<T>& result) noexcept {
    if (const auto* err = std::get_if<HeaderError>(&result)) {
        return *err;
    }
    return std::nullopt;
}

inline HeaderError make_error(ValidationError code, uint64_t value = 0) noexcept {
    return HeaderError{code, value};
}

// Error for a field code read from the wire that maps to no value
inline HeaderError make_wire_error(ValidationError code, uint32_t raw_code) noexcept {
    return HeaderError{code, raw_code, true};
}

} // namespace framehdr
