#pragma once

#include <bit>
#include <concepts>

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace framehdr::detail {

static_assert(std::endian::native == std::endian::little ||
                  std::endian::native == std::endian::big,
              "Mixed endianness not supported");

// Wire integers: the header word and the two optional 64-bit fields
template <typename T>
concept WireInteger = std::same_as<T, uint32_t> || std::same_as<T, uint64_t>;

template <WireInteger T>
constexpr T byteswap(T value) noexcept {
    if constexpr (sizeof(T) == 4) {
        return __builtin_bswap32(value);
    } else {
        return __builtin_bswap64(value);
    }
}

/**
 * Convert between host order and big-endian wire order
 *
 * The conversion is its own inverse, so the same call serves both directions.
 */
template <WireInteger T>
constexpr T to_wire_order(T value) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        return byteswap(value);
    } else {
        return value;
    }
}

/**
 * @brief Big-endian loads and stores at a byte offset
 *
 * Every field the header carries moves between host integers and wire bytes
 * through load_be/store_be. Callers check bounds; these helpers never do.
 * std::memcpy keeps unaligned offsets safe.
 */
template <WireInteger T>
inline T load_be(const uint8_t* buffer, size_t offset) noexcept {
    T raw;
    std::memcpy(&raw, buffer + offset, sizeof(raw));
    return to_wire_order(raw);
}

template <WireInteger T>
inline void store_be(uint8_t* buffer, size_t offset, T value) noexcept {
    const T raw = to_wire_order(value);
    std::memcpy(buffer + offset, &raw, sizeof(raw));
}

inline uint32_t read_u32(const uint8_t* buffer, size_t offset) noexcept {
    return load_be<uint32_t>(buffer, offset);
}

inline uint64_t read_u64(const uint8_t* buffer, size_t offset) noexcept {
    return load_be<uint64_t>(buffer, offset);
}

inline void write_u32(uint8_t* buffer, size_t offset, uint32_t value) noexcept {
    store_be(buffer, offset, value);
}

inline void write_u64(uint8_t* buffer, size_t offset, uint64_t value) noexcept {
    store_be(buffer, offset, value);
}

} // namespace framehdr::detail
