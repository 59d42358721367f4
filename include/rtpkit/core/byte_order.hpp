/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <type_traits>

// This defines RTPKIT_LITTLE_ENDIAN and RTPKIT_BIG_ENDIAN macros indicating the byte order of the system.
#if (defined(__BYTE_ORDER__) && (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)) || (defined(__BIG_ENDIAN__) && __BIG_ENDIAN__)
    #define RTPKIT_LITTLE_ENDIAN 0
    #define RTPKIT_BIG_ENDIAN 1

namespace rtpkit {
static constexpr bool little_endian = false;
static constexpr bool big_endian = true;
}  // namespace rtpkit

#else
    #define RTPKIT_LITTLE_ENDIAN 1
    #define RTPKIT_BIG_ENDIAN 0

namespace rtpkit {
static constexpr bool little_endian = true;
static constexpr bool big_endian = false;
}  // namespace rtpkit
#endif

#if defined(__clang__) || defined(__GNUC__)
    #define RTPKIT_BYTE_SWAP_16(x) __builtin_bswap16(x)
    #define RTPKIT_BYTE_SWAP_32(x) __builtin_bswap32(x)
    #define RTPKIT_BYTE_SWAP_64(x) __builtin_bswap64(x)
#elif defined(_MSC_VER)
    #include <intrin.h>
    #define RTPKIT_BYTE_SWAP_16(x) _byteswap_ushort(x)
    #define RTPKIT_BYTE_SWAP_32(x) _byteswap_ulong(x)
    #define RTPKIT_BYTE_SWAP_64(x) _byteswap_uint64(x)
#else
    #error "Unsupported compiler"
#endif

namespace rtpkit {

/**
 * @tparam Type The type of the value to swap.
 * @param value The value to swap.
 * @return The value with the bytes swapped.
 */
template<typename Type, std::enable_if_t<std::is_integral_v<Type>, bool> = true>
Type swap_bytes(Type value) {
    if constexpr (sizeof(Type) == 1) {
        return value;
    } else if constexpr (sizeof(Type) == 2) {
        return static_cast<Type>(RTPKIT_BYTE_SWAP_16(static_cast<uint16_t>(value)));
    } else if constexpr (sizeof(Type) == 4) {
        return static_cast<Type>(RTPKIT_BYTE_SWAP_32(static_cast<uint32_t>(value)));
    } else {
        static_assert(sizeof(Type) == 8, "Unsupported integer size");
        return static_cast<Type>(RTPKIT_BYTE_SWAP_64(static_cast<uint64_t>(value)));
    }
}

/**
 * Swaps the bytes of the given value if the system is little-endian.
 * @tparam Type The type of the value to swap.
 * @param value The value to swap.
 * @return The value with the bytes swapped.
 */
template<typename Type, std::enable_if_t<std::is_integral_v<Type>, bool> = true>
Type swap_if_le(const Type value) {
    if constexpr (little_endian) {
        return swap_bytes(value);
    } else {
        return value;
    }
}

/**
 * Reads a value from the given data in native byte order (not to be confused with network-endian).
 * @tparam Type The type of the value to read.
 * @param data The data which holds the encoded value.
 * @return The decoded value.
 */
template<typename Type, std::enable_if_t<std::is_trivially_copyable_v<Type>, bool> = true>
Type read_ne(const uint8_t* data) {
    Type value;
    std::memcpy(std::addressof(value), data, sizeof(Type));
    return value;
}

/**
 * Reads a big-endian value from the given data.
 * @tparam Type The type of the value to read.
 * @param data The data which holds the encoded value.
 * @return The decoded value.
 */
template<typename Type, std::enable_if_t<std::is_integral_v<Type>, bool> = true>
Type read_be(const uint8_t* data) {
    return swap_if_le(read_ne<Type>(data));
}

/**
 * Writes a value to the given destination in native byte order (not to be confused with network-endian).
 * @tparam Type The type of the value to write.
 * @param dst The destination where the value should be written.
 * @param value The value to write.
 */
template<typename Type, std::enable_if_t<std::is_trivially_copyable_v<Type>, bool> = true>
void write_ne(uint8_t* dst, const Type value) {
    std::memcpy(dst, std::addressof(value), sizeof(Type));
}

/**
 * Writes a big-endian value to the given destination.
 * @tparam Type The type of the value to write.
 * @param dst The destination where the value should be written.
 * @param value The value to write.
 */
template<typename Type, std::enable_if_t<std::is_integral_v<Type>, bool> = true>
void write_be(uint8_t* dst, const Type value) {
    write_ne(dst, swap_if_le(value));
}

}  // namespace rtpkit
