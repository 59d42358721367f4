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

#include "rtpkit/core/byte_order.hpp"

#include <vector>

namespace rtpkit {

/**
 * A wrapper around std::vector with some facilities for writing integers to it in network byte order.
 */
class ByteBuffer {
  public:
    ByteBuffer() = default;
    explicit ByteBuffer(const size_t size) : data_(size) {}

    /**
     * @return A pointer to the data in the buffer.
     */
    [[nodiscard]] const uint8_t* data() const {
        return data_.data();
    }

    /**
     * @return The current size of the buffer.
     */
    [[nodiscard]] size_t size() const {
        return data_.size();
    }

    /**
     * Clears the data.
     */
    void clear() {
        data_.clear();
    }

    /**
     * Reserves capacity for at least given number of bytes.
     * @param size The number of bytes.
     */
    void reserve(const size_t size) {
        data_.reserve(size);
    }

    /**
     * Appends given data to the buffer.
     * @param data The data to append.
     * @param size The size of the data.
     */
    void write(const uint8_t* data, const size_t size) {
        if (data == nullptr || size == 0) {
            return;
        }
        data_.insert(data_.end(), data, data + size);
    }

    /**
     * Writes a value to the buffer in native byte order (not to be confused with network-endian).
     * @tparam Type The type of the value to write.
     * @param value The value to write.
     */
    template<typename Type, std::enable_if_t<std::is_trivially_copyable_v<Type>, bool> = true>
    void write_ne(const Type value) {
        write(reinterpret_cast<const uint8_t*>(std::addressof(value)), sizeof(Type));
    }

    /**
     * Writes a big-endian value to the buffer.
     * @tparam Type The type of the value to write.
     * @param value The value to write.
     */
    template<typename Type, std::enable_if_t<std::is_integral_v<Type>, bool> = true>
    void write_be(const Type value) {
        write_ne(swap_if_le(value));
    }

  private:
    std::vector<uint8_t> data_;
};

}  // namespace rtpkit
