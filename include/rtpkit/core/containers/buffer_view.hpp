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

#include "rtpkit/core/assert.hpp"
#include "rtpkit/core/byte_order.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <vector>

namespace rtpkit {

/**
 * A class similar to std::string_view but for raw data buffers. The view does not own the data, keep the data alive
 * for as long as the view (or anything derived from it) is in use.
 * @tparam Type The data type.
 */
template<class Type>
class BufferView {
  public:
    BufferView() = default;

    /**
     * Construct a view pointing to given data.
     * @param data The data to refer to.
     * @param size The number of elements in the buffer.
     */
    BufferView(Type* data, const size_t size) : data_(data), size_(size) {
        if (data_ == nullptr) {
            size_ = 0;
        }
    }

    /**
     * Construct a view from a std::array.
     * @tparam S The size of the array.
     * @param array The array to refer to.
     */
    template<size_t S>
    explicit BufferView(const std::array<std::remove_const_t<Type>, S>& array) : BufferView(array.data(), array.size()) {}

    /**
     * Construct a view from a std::vector.
     * @param vector The vector to refer to.
     */
    explicit BufferView(const std::vector<std::remove_const_t<Type>>& vector) : BufferView(vector.data(), vector.size()) {}

    /**
     * @param index The index to access.
     * @returns Value for given index, without bounds checking.
     */
    Type& operator[](size_t index) const {
        return data_[index];
    }

    /**
     * @returns A pointer to the data, or nullptr if this view is not pointing at any data.
     */
    [[nodiscard]] Type* data() const {
        return data_;
    }

    /**
     * @returns The number of elements in the buffer.
     */
    [[nodiscard]] size_t size() const {
        return size_;
    }

    /**
     * @returns The size of the buffer in bytes.
     */
    [[nodiscard]] size_t size_bytes() const {
        return size_ * sizeof(Type);
    }

    /**
     * @returns True if the buffer is empty.
     */
    [[nodiscard]] bool empty() const {
        return size_ == 0;
    }

    [[nodiscard]] Type* begin() const {
        return data_;
    }

    [[nodiscard]] Type* end() const {
        return data_ + size_;
    }

    /**
     * Reads a big-endian value at given offset. Bounds are asserted, and behaviour depends on the RTPKIT_ASSERT
     * configuration.
     * @tparam ValueType The type of the value to read.
     * @param offset The offset (in bytes) to read from.
     * @return The decoded value, or 0 when reading out of bounds.
     */
    template<typename ValueType, std::enable_if_t<std::is_integral_v<ValueType>, bool> = true>
    ValueType read_be(const size_t offset) const {
        RTPKIT_ASSERT_RETURN_WITH(offset + sizeof(ValueType) <= size_bytes(), "Buffer view out of bounds", 0);
        return rtpkit::read_be<ValueType>(reinterpret_cast<const uint8_t*>(data_) + offset);
    }

    /**
     * @returns A new view pointing to a sub-range of this buffer.
     * @param offset The offset of the sub-range. Will be limited to the available size.
     */
    [[nodiscard]] BufferView subview(size_t offset) const {
        offset = std::min(offset, size_);
        return BufferView(data_ + offset, size_ - offset);
    }

    /**
     * @returns A new view pointing to a sub-range of this buffer.
     * @param offset The offset of the sub-range. Will be limited to the available size.
     * @param size The number of elements in the sub-range. The size will be limited to the available size.
     */
    [[nodiscard]] BufferView subview(size_t offset, const size_t size) const {
        offset = std::min(offset, size_);
        return BufferView(data_ + offset, std::min(size_ - offset, size));
    }

  private:
    Type* data_ {nullptr};
    size_t size_ {0};
};

}  // namespace rtpkit
