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
#include <limits>
#include <type_traits>

namespace rtpkit {

/**
 * Represents an unsigned integer with rollover (wraparound) semantics, like the sequence number and timestamp in RTP.
 * Comparison operators take wraparound into account: a value is considered newer than another when it is less than
 * half the range ahead of it.
 */
template<class T>
class WrappingUint {
    static_assert(std::is_integral_v<T>, "WrappingUint only supports integral types");
    static_assert(std::is_unsigned_v<T>, "WrappingUint only supports unsigned types");

  public:
    WrappingUint() = default;

    /**
     * @param value The initial value.
     */
    explicit WrappingUint(const T value) : value_(value) {}

    /**
     * @returns The current value.
     */
    [[nodiscard]] T value() const {
        return value_;
    }

    WrappingUint& operator=(const T value) {
        value_ = value;
        return *this;
    }

    /**
     * Increments the value using modulo arithmetic.
     * @param value The value to increment by.
     * @return This instance.
     */
    WrappingUint& operator+=(const T value) {
        value_ = static_cast<T>(value_ + value);
        return *this;
    }

    /**
     * Decrements the value using modulo arithmetic.
     * @param value The value to decrement by.
     * @return This instance.
     */
    WrappingUint& operator-=(const T value) {
        value_ = static_cast<T>(value_ - value);
        return *this;
    }

    [[nodiscard]] WrappingUint operator+(const T value) const {
        return WrappingUint(static_cast<T>(value_ + value));
    }

    [[nodiscard]] WrappingUint operator-(const T value) const {
        return WrappingUint(static_cast<T>(value_ - value));
    }

    friend bool operator==(const WrappingUint& lhs, const WrappingUint& rhs) {
        return lhs.value_ == rhs.value_;
    }

    friend bool operator!=(const WrappingUint& lhs, const WrappingUint& rhs) {
        return lhs.value_ != rhs.value_;
    }

    friend bool operator<(const WrappingUint& lhs, const WrappingUint& rhs) {
        return is_older_than(lhs.value_, rhs.value_);
    }

    friend bool operator<=(const WrappingUint& lhs, const WrappingUint& rhs) {
        return lhs < rhs || lhs == rhs;
    }

    friend bool operator>(const WrappingUint& lhs, const WrappingUint& rhs) {
        return !(lhs <= rhs);
    }

    friend bool operator>=(const WrappingUint& lhs, const WrappingUint& rhs) {
        return lhs > rhs || lhs == rhs;
    }

    /**
     * Calculates the difference between two values, taking into account wraparound.
     * The value will be positive if the other value is newer than this one, and negative if this one is newer.
     * @param other The other value.
     * @return The difference between the two values.
     */
    [[nodiscard]] std::make_signed_t<T> diff(const WrappingUint& other) const {
        if (is_older_than(other.value_, value_)) {
            return static_cast<std::make_signed_t<T>>(-static_cast<std::make_signed_t<T>>(static_cast<T>(value_ - other.value_)));
        }
        return static_cast<std::make_signed_t<T>>(static_cast<T>(other.value_ - value_));
    }

  private:
    T value_ {};

    /**
     * Checks if a is older than b, taking into account wraparound.
     */
    static bool is_older_than(T a, T b) {
        return a != b && static_cast<T>(b - a) < std::numeric_limits<T>::max() / 2 + 1;
    }
};

/// 16-bit wrapping unsigned integer, used for RTP sequence numbers.
using WrappingUint16 = WrappingUint<uint16_t>;

/// 32-bit wrapping unsigned integer, used for RTP timestamps.
using WrappingUint32 = WrappingUint<uint32_t>;

}  // namespace rtpkit
