/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/core/util/wrapping_uint.hpp"

#include <catch2/catch_all.hpp>

template<class T>
void test_wrapping_uint() {
    using Uint = rtpkit::WrappingUint<T>;
    constexpr auto max = std::numeric_limits<T>::max();

    SECTION("Equality") {
        Uint lhs(1);
        Uint rhs(1);

        REQUIRE(lhs == rhs);
        REQUIRE_FALSE(lhs != rhs);

        rhs = 2;

        REQUIRE_FALSE(lhs == rhs);
        REQUIRE(lhs != rhs);
    }

    SECTION("Relational") {
        Uint lhs(0);
        Uint rhs(1);

        REQUIRE(rhs > lhs);
        REQUIRE(rhs >= lhs);
        REQUIRE_FALSE(rhs < lhs);
        REQUIRE_FALSE(rhs <= lhs);

        lhs = max;
        rhs = 0;

        REQUIRE(rhs > lhs);
        REQUIRE(rhs >= lhs);
        REQUIRE_FALSE(rhs < lhs);
        REQUIRE_FALSE(rhs <= lhs);

        lhs = static_cast<T>(max - 10);
        rhs = 10;

        REQUIRE(rhs > lhs);
        REQUIRE_FALSE(rhs < lhs);

        lhs = max / 2;
        rhs = max / 2;

        REQUIRE_FALSE(rhs > lhs);
        REQUIRE(rhs >= lhs);
        REQUIRE_FALSE(rhs < lhs);
        REQUIRE(rhs <= lhs);
    }

    SECTION("Increment wraps around") {
        Uint value(max);
        value += 1;
        REQUIRE(value.value() == 0);

        value += 5;
        REQUIRE(value.value() == 5);

        REQUIRE((value + static_cast<T>(max)).value() == 4);
    }

    SECTION("Decrement wraps around") {
        Uint value(0);
        value -= 1;
        REQUIRE(value.value() == max);

        REQUIRE((value - static_cast<T>(max)).value() == 0);
    }

    SECTION("Diff") {
        REQUIRE(Uint(0).diff(Uint(10)) == 10);
        REQUIRE(Uint(10).diff(Uint(0)) == -10);
        REQUIRE(Uint(max).diff(Uint(1)) == 2);
        REQUIRE(Uint(1).diff(Uint(max)) == -2);
        REQUIRE(Uint(5).diff(Uint(5)) == 0);
    }
}

TEST_CASE("rtpkit::WrappingUint", "[wrapping_uint]") {
    SECTION("uint8_t") {
        test_wrapping_uint<uint8_t>();
    }

    SECTION("uint16_t") {
        test_wrapping_uint<uint16_t>();
    }

    SECTION("uint32_t") {
        test_wrapping_uint<uint32_t>();
    }

    SECTION("uint64_t") {
        test_wrapping_uint<uint64_t>();
    }
}
