/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/core/byte_order.hpp"

#include <catch2/catch_all.hpp>

#include <array>

TEST_CASE("rtpkit::byte_order", "[byte_order]") {
    SECTION("swap_bytes()") {
        constexpr uint16_t u16 = 0x1234;
        constexpr uint32_t u32 = 0x12345678;
        constexpr uint64_t u64 = 0x1234567890abcdef;

        REQUIRE(rtpkit::swap_bytes(u16) == 0x3412);
        REQUIRE(rtpkit::swap_bytes(u32) == 0x78563412);
        REQUIRE(rtpkit::swap_bytes(u64) == 0xefcdab9078563412);
        REQUIRE(rtpkit::swap_bytes(uint8_t {0x12}) == 0x12);
    }

    SECTION("read_be()") {
        constexpr std::array<uint8_t, 8> data {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
        REQUIRE(rtpkit::read_be<uint16_t>(data.data()) == 0x0102);
        REQUIRE(rtpkit::read_be<uint32_t>(data.data()) == 0x01020304);
        REQUIRE(rtpkit::read_be<uint64_t>(data.data()) == 0x0102030405060708);
        REQUIRE(rtpkit::read_be<uint32_t>(data.data() + 3) == 0x04050607);
    }

    SECTION("write_be()") {
        std::array<uint8_t, 6> data {};
        rtpkit::write_be<uint16_t>(data.data(), 0xabcd);
        rtpkit::write_be<uint32_t>(data.data() + 2, 0x01020304);
        REQUIRE(data == std::array<uint8_t, 6> {0xab, 0xcd, 0x01, 0x02, 0x03, 0x04});
    }

    SECTION("Native byte order") {
        std::array<uint8_t, 4> data {};
        rtpkit::write_ne<uint32_t>(data.data(), 0x01020304);
        REQUIRE(rtpkit::read_ne<uint32_t>(data.data()) == 0x01020304);
#if RTPKIT_LITTLE_ENDIAN
        REQUIRE(data[0] == 0x04);
#else
        REQUIRE(data[0] == 0x01);
#endif
    }
}
