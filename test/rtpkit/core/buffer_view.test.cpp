/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/core/containers/buffer_view.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("rtpkit::BufferView", "[buffer_view]") {
    SECTION("Default constructed view is empty") {
        const rtpkit::BufferView<const uint8_t> view;
        REQUIRE(view.data() == nullptr);
        REQUIRE(view.empty());
        REQUIRE(view.size() == 0);
    }

    SECTION("A null pointer results in an empty view") {
        const rtpkit::BufferView<const uint8_t> view(nullptr, 10);
        REQUIRE(view.empty());
    }

    SECTION("View from vector") {
        const std::vector<uint16_t> data {1, 2, 3};
        const rtpkit::BufferView<const uint16_t> view(data);
        REQUIRE(view.data() == data.data());
        REQUIRE(view.size() == 3);
        REQUIRE(view.size_bytes() == 6);
        REQUIRE(view[2] == 3);
    }

    SECTION("View from array") {
        constexpr std::array<uint8_t, 4> data {0x01, 0x02, 0x03, 0x04};
        const rtpkit::BufferView<const uint8_t> view(data);
        REQUIRE(view.size() == 4);

        size_t sum = 0;
        for (const auto v : view) {
            sum += v;
        }
        REQUIRE(sum == 10);
    }

    SECTION("read_be()") {
        constexpr std::array<uint8_t, 4> data {0x01, 0x02, 0x03, 0x04};
        const rtpkit::BufferView<const uint8_t> view(data);
        REQUIRE(view.read_be<uint32_t>(0) == 0x01020304);
        REQUIRE(view.read_be<uint16_t>(2) == 0x0304);
    }

    SECTION("subview()") {
        constexpr std::array<uint8_t, 5> data {0, 1, 2, 3, 4};
        const rtpkit::BufferView<const uint8_t> view(data);

        const auto tail = view.subview(2);
        REQUIRE(tail.size() == 3);
        REQUIRE(tail[0] == 2);

        const auto middle = view.subview(1, 2);
        REQUIRE(middle.size() == 2);
        REQUIRE(middle[1] == 2);

        REQUIRE(view.subview(3, 10).size() == 2);
        REQUIRE(view.subview(10).empty());
        REQUIRE(view.subview(10, 2).empty());
    }
}
