/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/core/exception.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("rtpkit::Exception", "[exception]") {
    SECTION("Message only") {
        const rtpkit::Exception e("Something went wrong");
        REQUIRE(std::string(e.what()) == "Something went wrong");
        REQUIRE(e.file() == nullptr);
        REQUIRE(e.to_string() == "Something went wrong");
    }

    SECTION("Location is appended without directories") {
        const rtpkit::Exception e("Bad MTU", "/src/rtpkit/rtp/rtp_packetizer.cpp", 33, "Packetizer");
        REQUIRE(std::string(e.what()) == "Bad MTU");
        REQUIRE(e.line() == 33);
        REQUIRE(e.to_string() == "Bad MTU (rtp_packetizer.cpp:33 in Packetizer)");
        REQUIRE(fmt::format("{}", e) == "Bad MTU (rtp_packetizer.cpp:33 in Packetizer)");
    }

    SECTION("Thrown through the macro") {
        try {
            RTPKIT_THROW_EXCEPTION("Macro thrown");
        } catch (const rtpkit::Exception& e) {
            REQUIRE(std::string(e.what()) == "Macro thrown");
            REQUIRE(e.file() != nullptr);
            REQUIRE(e.line() > 0);
            REQUIRE(e.function_name() != nullptr);
            REQUIRE_THAT(e.to_string(), Catch::Matchers::StartsWith("Macro thrown (exception.test.cpp:"));
        }
    }
}
