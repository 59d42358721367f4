/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/core/string.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("rtpkit::string_compare_case_insensitive()", "[string]") {
    REQUIRE(rtpkit::string_compare_case_insensitive("trace", "TRACE"));
    REQUIRE(rtpkit::string_compare_case_insensitive("Warn", "wARN"));
    REQUIRE(rtpkit::string_compare_case_insensitive("", ""));
    REQUIRE_FALSE(rtpkit::string_compare_case_insensitive("info", "infos"));
    REQUIRE_FALSE(rtpkit::string_compare_case_insensitive("debug", "debog"));
}
