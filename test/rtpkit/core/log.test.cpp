/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/core/log.hpp"

#include <catch2/catch_all.hpp>

namespace {

bool is_level_enabled(const char* level) {
#if RTPKIT_ENABLE_SPDLOG
    if (rtpkit::string_compare_case_insensitive(level, "debug")) {
        return spdlog::should_log(spdlog::level::debug);
    }
    return spdlog::should_log(spdlog::level::info);
#else
    if (rtpkit::string_compare_case_insensitive(level, "debug")) {
        return rtpkit::log_level.load() >= rtpkit::LogLevel::debug;
    }
    return rtpkit::log_level.load() >= rtpkit::LogLevel::info;
#endif
}

}  // namespace

TEST_CASE("rtpkit::set_log_level()", "[log]") {
    SECTION("Level names are case-insensitive") {
        rtpkit::set_log_level("DeBuG");
        REQUIRE(is_level_enabled("debug"));
        REQUIRE(is_level_enabled("info"));
    }

    SECTION("Higher levels disable lower ones") {
        rtpkit::set_log_level("warn");
        REQUIRE_FALSE(is_level_enabled("debug"));
        REQUIRE_FALSE(is_level_enabled("info"));
    }

    SECTION("Off disables everything") {
        rtpkit::set_log_level("off");
        REQUIRE_FALSE(is_level_enabled("info"));
    }

    SECTION("An unknown level falls back to info") {
        rtpkit::set_log_level("verbose");
        REQUIRE_FALSE(is_level_enabled("debug"));
        REQUIRE(is_level_enabled("info"));
    }

    SECTION("A missing environment variable selects info") {
        rtpkit::set_log_level_from_env("RTPKIT_LOG_LEVEL_NOT_SET_IN_TESTS");
        REQUIRE_FALSE(is_level_enabled("debug"));
        REQUIRE(is_level_enabled("info"));
    }

    rtpkit::set_log_level_from_env();
}
