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

#include "env.hpp"
#include "platform.hpp"
#include "string.hpp"

#include <atomic>

#ifndef RTPKIT_ENABLE_SPDLOG
    #define RTPKIT_ENABLE_SPDLOG 0
#endif

#if RTPKIT_ENABLE_SPDLOG

    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

    #if RTPKIT_APPLE
        #define SPDLOG_FUNCTION __PRETTY_FUNCTION__
    #endif

    #include <spdlog/spdlog.h>

    #ifndef RTPKIT_TRACE
        #define RTPKIT_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
    #endif

    #ifndef RTPKIT_DEBUG
        #define RTPKIT_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
    #endif

    #ifndef RTPKIT_CRITICAL
        #define RTPKIT_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
    #endif

    #ifndef RTPKIT_ERROR
        #define RTPKIT_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
    #endif

    #ifndef RTPKIT_WARNING
        #define RTPKIT_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
    #endif

    #ifndef RTPKIT_INFO
        #define RTPKIT_INFO(...) SPDLOG_INFO(__VA_ARGS__)
    #endif

#else

    #include <fmt/format.h>

namespace rtpkit {

enum class LogLevel { off, critical, error, warning, info, debug, trace };

inline std::atomic<LogLevel> log_level {LogLevel::info};

}  // namespace rtpkit

    #define RTPKIT_LOG_IMPL(level, prefix, ...)                        \
        if (rtpkit::log_level.load() >= rtpkit::LogLevel::level) {     \
            fmt::print(prefix " {}\n", fmt::format(__VA_ARGS__));      \
        }

    #ifndef RTPKIT_TRACE
        #define RTPKIT_TRACE(...) RTPKIT_LOG_IMPL(trace, "[T]", __VA_ARGS__)
    #endif

    #ifndef RTPKIT_DEBUG
        #define RTPKIT_DEBUG(...) RTPKIT_LOG_IMPL(debug, "[D]", __VA_ARGS__)
    #endif

    #ifndef RTPKIT_CRITICAL
        #define RTPKIT_CRITICAL(...) RTPKIT_LOG_IMPL(critical, "[C]", __VA_ARGS__)
    #endif

    #ifndef RTPKIT_ERROR
        #define RTPKIT_ERROR(...) RTPKIT_LOG_IMPL(error, "[E]", __VA_ARGS__)
    #endif

    #ifndef RTPKIT_WARNING
        #define RTPKIT_WARNING(...) RTPKIT_LOG_IMPL(warning, "[W]", __VA_ARGS__)
    #endif

    #ifndef RTPKIT_INFO
        #define RTPKIT_INFO(...) RTPKIT_LOG_IMPL(info, "[I]", __VA_ARGS__)
    #endif

#endif

namespace rtpkit {

/**
 * Sets the log level for the application based on the given string.
 * The following are valid values:
 *  - TRACE
 *  - DEBUG
 *  - INFO (default)
 *  - WARN
 *  - ERROR
 *  - CRITICAL
 *  - OFF
 * @param level The log level as string, case-insensitive.
 */
inline void set_log_level(const char* level) {
#if RTPKIT_ENABLE_SPDLOG
    if (string_compare_case_insensitive(level, "TRACE")) {
        spdlog::set_level(spdlog::level::trace);
    } else if (string_compare_case_insensitive(level, "DEBUG")) {
        spdlog::set_level(spdlog::level::debug);
    } else if (string_compare_case_insensitive(level, "INFO")) {
        spdlog::set_level(spdlog::level::info);
    } else if (string_compare_case_insensitive(level, "WARN")) {
        spdlog::set_level(spdlog::level::warn);
    } else if (string_compare_case_insensitive(level, "ERROR")) {
        spdlog::set_level(spdlog::level::err);
    } else if (string_compare_case_insensitive(level, "CRITICAL")) {
        spdlog::set_level(spdlog::level::critical);
    } else if (string_compare_case_insensitive(level, "OFF")) {
        spdlog::set_level(spdlog::level::off);
    } else {
        spdlog::warn("Invalid log level: {}. Setting log level to info.", level);
        spdlog::set_level(spdlog::level::info);
    }
#else
    if (string_compare_case_insensitive(level, "TRACE")) {
        log_level = LogLevel::trace;
    } else if (string_compare_case_insensitive(level, "DEBUG")) {
        log_level = LogLevel::debug;
    } else if (string_compare_case_insensitive(level, "INFO")) {
        log_level = LogLevel::info;
    } else if (string_compare_case_insensitive(level, "WARN")) {
        log_level = LogLevel::warning;
    } else if (string_compare_case_insensitive(level, "ERROR")) {
        log_level = LogLevel::error;
    } else if (string_compare_case_insensitive(level, "CRITICAL")) {
        log_level = LogLevel::critical;
    } else if (string_compare_case_insensitive(level, "OFF")) {
        log_level = LogLevel::off;
    } else {
        fmt::print("Invalid log level: {}. Setting log level to info.\n", level);
        log_level = LogLevel::info;
    }
#endif
}

/**
 * Tries to find given environment variable and set the log level accordingly. See set_log_level() for valid values.
 * By default the log level is set to INFO.
 * @param env_var The environment variable to read the log level from.
 */
inline void set_log_level_from_env(const char* env_var = "RTPKIT_LOG_LEVEL") {
    if (const auto env_value = get_env(env_var)) {
        set_log_level(env_value->c_str());
    } else {
        set_log_level("INFO");
    }
}

}  // namespace rtpkit
