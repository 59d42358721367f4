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

#include <cstdlib>
#include <iostream>

#include "exception.hpp"
#include "log.hpp"

/**
 * When RTPKIT_LOG_ON_ASSERT is defined as true (1), a log message will be emitted when an assertion is hit. Default
 * is on.
 */
#ifndef RTPKIT_LOG_ON_ASSERT
    #define RTPKIT_LOG_ON_ASSERT 1
#endif

/**
 * When RTPKIT_THROW_EXCEPTION_ON_ASSERT is defined as true (1), an exception will be thrown when an assertion is hit.
 * Default is off.
 */
#ifndef RTPKIT_THROW_EXCEPTION_ON_ASSERT
    #define RTPKIT_THROW_EXCEPTION_ON_ASSERT 0
#endif

/**
 * When RTPKIT_ABORT_ON_ASSERT is defined as true (1), program execution will abort when an assertion is hit. Default
 * is off.
 */
#ifndef RTPKIT_ABORT_ON_ASSERT
    #define RTPKIT_ABORT_ON_ASSERT 0
#endif

#define RTPKIT_LOG_IF_ENABLED(msg) \
    if (RTPKIT_LOG_ON_ASSERT) {    \
        RTPKIT_CRITICAL(msg);      \
    }

#define RTPKIT_THROW_EXCEPTION_IF_ENABLED(msg) \
    if (RTPKIT_THROW_EXCEPTION_ON_ASSERT) {    \
        RTPKIT_THROW_EXCEPTION(msg);           \
    }

#define RTPKIT_ABORT_IF_ENABLED(msg)                               \
    if (RTPKIT_ABORT_ON_ASSERT) {                                  \
        std::cerr << "Abort on assertion: " << (msg) << std::endl; \
        std::abort();                                              \
    }

/**
 * Assert condition to be true, otherwise:
 *  - Logs if enabled
 *  - Throws if enabled
 *  - Aborts if enabled
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 */
#define RTPKIT_ASSERT(condition, message)                                    \
    do {                                                                     \
        if (!(condition)) {                                                  \
            RTPKIT_LOG_IF_ENABLED("Assertion failure: " message)             \
            RTPKIT_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            RTPKIT_ABORT_IF_ENABLED(message)                                 \
        }                                                                    \
    } while (false)

/**
 * Same as RTPKIT_ASSERT, but returns given `return_value` if `condition` is false.
 * @param condition The condition to test.
 * @param message The message for logging, throwing and/or aborting.
 * @param return_value The value to return.
 */
#define RTPKIT_ASSERT_RETURN_WITH(condition, message, return_value)          \
    do {                                                                     \
        if (!(condition)) {                                                  \
            RTPKIT_LOG_IF_ENABLED("Assertion failure: " message)             \
            RTPKIT_THROW_EXCEPTION_IF_ENABLED("Assertion failure: " message) \
            RTPKIT_ABORT_IF_ENABLED(message)                                 \
            return return_value;                                             \
        }                                                                    \
    } while (false)
