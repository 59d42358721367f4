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
#include <cstddef>

// Note: these constants are treated as tri-state variables, so they can be 0, 1, or undefined.

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32__) || defined(__NT__)
    #define RTPKIT_WINDOWS 1
#else
    #define RTPKIT_WINDOWS 0
#endif

#if defined(__APPLE__)
    #define RTPKIT_APPLE 1
    #define RTPKIT_POSIX 1
#else
    #define RTPKIT_APPLE 0
#endif

#if defined(__linux__)
    #define RTPKIT_LINUX 1
    #define RTPKIT_POSIX 1  // Most distributions are mostly POSIX compliant.
#else
    #define RTPKIT_LINUX 0
#endif

#ifndef RTPKIT_POSIX
    #if defined(_POSIX_VERSION)
        #define RTPKIT_POSIX 1
    #else
        #define RTPKIT_POSIX 0
    #endif
#endif

#if defined(_MSC_VER)
    #define RTPKIT_FUNCTION __FUNCSIG__
#else
    #define RTPKIT_FUNCTION __PRETTY_FUNCTION__
#endif
