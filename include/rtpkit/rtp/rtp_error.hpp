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

#include <cstddef>
#include <ostream>

#include <fmt/ostream.h>

namespace rtpkit::rtp {

/**
 * The reasons why an RTP packet can fail to decode. Validation stops at the first violation.
 */
enum class ErrorCode {
    /// The buffer is shorter than the fixed header. Value: the buffer length.
    invalid_len,
    /// The version field is not 2. Value: the version found.
    invalid_version,
    /// The CSRC list does not fit in the buffer. Value: the CSRC count.
    invalid_csrc_count,
    /// The extension bit is set but the extension header does not fit in the buffer.
    missing_extension,
    /// The header extension does not fit in the buffer. Value: extension length in bytes, including its header.
    invalid_extension_length,
    /// The padding does not fit in the buffer. Value: the padding length.
    invalid_padding,
};

/**
 * Decode error, carrying the offending value for diagnostics.
 */
struct Error {
    ErrorCode code {};
    size_t value {};

    friend bool operator==(const Error& lhs, const Error& rhs) {
        return lhs.code == rhs.code && lhs.value == rhs.value;
    }

    friend bool operator!=(const Error& lhs, const Error& rhs) {
        return !(lhs == rhs);
    }
};

inline std::ostream& operator<<(std::ostream& os, const ErrorCode code) {
    switch (code) {
        case ErrorCode::invalid_len:
            os << "invalid_len";
            break;
        case ErrorCode::invalid_version:
            os << "invalid_version";
            break;
        case ErrorCode::invalid_csrc_count:
            os << "invalid_csrc_count";
            break;
        case ErrorCode::missing_extension:
            os << "missing_extension";
            break;
        case ErrorCode::invalid_extension_length:
            os << "invalid_extension_length";
            break;
        case ErrorCode::invalid_padding:
            os << "invalid_padding";
            break;
    }
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << error.code;
    if (error.code != ErrorCode::missing_extension) {
        os << "(" << error.value << ")";
    }
    return os;
}

}  // namespace rtpkit::rtp

/// Make rtp::ErrorCode printable with fmt
template<>
struct fmt::formatter<rtpkit::rtp::ErrorCode>: ostream_formatter {};

/// Make rtp::Error printable with fmt
template<>
struct fmt::formatter<rtpkit::rtp::Error>: ostream_formatter {};
