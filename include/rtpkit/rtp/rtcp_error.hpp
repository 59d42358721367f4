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

namespace rtpkit::rtcp {

/**
 * The reasons why an RTCP packet can fail to decode. Validation stops at the first violation.
 */
enum class ErrorCode {
    /// The buffer is shorter than the RTCP header. Value: the buffer length.
    invalid_len,
    /// The version field is not 2. Value: the version found.
    invalid_version,
    /// The blocks announced by the count field do not fit in the buffer. Value: the count.
    packet_too_short,
    /// The padding does not fit in the buffer. Value: the padding length.
    invalid_padding,
    /// The length field describes more data than available. Value: the length in bytes described by the length field.
    invalid_length,
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
        case ErrorCode::packet_too_short:
            os << "packet_too_short";
            break;
        case ErrorCode::invalid_padding:
            os << "invalid_padding";
            break;
        case ErrorCode::invalid_length:
            os << "invalid_length";
            break;
    }
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.code << "(" << error.value << ")";
}

}  // namespace rtpkit::rtcp

/// Make rtcp::ErrorCode printable with fmt
template<>
struct fmt::formatter<rtpkit::rtcp::ErrorCode>: ostream_formatter {};

/// Make rtcp::Error printable with fmt
template<>
struct fmt::formatter<rtpkit::rtcp::Error>: ostream_formatter {};
