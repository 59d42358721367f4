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
#include <cstdint>

namespace rtpkit::rtp {

/// RFC 3550 protocol version, carried in the top two bits of the first octet.
constexpr uint8_t kRtpVersion = 2;

/// Length of the fixed RTP header, up to and including the SSRC.
constexpr size_t kRtpHeaderBaseLengthOctets = 12;

constexpr size_t kCsrcLengthOctets = 4;

/// Profile id plus the length field (in 32-bit words) which precede the header extension data.
constexpr size_t kHeaderExtensionHeaderLengthOctets = 4;

}  // namespace rtpkit::rtp
