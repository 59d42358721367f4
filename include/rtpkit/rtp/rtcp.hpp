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

namespace rtpkit::rtcp {

constexpr uint8_t kRtcpVersion = 2;

/// Version, padding, count, packet type and length.
constexpr size_t kHeaderLength = 4;

constexpr size_t kReportBlockLength = 24;

/// NTP timestamp, RTP timestamp, packet count and octet count.
constexpr size_t kSenderInfoLength = 20;

enum class PacketType {
    /// Sender report, for transmission and reception statistics from participants that are active senders
    sender_report,
    /// Receiver report, for reception statistics from participants that are not active senders
    receiver_report,
    /// Source description items, including CNAME
    source_description,
    /// Indicates end of participation
    bye,
    /// Application-specific functions
    app,
    /// Unknown packet type
    unknown,
};

/**
 * @param packet_type The 8-bit packet type as found on the wire.
 * @return The matching packet type, or PacketType::unknown.
 */
PacketType packet_type_from_value(uint8_t packet_type);

/**
 * @param packet_type The type to get a string representation for.
 * @return A string representation of given packet type.
 */
const char* packet_type_to_string(PacketType packet_type);

}  // namespace rtpkit::rtcp
