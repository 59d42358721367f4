/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/rtp/rtcp_packet.hpp"

#include <fmt/format.h>

rtpkit::rtcp::Packet::Packet(const uint8_t payload_type, const BufferView<const uint8_t> payload) :
    payload_type_(payload_type), length_(static_cast<uint16_t>(payload.size())), payload_(payload) {}

std::string rtpkit::rtcp::Packet::to_string() const {
    return fmt::format(
        "RTCP Packet: report_count={} payload_type={} length={}", report_count_, payload_type_, length_
    );
}
