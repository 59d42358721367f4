/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/rtp/rtp_packet.hpp"

#include "rtpkit/rtp/rtp.hpp"

#include <fmt/format.h>

rtpkit::rtp::Packet::Packet(
    const bool marker_bit, const uint8_t payload_type, const uint16_t sequence_number, const uint32_t timestamp,
    const uint32_t ssrc, const BufferView<const uint8_t> payload
) :
    marker_bit_(marker_bit),
    payload_type_(payload_type),
    sequence_number_(sequence_number),
    timestamp_(timestamp),
    ssrc_(ssrc),
    payload_(payload) {}

size_t rtpkit::rtp::Packet::size() const {
    return kRtpHeaderBaseLengthOctets + payload_.size();
}

void rtpkit::rtp::Packet::encode(ByteBuffer& buffer) const {
    buffer.reserve(buffer.size() + size());

    uint8_t v_p_x_cc = 0;
    v_p_x_cc |= kRtpVersion << 6;
    v_p_x_cc |= 0b00000000;  // No padding.
    v_p_x_cc |= 0b00000000;  // No extension.
    v_p_x_cc |= 0b00000000;  // CSRC count of 0.
    buffer.write_be(v_p_x_cc);

    uint8_t m_pt = 0;
    m_pt |= marker_bit_ ? 0b10000000 : 0b00000000;
    m_pt |= payload_type_ & 0b01111111;
    buffer.write_be(m_pt);

    buffer.write_be(sequence_number_);
    buffer.write_be(timestamp_);
    buffer.write_be(ssrc_);

    buffer.write(payload_.data(), payload_.size());
}

std::string rtpkit::rtp::Packet::to_string() const {
    return fmt::format(
        "RTP Packet: marker_bit={} payload_type={} sequence_number={} timestamp={} ssrc={} payload_length={}",
        marker_bit_, payload_type_, sequence_number_, timestamp_, ssrc_, payload_.size()
    );
}
