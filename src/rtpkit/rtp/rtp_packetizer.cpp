/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/rtp/rtp_packetizer.hpp"

#include "rtpkit/core/exception.hpp"
#include "rtpkit/core/log.hpp"
#include "rtpkit/rtp/rtp.hpp"

#include <fmt/format.h>

rtpkit::rtp::Packetizer::Packetizer(
    const size_t mtu, const uint8_t payload_type, const uint32_t ssrc, Random& random
) :
    Packetizer(mtu, payload_type, ssrc, random.get_random_uint<uint16_t>(), random.get_random_uint<uint32_t>()) {}

rtpkit::rtp::Packetizer::Packetizer(
    const size_t mtu, const uint8_t payload_type, const uint32_t ssrc, const uint16_t initial_sequence_number,
    const uint32_t initial_timestamp
) :
    mtu_(mtu),
    payload_type_(payload_type),
    ssrc_(ssrc),
    sequence_number_(initial_sequence_number),
    timestamp_(initial_timestamp) {
    if (mtu_ <= kRtpHeaderBaseLengthOctets) {
        RTPKIT_THROW_EXCEPTION(fmt::format("MTU of {} bytes leaves no room for payload", mtu_));
    }

    RTPKIT_DEBUG(
        "Packetizer created: mtu={} payload_type={} ssrc={} sequence_number={} timestamp={}", mtu_, payload_type_,
        ssrc_, sequence_number_.value(), timestamp_.value()
    );
}

std::vector<rtpkit::rtp::Packet>
rtpkit::rtp::Packetizer::packetize(const BufferView<const uint8_t> payload, const uint32_t frame_duration) {
    timestamp_ += frame_duration;

    const auto chunk_size = max_payload_size();
    const auto chunk_count = (payload.size() + chunk_size - 1) / chunk_size;

    std::vector<Packet> packets;
    packets.reserve(chunk_count);

    for (size_t index = 0; index < chunk_count; ++index) {
        sequence_number_ += 1;
        const bool last = index == chunk_count - 1;
        packets.emplace_back(
            last, payload_type_, sequence_number_.value(), timestamp_.value(), ssrc_,
            payload.subview(index * chunk_size, chunk_size)
        );
    }

    RTPKIT_TRACE(
        "Packetized {} bytes into {} packets (timestamp={} last_sequence_number={})", payload.size(), chunk_count,
        timestamp_.value(), sequence_number_.value()
    );

    return packets;
}

size_t rtpkit::rtp::Packetizer::max_payload_size() const {
    return mtu_ - kRtpHeaderBaseLengthOctets;
}
