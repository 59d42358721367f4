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
#include <vector>

#include "rtp_packet.hpp"
#include "rtpkit/core/containers/buffer_view.hpp"
#include "rtpkit/core/random.hpp"
#include "rtpkit/core/util/wrapping_uint.hpp"

namespace rtpkit::rtp {

/**
 * Slices encoded media frames into RTP packets which fit the MTU. One instance corresponds to one outgoing media
 * source. This class is not thread safe: calls to packetize() must be serialized by the owner, otherwise the sequence
 * numbers will interleave.
 */
class Packetizer {
  public:
    /**
     * Constructs a packetizer with a random initial sequence number and timestamp, as recommended by RFC 3550.
     * @param mtu The maximum size of an RTP packet in bytes, including the header. Must be larger than the RTP header.
     * @param payload_type The payload type of the packets.
     * @param ssrc The synchronization source identifier of the packets.
     * @param random The source of randomness for the initial sequence number and timestamp.
     * @throws rtpkit::Exception if the MTU can't hold at least 1 byte of payload.
     */
    Packetizer(size_t mtu, uint8_t payload_type, uint32_t ssrc, Random& random);

    /**
     * Constructs a packetizer with given initial sequence number and timestamp.
     * @param mtu The maximum size of an RTP packet in bytes, including the header. Must be larger than the RTP header.
     * @param payload_type The payload type of the packets.
     * @param ssrc The synchronization source identifier of the packets.
     * @param initial_sequence_number The sequence number preceding the first emitted packet.
     * @param initial_timestamp The timestamp preceding the first frame.
     * @throws rtpkit::Exception if the MTU can't hold at least 1 byte of payload.
     */
    Packetizer(
        size_t mtu, uint8_t payload_type, uint32_t ssrc, uint16_t initial_sequence_number, uint32_t initial_timestamp
    );

    /**
     * Splits one encoded frame into RTP packets. The timestamp is advanced by frame_duration first and shared by all
     * packets of the frame, the sequence number is incremented for each packet and only the last packet has the marker
     * bit set. The packets refer to the given payload, which must outlive them. An empty payload results in no packets.
     * @param payload The encoded frame.
     * @param frame_duration The duration of the frame, in timestamp units.
     * @return The packets, in order.
     */
    std::vector<Packet> packetize(BufferView<const uint8_t> payload, uint32_t frame_duration);

    /**
     * @return The maximum packet size.
     */
    [[nodiscard]] size_t mtu() const {
        return mtu_;
    }

    /**
     * @return The maximum number of payload bytes per packet.
     */
    [[nodiscard]] size_t max_payload_size() const;

    [[nodiscard]] uint8_t payload_type() const {
        return payload_type_;
    }

    [[nodiscard]] uint32_t ssrc() const {
        return ssrc_;
    }

    /**
     * @return The sequence number of the last emitted packet, or the initial value if nothing has been emitted yet.
     */
    [[nodiscard]] uint16_t sequence_number() const {
        return sequence_number_.value();
    }

    /**
     * @return The timestamp of the last packetized frame, or the initial value if nothing has been packetized yet.
     */
    [[nodiscard]] uint32_t timestamp() const {
        return timestamp_.value();
    }

  private:
    size_t mtu_ {};
    uint8_t payload_type_ {};
    uint32_t ssrc_ {};
    WrappingUint16 sequence_number_;
    WrappingUint32 timestamp_;
};

}  // namespace rtpkit::rtp
