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
#include <string>

#include "rtpkit/core/containers/buffer_view.hpp"
#include "rtpkit/core/containers/byte_buffer.hpp"

namespace rtpkit::rtp {

/**
 * An outgoing RTP packet: explicit header fields plus a payload which is referenced, not copied. The packet always has
 * a CSRC count of 0, no header extension and no padding. Keep the payload data alive for as long as the packet is used.
 * No validation is done, the caller is expected to pass protocol-legal values.
 */
class Packet {
  public:
    /**
     * @param marker_bit The marker bit.
     * @param payload_type The payload type. Only the lower 7 bits end up on the wire.
     * @param sequence_number The sequence number.
     * @param timestamp The timestamp.
     * @param ssrc The synchronization source identifier.
     * @param payload The payload.
     */
    Packet(
        bool marker_bit, uint8_t payload_type, uint16_t sequence_number, uint32_t timestamp, uint32_t ssrc,
        BufferView<const uint8_t> payload
    );

    [[nodiscard]] bool marker_bit() const {
        return marker_bit_;
    }

    [[nodiscard]] uint8_t payload_type() const {
        return payload_type_;
    }

    [[nodiscard]] uint16_t sequence_number() const {
        return sequence_number_;
    }

    [[nodiscard]] uint32_t timestamp() const {
        return timestamp_;
    }

    [[nodiscard]] uint32_t ssrc() const {
        return ssrc_;
    }

    [[nodiscard]] uint32_t csrc_count() const {
        return 0;
    }

    [[nodiscard]] BufferView<const uint8_t> payload_data() const {
        return payload_;
    }

    /**
     * @return The number of bytes encode() will write.
     */
    [[nodiscard]] size_t size() const;

    /**
     * Encodes the RTP packet into given buffer. This method appends to the buffer as-is, the caller is responsible to
     * prepare the buffer (clear it after previous calls).
     * @param buffer The buffer to write to.
     */
    void encode(ByteBuffer& buffer) const;

    /**
     * @returns A string representation of the packet.
     */
    [[nodiscard]] std::string to_string() const;

  private:
    bool marker_bit_ {false};
    uint8_t payload_type_ {0};
    uint16_t sequence_number_ {0};
    uint32_t timestamp_ {0};
    uint32_t ssrc_ {0};
    BufferView<const uint8_t> payload_;
};

}  // namespace rtpkit::rtp
