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

namespace rtpkit::rtcp {

/**
 * An RTCP packet constructed from a payload type and a raw body. The report count is always 0 and the length holds the
 * size of the body in bytes. The body is referenced, not copied.
 */
class Packet {
  public:
    /**
     * @param payload_type The payload type.
     * @param payload The body of the packet. The length field is 16 bits wide, so the length of a body larger than
     * 65535 bytes is truncated to its lower 16 bits.
     */
    Packet(uint8_t payload_type, BufferView<const uint8_t> payload);

    [[nodiscard]] uint8_t report_count() const {
        return report_count_;
    }

    [[nodiscard]] uint8_t payload_type() const {
        return payload_type_;
    }

    [[nodiscard]] uint16_t length() const {
        return length_;
    }

    [[nodiscard]] BufferView<const uint8_t> payload_data() const {
        return payload_;
    }

    /**
     * @returns A string representation of the packet.
     */
    [[nodiscard]] std::string to_string() const;

  private:
    uint8_t report_count_ {0};
    uint8_t payload_type_ {0};
    uint16_t length_ {0};
    BufferView<const uint8_t> payload_;
};

}  // namespace rtpkit::rtcp
