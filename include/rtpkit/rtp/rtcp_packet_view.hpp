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
#include <string>

#include "rtcp.hpp"
#include "rtcp_error.hpp"
#include "rtpkit/core/containers/buffer_view.hpp"
#include "rtpkit/core/expected.hpp"

namespace rtpkit::rtcp {

/**
 * Generic view over a single RTCP packet: the common header plus an opaque payload. The payload is assumed to start
 * after one 24 byte block per count plus one additional 24 byte block, regardless of the packet type. Use
 * decode_typed() for type specific parsing.
 * The data is not copied, keep it alive while using this class.
 */
class PacketView {
  public:
    /**
     * Decodes an RTCP packet from the given data.
     * @param data The RTCP packet data.
     * @param size_bytes The size of the RTCP packet in bytes.
     * @return A view over the data, or the first validation error found.
     */
    static tl::expected<PacketView, Error> decode(const uint8_t* data, size_t size_bytes);

    /**
     * Decodes an RTCP packet from the given buffer.
     * @param buffer The RTCP packet data.
     * @return A view over the data, or the first validation error found.
     */
    static tl::expected<PacketView, Error> decode(BufferView<const uint8_t> buffer);

    /**
     * @returns The version of the RTCP header.
     */
    [[nodiscard]] uint8_t version() const;

    /**
     * @returns True if the padding bit is set.
     */
    [[nodiscard]] bool padding() const;

    /**
     * @returns The report count (or source count, or subtype, depending on the packet type). Zero is a valid value.
     */
    [[nodiscard]] uint8_t report_count() const;

    /**
     * @return The payload type, masked to 7 bits.
     */
    [[nodiscard]] uint8_t payload_type() const;

    /**
     * @return The packet type, classified from the full 8-bit packet type field.
     */
    [[nodiscard]] PacketType packet_type() const;

    /**
     * @returns The length field as encoded in the data (32-bit words minus one). Not validated against the size.
     */
    [[nodiscard]] uint16_t length() const;

    /**
     * @return The payload, excluding padding. May be empty.
     */
    [[nodiscard]] BufferView<const uint8_t> payload_data() const;

    /**
     * @returns The pointer to the data.
     */
    [[nodiscard]] const uint8_t* data() const;

    /**
     * @return The size of the data in bytes.
     */
    [[nodiscard]] size_t size() const;

    /**
     * @returns A string representation of the RTCP header.
     */
    [[nodiscard]] std::string to_string() const;

  private:
    const uint8_t* data_ {};
    size_t size_bytes_ {0};

    PacketView(const uint8_t* data, size_t size_bytes);

    [[nodiscard]] size_t payload_offset() const;
    [[nodiscard]] size_t padding_length() const;
};

}  // namespace rtpkit::rtcp
