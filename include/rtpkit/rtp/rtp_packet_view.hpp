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
#include <optional>
#include <string>
#include <vector>

#include "rtp_error.hpp"
#include "rtpkit/core/containers/buffer_view.hpp"
#include "rtpkit/core/expected.hpp"

namespace rtpkit::rtp {

/**
 * RTP header extension. The data points into the packet it was decoded from and its size is always a multiple of 4.
 */
struct Extension {
    /// Defined by profile.
    uint16_t profile_id {};
    BufferView<const uint8_t> data;
};

/**
 * Functions for reading RTP header data. The data given is not copied or otherwise managed by this class so it's
 * cheap to create and use but make sure to keep the data alive while using this class.
 * A view can only be obtained through decode(), which validates all variable length fields so that the accessors
 * never read outside the given data.
 * RFC 3550 https://datatracker.ietf.org/doc/html/rfc3550
 */
class PacketView {
  public:
    /**
     * Decodes an RTP packet from the given data.
     * @param data The RTP packet data.
     * @param size_bytes The size of the RTP packet data in bytes.
     * @return A view over the data, or the first validation error found.
     */
    static tl::expected<PacketView, Error> decode(const uint8_t* data, size_t size_bytes);

    /**
     * Decodes an RTP packet from the given buffer.
     * @param buffer The RTP packet data.
     * @return A view over the data, or the first validation error found.
     */
    static tl::expected<PacketView, Error> decode(BufferView<const uint8_t> buffer);

    /**
     * @returns The version of the RTP header.
     */
    [[nodiscard]] uint8_t version() const;

    /**
     * @returns True if the padding bit is set.
     */
    [[nodiscard]] bool padding() const;

    /**
     * @returns True if the extension bit is set.
     */
    [[nodiscard]] bool extension() const;

    /**
     * @returns The number of CSRC identifiers in the header.
     */
    [[nodiscard]] uint32_t csrc_count() const;

    /**
     * @returns True if the marker bit is set.
     */
    [[nodiscard]] bool marker_bit() const;

    /**
     * @returns The payload type.
     */
    [[nodiscard]] uint8_t payload_type() const;

    /**
     * @returns The sequence number.
     */
    [[nodiscard]] uint16_t sequence_number() const;

    /**
     * @returns The timestamp.
     */
    [[nodiscard]] uint32_t timestamp() const;

    /**
     * @return The synchronization source identifier.
     */
    [[nodiscard]] uint32_t ssrc() const;

    /**
     * Gets the CSRC identifier at the given index.
     * @param index The index of the CSRC identifier.
     * @returns The CSRC identifier, or 0 if the index is out of range.
     */
    [[nodiscard]] uint32_t csrc(uint32_t index) const;

    /**
     * @returns All CSRC identifiers, in the order they appear in the packet.
     */
    [[nodiscard]] std::vector<uint32_t> csrc_list() const;

    /**
     * @return The header extension, or an empty optional if the extension bit is not set.
     */
    [[nodiscard]] std::optional<Extension> header_extension() const;

    /**
     * @returns The number of padding bytes at the end of the packet, including the count byte itself.
     */
    [[nodiscard]] size_t padding_length() const;

    /**
     * @returns Returns the length of the header which is also the start index of the payload data.
     */
    [[nodiscard]] size_t header_total_length() const;

    /**
     * @return Returns a view to the payload data, excluding any padding. May be empty.
     */
    [[nodiscard]] BufferView<const uint8_t> payload_data() const;

    /**
     * @return Returns the size of the RTP packet in bytes.
     */
    [[nodiscard]] size_t size() const;

    /**
     * @return Returns the data of the RTP packet.
     */
    [[nodiscard]] const uint8_t* data() const;

    /**
     * @returns A string representation of the RTP header.
     */
    [[nodiscard]] std::string to_string() const;

  private:
    const uint8_t* data_ {};
    size_t size_bytes_ {0};

    PacketView(const uint8_t* data, size_t size_bytes);

    [[nodiscard]] size_t extension_offset() const;
    [[nodiscard]] size_t extension_length() const;
};

}  // namespace rtpkit::rtp
