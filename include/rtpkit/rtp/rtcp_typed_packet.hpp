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
#include <string_view>
#include <variant>
#include <vector>

#include "rtcp.hpp"
#include "rtcp_error.hpp"
#include "rtcp_report_block_view.hpp"
#include "rtpkit/core/containers/buffer_view.hpp"
#include "rtpkit/core/expected.hpp"
#include "rtpkit/ntp/ntp_timestamp.hpp"

namespace rtpkit::rtcp {

/**
 * Sender report (PT=200).
 *
 *  0                   1                   2                   3
 *  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |V=2|P|    RC   |   PT=SR=200   |             length            | header
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                         SSRC of sender                        |
 * +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
 * |              NTP timestamp, most significant word             | sender
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+ info
 * |             NTP timestamp, least significant word             |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                         RTP timestamp                         |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                     sender's packet count                     |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                      sender's octet count                     |
 * +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
 * |                 report blocks (RC times 24 bytes)             |
 * +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
 * |                  profile-specific extensions                  |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 */
struct SenderReport {
    uint32_t ssrc {};
    ntp::Timestamp ntp_timestamp;
    uint32_t rtp_timestamp {};
    uint32_t packet_count {};
    uint32_t octet_count {};
    std::vector<ReportBlockView> report_blocks;
    BufferView<const uint8_t> profile_extension;
};

/**
 * Receiver report (PT=201). Same as the sender report, without the sender info.
 */
struct ReceiverReport {
    uint32_t ssrc {};
    std::vector<ReportBlockView> report_blocks;
    BufferView<const uint8_t> profile_extension;
};

enum class SdesItemType : uint8_t {
    end = 0,
    cname = 1,
    name = 2,
    email = 3,
    phone = 4,
    loc = 5,
    tool = 6,
    note = 7,
    priv = 8,
};

struct SdesItem {
    SdesItemType type {};
    std::string_view text;
};

struct SdesChunk {
    uint32_t ssrc {};
    std::vector<SdesItem> items;
};

/**
 * Source description (PT=202). SC chunks, each an SSRC/CSRC followed by a list of items terminated by a null octet
 * and padded to a 32-bit boundary.
 */
struct SourceDescription {
    std::vector<SdesChunk> chunks;
};

/**
 * Goodbye (PT=203). SC SSRC/CSRC identifiers, optionally followed by a length prefixed reason.
 */
struct Goodbye {
    std::vector<uint32_t> ssrcs;
    std::optional<std::string_view> reason;
};

/**
 * Application-defined (PT=204).
 */
struct ApplicationDefined {
    uint8_t subtype {};
    uint32_t ssrc {};
    std::string_view name;
    BufferView<const uint8_t> data;
};

/**
 * Any packet type which is not one of the above.
 */
struct UnknownPacket {
    uint8_t packet_type {};
    uint8_t count {};
    BufferView<const uint8_t> body;
};

using TypedPacket =
    std::variant<SenderReport, ReceiverReport, SourceDescription, Goodbye, ApplicationDefined, UnknownPacket>;

/**
 * Decodes the first RTCP packet in the given data into the representation matching its packet type. The length field
 * is honored, so data following the first packet (as in a compound packet) is ignored.
 * All views in the result point into the given data, keep it alive while using the result.
 * @param data The RTCP packet data.
 * @param size_bytes The size of the data.
 * @return The decoded packet, or the first validation error found.
 */
tl::expected<TypedPacket, Error> decode_typed(const uint8_t* data, size_t size_bytes);

/**
 * @param packet The packet.
 * @return The packet type of given typed packet.
 */
PacketType type_of(const TypedPacket& packet);

}  // namespace rtpkit::rtcp
