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
#include "rtpkit/rtp/rtp_packet_view.hpp"

#include <catch2/catch_all.hpp>

#include <vector>

TEST_CASE("rtpkit::rtp::Packet") {
    const std::vector<uint8_t> payload = {0x01, 0x02, 0x03, 0x04, 0x05};

    SECTION("Encode an RTP packet") {
        const rtpkit::rtp::Packet packet(
            false, 0xff, 0x0012, 0x00003456, 0x0000789a, rtpkit::BufferView<const uint8_t>(payload)
        );

        REQUIRE(packet.csrc_count() == 0);
        REQUIRE(packet.size() == 17);
        REQUIRE(packet.payload_data().data() == payload.data());

        rtpkit::ByteBuffer buffer;
        packet.encode(buffer);
        REQUIRE(buffer.size() == 17);

        const std::vector<uint8_t> encoded(buffer.data(), buffer.data() + buffer.size());
        REQUIRE(
            encoded
            == std::vector<uint8_t> {
                0x80,                    // v=2, p=0, x=0, cc=0
                0x7f,                    // m=0, pt=0xff masked to 7 bits
                0x00, 0x12,              // Sequence number
                0x00, 0x00, 0x34, 0x56,  // Timestamp
                0x00, 0x00, 0x78, 0x9a,  // SSRC
                0x01, 0x02, 0x03, 0x04, 0x05,  // Payload
            }
        );
    }

    SECTION("The marker bit ends up in the top bit of the second byte") {
        const rtpkit::rtp::Packet packet(true, 96, 1, 2, 3, rtpkit::BufferView<const uint8_t>(payload));

        rtpkit::ByteBuffer buffer;
        packet.encode(buffer);
        REQUIRE(buffer.data()[1] == 0xe0);
    }

    SECTION("Encoding appends to the buffer") {
        const rtpkit::rtp::Packet packet(false, 96, 1, 2, 3, {});
        REQUIRE(packet.size() == 12);

        rtpkit::ByteBuffer buffer;
        packet.encode(buffer);
        packet.encode(buffer);
        REQUIRE(buffer.size() == 24);
    }

    SECTION("Decoding an encoded packet yields the same fields") {
        const rtpkit::rtp::Packet packet(
            true, 127, 0xffff, 0xffffffff, 0xdeadbeef, rtpkit::BufferView<const uint8_t>(payload)
        );

        rtpkit::ByteBuffer buffer;
        packet.encode(buffer);

        const auto view = rtpkit::rtp::PacketView::decode(buffer.data(), buffer.size());
        REQUIRE(view.has_value());
        REQUIRE(view->marker_bit() == packet.marker_bit());
        REQUIRE(view->payload_type() == packet.payload_type());
        REQUIRE(view->sequence_number() == packet.sequence_number());
        REQUIRE(view->timestamp() == packet.timestamp());
        REQUIRE(view->ssrc() == packet.ssrc());
        REQUIRE(view->csrc_count() == 0);
        REQUIRE_FALSE(view->extension());
        REQUIRE_FALSE(view->padding());

        const auto decoded_payload = view->payload_data();
        REQUIRE(std::vector<uint8_t>(decoded_payload.begin(), decoded_payload.end()) == payload);
    }

    SECTION("To string") {
        const rtpkit::rtp::Packet packet(true, 96, 1, 2, 3, rtpkit::BufferView<const uint8_t>(payload));
        REQUIRE(
            packet.to_string()
            == "RTP Packet: marker_bit=true payload_type=96 sequence_number=1 timestamp=2 ssrc=3 payload_length=5"
        );
    }
}
