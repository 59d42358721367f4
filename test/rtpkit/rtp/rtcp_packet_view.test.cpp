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
#include "rtpkit/rtp/rtcp_packet_view.hpp"

#include <catch2/catch_all.hpp>

#include <array>
#include <vector>

namespace {
std::array<uint8_t, 32> default_packet {
    0x80, 0xc8, 0x00, 0x07,  // v, p, rc | packet type | length
    0x04, 0x05, 0x06, 0x07,  // SSRC of sender
    0x08, 0x09, 0x0a, 0x0b,  // NTP MSW
    0x0c, 0x0d, 0x0e, 0x0f,  // NTP LSW
    0x10, 0x11, 0x12, 0x13,  // RTP timestamp
    0x14, 0x15, 0x16, 0x17,  // Senders packet count
    0x18, 0x19, 0x1a, 0x1b,  // Senders octet count
    0x1c, 0x1d, 0x1e, 0x04,  // Payload
};
}  // namespace

TEST_CASE("rtpkit::rtcp::PacketView::decode()", "[rtcp_packet_view]") {
    auto data = default_packet;

    SECTION("Header fields and payload") {
        const auto packet = rtpkit::rtcp::PacketView::decode(data.data(), data.size());
        REQUIRE(packet.has_value());
        REQUIRE(packet->version() == 2);
        REQUIRE_FALSE(packet->padding());
        REQUIRE(packet->report_count() == 0);
        REQUIRE(packet->payload_type() == (0xc8 & 0x7f));
        REQUIRE(packet->packet_type() == rtpkit::rtcp::PacketType::sender_report);
        REQUIRE(packet->length() == 7);
        REQUIRE(packet->size() == 32);
        REQUIRE(packet->payload_data().size() == 4);
        REQUIRE(packet->payload_data().data() == data.data() + 28);
    }

    SECTION("The length field is carried without validation") {
        data[2] = 0xff;
        data[3] = 0xff;
        const auto packet = rtpkit::rtcp::PacketView::decode(data.data(), data.size());
        REQUIRE(packet.has_value());
        REQUIRE(packet->length() == 0xffff);
    }

    SECTION("Padding is removed from the payload") {
        data[0] = 0xa0;
        const auto packet = rtpkit::rtcp::PacketView::decode(data.data(), data.size());
        REQUIRE(packet.has_value());
        REQUIRE(packet->padding());
        REQUIRE(packet->payload_data().empty());
    }

    SECTION("Padding exceeding the payload is rejected") {
        data[0] = 0xa0;
        data[31] = 0x05;
        const auto packet = rtpkit::rtcp::PacketView::decode(data.data(), data.size());
        REQUIRE(packet.error() == rtpkit::rtcp::Error {rtpkit::rtcp::ErrorCode::invalid_padding, 5});
    }

    SECTION("A report count requiring more blocks than available is rejected") {
        data[0] = 0x81;
        const auto packet = rtpkit::rtcp::PacketView::decode(data.data(), data.size());
        REQUIRE(packet.error() == rtpkit::rtcp::Error {rtpkit::rtcp::ErrorCode::packet_too_short, 1});
    }

    SECTION("A packet with only the header is too short") {
        const auto packet = rtpkit::rtcp::PacketView::decode(data.data(), 4);
        REQUIRE(packet.error() == rtpkit::rtcp::Error {rtpkit::rtcp::ErrorCode::packet_too_short, 0});
    }

    SECTION("The payload may be empty") {
        const auto packet = rtpkit::rtcp::PacketView::decode(data.data(), 28);
        REQUIRE(packet.has_value());
        REQUIRE(packet->payload_data().empty());
    }

    SECTION("A buffer shorter than the header is rejected") {
        const auto packet = rtpkit::rtcp::PacketView::decode(data.data(), 3);
        REQUIRE(packet.error() == rtpkit::rtcp::Error {rtpkit::rtcp::ErrorCode::invalid_len, 3});
    }

    SECTION("A null pointer is rejected") {
        const auto packet = rtpkit::rtcp::PacketView::decode(nullptr, 32);
        REQUIRE(packet.error() == rtpkit::rtcp::Error {rtpkit::rtcp::ErrorCode::invalid_len, 0});
    }

    SECTION("The actual version is reported") {
        data[0] = 0x40;
        const auto packet = rtpkit::rtcp::PacketView::decode(data.data(), data.size());
        REQUIRE(packet.error() == rtpkit::rtcp::Error {rtpkit::rtcp::ErrorCode::invalid_version, 1});
    }

    SECTION("Unknown packet types are carried") {
        data[1] = 0xcd;
        const auto packet = rtpkit::rtcp::PacketView::decode(data.data(), data.size());
        REQUIRE(packet.has_value());
        REQUIRE(packet->packet_type() == rtpkit::rtcp::PacketType::unknown);
        REQUIRE(packet->payload_type() == 0x4d);
    }

    SECTION("To string") {
        const auto packet = rtpkit::rtcp::PacketView::decode(data.data(), data.size());
        REQUIRE(packet.has_value());
        REQUIRE(
            packet->to_string()
            == "RTCP Packet: version=2 padding=false report_count=0 payload_type=72 packet_type=SenderReport length=7 payload_length=4"
        );
    }

    SECTION("Errors are printable") {
        const rtpkit::rtcp::Error error {rtpkit::rtcp::ErrorCode::packet_too_short, 3};
        REQUIRE(fmt::format("{}", error) == "packet_too_short(3)");
    }
}

TEST_CASE("rtpkit::rtcp::Packet", "[rtcp_packet]") {
    const std::array<uint8_t, 6> body {1, 2, 3, 4, 5, 6};
    const rtpkit::rtcp::Packet packet(201, rtpkit::BufferView<const uint8_t>(body));

    REQUIRE(packet.report_count() == 0);
    REQUIRE(packet.payload_type() == 201);
    REQUIRE(packet.length() == 6);
    REQUIRE(packet.payload_data().data() == body.data());
    REQUIRE(packet.payload_data().size() == 6);
    REQUIRE(packet.to_string() == "RTCP Packet: report_count=0 payload_type=201 length=6");

    SECTION("The length of a body larger than 16 bits is truncated") {
        const std::vector<uint8_t> large_body(70000);
        const rtpkit::rtcp::Packet large(200, rtpkit::BufferView<const uint8_t>(large_body));
        REQUIRE(large.length() == 70000 - 65536);
        REQUIRE(large.payload_data().size() == 70000);
    }
}

TEST_CASE("rtpkit::rtcp::packet_type_to_string()", "[rtcp_packet_view]") {
    REQUIRE(std::string(rtpkit::rtcp::packet_type_to_string(rtpkit::rtcp::packet_type_from_value(200))) == "SenderReport");
    REQUIRE(std::string(rtpkit::rtcp::packet_type_to_string(rtpkit::rtcp::packet_type_from_value(201))) == "ReceiverReport");
    REQUIRE(std::string(rtpkit::rtcp::packet_type_to_string(rtpkit::rtcp::packet_type_from_value(202))) == "SourceDescription");
    REQUIRE(std::string(rtpkit::rtcp::packet_type_to_string(rtpkit::rtcp::packet_type_from_value(203))) == "Bye");
    REQUIRE(std::string(rtpkit::rtcp::packet_type_to_string(rtpkit::rtcp::packet_type_from_value(204))) == "App");
    REQUIRE(std::string(rtpkit::rtcp::packet_type_to_string(rtpkit::rtcp::packet_type_from_value(72))) == "Unknown");
}
