/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/rtp/rtcp.hpp"

rtpkit::rtcp::PacketType rtpkit::rtcp::packet_type_from_value(const uint8_t packet_type) {
    switch (packet_type) {
        case 200:
            return PacketType::sender_report;
        case 201:
            return PacketType::receiver_report;
        case 202:
            return PacketType::source_description;
        case 203:
            return PacketType::bye;
        case 204:
            return PacketType::app;
        default:
            return PacketType::unknown;
    }
}

const char* rtpkit::rtcp::packet_type_to_string(const PacketType packet_type) {
    switch (packet_type) {
        case PacketType::sender_report:
            return "SenderReport";
        case PacketType::receiver_report:
            return "ReceiverReport";
        case PacketType::source_description:
            return "SourceDescription";
        case PacketType::bye:
            return "Bye";
        case PacketType::app:
            return "App";
        case PacketType::unknown:
            return "Unknown";
    }
    return "";
}
