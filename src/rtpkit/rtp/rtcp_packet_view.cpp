/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/rtp/rtcp_packet_view.hpp"

#include "rtpkit/core/byte_order.hpp"

#include <fmt/format.h>

tl::expected<rtpkit::rtcp::PacketView, rtpkit::rtcp::Error>
rtpkit::rtcp::PacketView::decode(const uint8_t* data, const size_t size_bytes) {
    if (data == nullptr) {
        return tl::unexpected(Error {ErrorCode::invalid_len, 0});
    }

    if (size_bytes < kHeaderLength) {
        return tl::unexpected(Error {ErrorCode::invalid_len, size_bytes});
    }

    const PacketView packet(data, size_bytes);

    if (packet.version() != kRtcpVersion) {
        return tl::unexpected(Error {ErrorCode::invalid_version, packet.version()});
    }

    const auto offset = packet.payload_offset();
    if (offset > size_bytes) {
        return tl::unexpected(Error {ErrorCode::packet_too_short, packet.report_count()});
    }

    const auto padding_length = packet.padding_length();
    if (offset + padding_length > size_bytes) {
        return tl::unexpected(Error {ErrorCode::invalid_padding, padding_length});
    }

    return packet;
}

tl::expected<rtpkit::rtcp::PacketView, rtpkit::rtcp::Error>
rtpkit::rtcp::PacketView::decode(const BufferView<const uint8_t> buffer) {
    return decode(buffer.data(), buffer.size());
}

rtpkit::rtcp::PacketView::PacketView(const uint8_t* data, const size_t size_bytes) :
    data_(data), size_bytes_(size_bytes) {}

uint8_t rtpkit::rtcp::PacketView::version() const {
    return (data_[0] & 0b11000000) >> 6;
}

bool rtpkit::rtcp::PacketView::padding() const {
    return (data_[0] & 0b00100000) >> 5 != 0;
}

uint8_t rtpkit::rtcp::PacketView::report_count() const {
    return data_[0] & 0b00001111;
}

uint8_t rtpkit::rtcp::PacketView::payload_type() const {
    return data_[1] & 0b01111111;
}

rtpkit::rtcp::PacketType rtpkit::rtcp::PacketView::packet_type() const {
    return packet_type_from_value(data_[1]);
}

uint16_t rtpkit::rtcp::PacketView::length() const {
    return read_be<uint16_t>(&data_[2]);
}

rtpkit::BufferView<const uint8_t> rtpkit::rtcp::PacketView::payload_data() const {
    const auto offset = payload_offset();
    return {data_ + offset, size_bytes_ - offset - padding_length()};
}

const uint8_t* rtpkit::rtcp::PacketView::data() const {
    return data_;
}

size_t rtpkit::rtcp::PacketView::size() const {
    return size_bytes_;
}

std::string rtpkit::rtcp::PacketView::to_string() const {
    return fmt::format(
        "RTCP Packet: version={} padding={} report_count={} payload_type={} packet_type={} length={} payload_length={}",
        version(), padding(), report_count(), payload_type(), packet_type_to_string(packet_type()), length(),
        payload_data().size()
    );
}

size_t rtpkit::rtcp::PacketView::payload_offset() const {
    // One block per count, plus the block which is always present.
    return kHeaderLength + static_cast<size_t>(report_count()) * kReportBlockLength + kReportBlockLength;
}

size_t rtpkit::rtcp::PacketView::padding_length() const {
    if (!padding()) {
        return 0;
    }
    return data_[size_bytes_ - 1];
}
