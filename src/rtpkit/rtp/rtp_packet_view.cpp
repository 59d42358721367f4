/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/rtp/rtp_packet_view.hpp"

#include "rtpkit/core/byte_order.hpp"
#include "rtpkit/rtp/rtp.hpp"

#include <fmt/format.h>

tl::expected<rtpkit::rtp::PacketView, rtpkit::rtp::Error>
rtpkit::rtp::PacketView::decode(const uint8_t* data, const size_t size_bytes) {
    if (data == nullptr) {
        return tl::unexpected(Error {ErrorCode::invalid_len, 0});
    }

    if (size_bytes < kRtpHeaderBaseLengthOctets) {
        return tl::unexpected(Error {ErrorCode::invalid_len, size_bytes});
    }

    const PacketView packet(data, size_bytes);

    if (packet.version() != kRtpVersion) {
        return tl::unexpected(Error {ErrorCode::invalid_version, packet.version()});
    }

    // From here on every offset is checked before the bytes at that offset are read.
    const auto ext_offset = packet.extension_offset();
    if (ext_offset > size_bytes) {
        return tl::unexpected(Error {ErrorCode::invalid_csrc_count, packet.csrc_count()});
    }

    if (packet.extension() && ext_offset + kHeaderExtensionHeaderLengthOctets > size_bytes) {
        return tl::unexpected(Error {ErrorCode::missing_extension, 0});
    }

    const auto ext_length = packet.extension_length();
    if (ext_offset + ext_length > size_bytes) {
        return tl::unexpected(Error {ErrorCode::invalid_extension_length, ext_length});
    }

    const auto padding_length = packet.padding_length();
    if (ext_offset + ext_length + padding_length > size_bytes) {
        return tl::unexpected(Error {ErrorCode::invalid_padding, padding_length});
    }

    return packet;
}

tl::expected<rtpkit::rtp::PacketView, rtpkit::rtp::Error>
rtpkit::rtp::PacketView::decode(const BufferView<const uint8_t> buffer) {
    return decode(buffer.data(), buffer.size());
}

rtpkit::rtp::PacketView::PacketView(const uint8_t* data, const size_t size_bytes) :
    data_(data), size_bytes_(size_bytes) {}

uint8_t rtpkit::rtp::PacketView::version() const {
    return (data_[0] & 0b11000000) >> 6;
}

bool rtpkit::rtp::PacketView::padding() const {
    return (data_[0] & 0b00100000) >> 5 != 0;
}

bool rtpkit::rtp::PacketView::extension() const {
    return (data_[0] & 0b00010000) >> 4 != 0;
}

uint32_t rtpkit::rtp::PacketView::csrc_count() const {
    return data_[0] & 0b00001111;
}

bool rtpkit::rtp::PacketView::marker_bit() const {
    return (data_[1] & 0b10000000) >> 7 != 0;
}

uint8_t rtpkit::rtp::PacketView::payload_type() const {
    return data_[1] & 0b01111111;
}

uint16_t rtpkit::rtp::PacketView::sequence_number() const {
    return read_be<uint16_t>(&data_[2]);
}

uint32_t rtpkit::rtp::PacketView::timestamp() const {
    return read_be<uint32_t>(&data_[4]);
}

uint32_t rtpkit::rtp::PacketView::ssrc() const {
    return read_be<uint32_t>(&data_[8]);
}

uint32_t rtpkit::rtp::PacketView::csrc(const uint32_t index) const {
    if (index >= csrc_count()) {
        return 0;
    }
    return read_be<uint32_t>(&data_[kRtpHeaderBaseLengthOctets + index * kCsrcLengthOctets]);
}

std::vector<uint32_t> rtpkit::rtp::PacketView::csrc_list() const {
    std::vector<uint32_t> list;
    list.reserve(csrc_count());
    for (uint32_t i = 0; i < csrc_count(); ++i) {
        list.push_back(csrc(i));
    }
    return list;
}

std::optional<rtpkit::rtp::Extension> rtpkit::rtp::PacketView::header_extension() const {
    if (!extension()) {
        return std::nullopt;
    }

    const auto offset = extension_offset();
    Extension ext;
    ext.profile_id = read_be<uint16_t>(&data_[offset]);
    ext.data = {
        data_ + offset + kHeaderExtensionHeaderLengthOctets, extension_length() - kHeaderExtensionHeaderLengthOctets
    };
    return ext;
}

size_t rtpkit::rtp::PacketView::padding_length() const {
    if (!padding()) {
        return 0;
    }
    return data_[size_bytes_ - 1];
}

size_t rtpkit::rtp::PacketView::header_total_length() const {
    return extension_offset() + extension_length();
}

rtpkit::BufferView<const uint8_t> rtpkit::rtp::PacketView::payload_data() const {
    const auto header_length = header_total_length();
    return {data_ + header_length, size_bytes_ - header_length - padding_length()};
}

size_t rtpkit::rtp::PacketView::size() const {
    return size_bytes_;
}

const uint8_t* rtpkit::rtp::PacketView::data() const {
    return data_;
}

std::string rtpkit::rtp::PacketView::to_string() const {
    return fmt::format(
        "RTP Header: version={} padding={} extension={} csrc_count={} marker_bit={} payload_type={} sequence_number={} timestamp={} ssrc={} payload_start_index={} payload_length={}",
        version(), padding(), extension(), csrc_count(), marker_bit(), payload_type(), sequence_number(), timestamp(),
        ssrc(), header_total_length(), payload_data().size()
    );
}

size_t rtpkit::rtp::PacketView::extension_offset() const {
    return kRtpHeaderBaseLengthOctets + csrc_count() * kCsrcLengthOctets;
}

size_t rtpkit::rtp::PacketView::extension_length() const {
    if (!extension()) {
        return 0;
    }
    const auto num_32bit_words = read_be<uint16_t>(&data_[extension_offset() + sizeof(uint16_t)]);
    return static_cast<size_t>(num_32bit_words) * sizeof(uint32_t) + kHeaderExtensionHeaderLengthOctets;
}
