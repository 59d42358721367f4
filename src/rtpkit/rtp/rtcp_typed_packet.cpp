/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/rtp/rtcp_typed_packet.hpp"

#include "rtpkit/core/byte_order.hpp"

namespace {

constexpr size_t kSsrcLength = 4;
constexpr size_t kAppNameLength = 4;

using rtpkit::BufferView;
using rtpkit::rtcp::Error;
using rtpkit::rtcp::ErrorCode;
using rtpkit::rtcp::kReportBlockLength;
using rtpkit::rtcp::ReportBlockView;

tl::unexpected<Error> too_short(const uint8_t count) {
    return tl::unexpected(Error {ErrorCode::packet_too_short, count});
}

std::string_view to_string_view(const uint8_t* data, const size_t size) {
    return {reinterpret_cast<const char*>(data), size};
}

std::vector<ReportBlockView> parse_report_blocks(const BufferView<const uint8_t> blocks, const uint8_t count) {
    std::vector<ReportBlockView> result;
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        result.emplace_back(blocks.data() + i * kReportBlockLength);
    }
    return result;
}

tl::expected<rtpkit::rtcp::TypedPacket, Error>
parse_sender_report(const BufferView<const uint8_t> body, const uint8_t count) {
    const auto fixed_length = kSsrcLength + rtpkit::rtcp::kSenderInfoLength;
    if (body.size() < fixed_length + count * kReportBlockLength) {
        return too_short(count);
    }

    rtpkit::rtcp::SenderReport report;
    report.ssrc = body.read_be<uint32_t>(0);
    report.ntp_timestamp = {body.read_be<uint32_t>(4), body.read_be<uint32_t>(8)};
    report.rtp_timestamp = body.read_be<uint32_t>(12);
    report.packet_count = body.read_be<uint32_t>(16);
    report.octet_count = body.read_be<uint32_t>(20);
    report.report_blocks = parse_report_blocks(body.subview(fixed_length), count);
    report.profile_extension = body.subview(fixed_length + count * kReportBlockLength);
    return report;
}

tl::expected<rtpkit::rtcp::TypedPacket, Error>
parse_receiver_report(const BufferView<const uint8_t> body, const uint8_t count) {
    if (body.size() < kSsrcLength + count * kReportBlockLength) {
        return too_short(count);
    }

    rtpkit::rtcp::ReceiverReport report;
    report.ssrc = body.read_be<uint32_t>(0);
    report.report_blocks = parse_report_blocks(body.subview(kSsrcLength), count);
    report.profile_extension = body.subview(kSsrcLength + count * kReportBlockLength);
    return report;
}

tl::expected<rtpkit::rtcp::TypedPacket, Error>
parse_source_description(const BufferView<const uint8_t> body, const uint8_t count) {
    rtpkit::rtcp::SourceDescription sdes;
    sdes.chunks.reserve(count);

    size_t offset = 0;
    for (size_t c = 0; c < count; ++c) {
        if (offset + kSsrcLength > body.size()) {
            return too_short(count);
        }

        rtpkit::rtcp::SdesChunk chunk;
        chunk.ssrc = body.read_be<uint32_t>(offset);
        offset += kSsrcLength;

        while (true) {
            if (offset >= body.size()) {
                return too_short(count);
            }

            const auto type = static_cast<rtpkit::rtcp::SdesItemType>(body[offset]);
            if (type == rtpkit::rtcp::SdesItemType::end) {
                // Null octet plus padding up to the next 32-bit boundary.
                offset = (offset + 1 + 3) & ~static_cast<size_t>(3);
                break;
            }

            if (offset + 2 > body.size()) {
                return too_short(count);
            }

            const size_t length = body[offset + 1];
            if (offset + 2 + length > body.size()) {
                return too_short(count);
            }

            chunk.items.push_back({type, to_string_view(body.data() + offset + 2, length)});
            offset += 2 + length;
        }

        sdes.chunks.push_back(std::move(chunk));
    }

    return sdes;
}

tl::expected<rtpkit::rtcp::TypedPacket, Error>
parse_goodbye(const BufferView<const uint8_t> body, const uint8_t count) {
    const auto ssrcs_length = count * kSsrcLength;
    if (body.size() < ssrcs_length) {
        return too_short(count);
    }

    rtpkit::rtcp::Goodbye bye;
    bye.ssrcs.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        bye.ssrcs.push_back(body.read_be<uint32_t>(i * kSsrcLength));
    }

    // Trailing zero bytes after the SSRCs are padding to a 32-bit boundary, not a reason.
    if (body.size() > ssrcs_length && body[ssrcs_length] != 0) {
        const size_t reason_length = body[ssrcs_length];
        if (ssrcs_length + 1 + reason_length > body.size()) {
            return too_short(count);
        }
        bye.reason = to_string_view(body.data() + ssrcs_length + 1, reason_length);
    }

    return bye;
}

tl::expected<rtpkit::rtcp::TypedPacket, Error>
parse_application_defined(const BufferView<const uint8_t> body, const uint8_t subtype) {
    if (body.size() < kSsrcLength + kAppNameLength) {
        return too_short(subtype);
    }

    rtpkit::rtcp::ApplicationDefined app;
    app.subtype = subtype;
    app.ssrc = body.read_be<uint32_t>(0);
    app.name = to_string_view(body.data() + kSsrcLength, kAppNameLength);
    app.data = body.subview(kSsrcLength + kAppNameLength);
    return app;
}

}  // namespace

tl::expected<rtpkit::rtcp::TypedPacket, rtpkit::rtcp::Error>
rtpkit::rtcp::decode_typed(const uint8_t* data, const size_t size_bytes) {
    if (data == nullptr) {
        return tl::unexpected(Error {ErrorCode::invalid_len, 0});
    }

    if (size_bytes < kHeaderLength) {
        return tl::unexpected(Error {ErrorCode::invalid_len, size_bytes});
    }

    const uint8_t version = (data[0] & 0b11000000) >> 6;
    if (version != kRtcpVersion) {
        return tl::unexpected(Error {ErrorCode::invalid_version, version});
    }

    // The length field is the packet length in 32-bit words minus one, including the header.
    const auto declared_length = (static_cast<size_t>(read_be<uint16_t>(&data[2])) + 1) * 4;
    if (declared_length > size_bytes) {
        return tl::unexpected(Error {ErrorCode::invalid_length, declared_length});
    }

    size_t padding_length = 0;
    if ((data[0] & 0b00100000) != 0) {
        padding_length = data[declared_length - 1];
        if (padding_length == 0 || kHeaderLength + padding_length > declared_length) {
            return tl::unexpected(Error {ErrorCode::invalid_padding, padding_length});
        }
    }

    const uint8_t count = data[0] & 0b00011111;
    const uint8_t packet_type = data[1];
    const BufferView<const uint8_t> body(data + kHeaderLength, declared_length - kHeaderLength - padding_length);

    switch (packet_type_from_value(packet_type)) {
        case PacketType::sender_report:
            return parse_sender_report(body, count);
        case PacketType::receiver_report:
            return parse_receiver_report(body, count);
        case PacketType::source_description:
            return parse_source_description(body, count);
        case PacketType::bye:
            return parse_goodbye(body, count);
        case PacketType::app:
            return parse_application_defined(body, count);
        case PacketType::unknown:
            break;
    }

    return UnknownPacket {packet_type, count, body};
}

rtpkit::rtcp::PacketType rtpkit::rtcp::type_of(const TypedPacket& packet) {
    struct Visitor {
        PacketType operator()(const SenderReport&) const {
            return PacketType::sender_report;
        }
        PacketType operator()(const ReceiverReport&) const {
            return PacketType::receiver_report;
        }
        PacketType operator()(const SourceDescription&) const {
            return PacketType::source_description;
        }
        PacketType operator()(const Goodbye&) const {
            return PacketType::bye;
        }
        PacketType operator()(const ApplicationDefined&) const {
            return PacketType::app;
        }
        PacketType operator()(const UnknownPacket&) const {
            return PacketType::unknown;
        }
    };
    return std::visit(Visitor {}, packet);
}
