/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/rtp/rtcp_report_block_view.hpp"

#include "rtpkit/core/byte_order.hpp"

#include <fmt/format.h>

#include <array>

rtpkit::rtcp::ReportBlockView::ReportBlockView(const uint8_t* data) : data_(data) {}

uint32_t rtpkit::rtcp::ReportBlockView::ssrc() const {
    return read_be<uint32_t>(data_);
}

uint8_t rtpkit::rtcp::ReportBlockView::fraction_lost() const {
    return data_[4];
}

uint32_t rtpkit::rtcp::ReportBlockView::number_of_packets_lost() const {
    const std::array<uint8_t, 4> packets_lost {0, data_[5], data_[6], data_[7]};
    return read_be<uint32_t>(packets_lost.data());
}

uint32_t rtpkit::rtcp::ReportBlockView::extended_highest_sequence_number_received() const {
    return read_be<uint32_t>(data_ + 8);
}

uint32_t rtpkit::rtcp::ReportBlockView::inter_arrival_jitter() const {
    return read_be<uint32_t>(data_ + 12);
}

rtpkit::ntp::Timestamp rtpkit::rtcp::ReportBlockView::last_sr_timestamp() const {
    return ntp::Timestamp::from_compact(read_be<uint32_t>(data_ + 16));
}

uint32_t rtpkit::rtcp::ReportBlockView::delay_since_last_sr() const {
    return read_be<uint32_t>(data_ + 20);
}

const uint8_t* rtpkit::rtcp::ReportBlockView::data() const {
    return data_;
}

std::string rtpkit::rtcp::ReportBlockView::to_string() const {
    return fmt::format(
        "Report block: ssrc={} fraction_lost={} packets_lost={} highest_sequence_number={} jitter={} lsr={} dlsr={}",
        ssrc(), fraction_lost(), number_of_packets_lost(), extended_highest_sequence_number_received(),
        inter_arrival_jitter(), last_sr_timestamp().to_string(), delay_since_last_sr()
    );
}
