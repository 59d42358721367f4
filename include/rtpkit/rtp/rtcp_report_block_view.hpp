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

#include "rtpkit/ntp/ntp_timestamp.hpp"

namespace rtpkit::rtcp {

/**
 * View over a single 24 byte reception report block, as found in sender and receiver reports.
 *
 *  0                   1                   2                   3
 *  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
 * +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
 * |                 SSRC_1 (SSRC of first source)                 |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * | fraction lost |       cumulative number of packets lost       |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |           extended highest sequence number received           |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                      interarrival jitter                      |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                         last SR (LSR)                         |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                   delay since last SR (DLSR)                  |
 * +=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+=+
 */
class ReportBlockView {
  public:
    static constexpr size_t k_report_block_length = 24;

    /**
     * Constructs an RTCP report block view from the given data.
     * @param data The RTCP report block data, must point to at least k_report_block_length bytes.
     */
    explicit ReportBlockView(const uint8_t* data);

    /**
     * @returns The SSRC of the source this report block is about.
     */
    [[nodiscard]] uint32_t ssrc() const;

    /**
     * @returns The fraction of packets lost.
     */
    [[nodiscard]] uint8_t fraction_lost() const;

    /**
     * @returns The cumulative number of packets lost (24 bits).
     */
    [[nodiscard]] uint32_t number_of_packets_lost() const;

    /**
     * @returns The extended highest sequence number received.
     */
    [[nodiscard]] uint32_t extended_highest_sequence_number_received() const;

    /**
     * @returns The inter-arrival jitter.
     */
    [[nodiscard]] uint32_t inter_arrival_jitter() const;

    /**
     * @return The last SR timestamp.
     */
    [[nodiscard]] ntp::Timestamp last_sr_timestamp() const;

    /**
     * @return The delay since the last SR, in units of 1/65536 seconds.
     */
    [[nodiscard]] uint32_t delay_since_last_sr() const;

    [[nodiscard]] const uint8_t* data() const;

    [[nodiscard]] std::string to_string() const;

  private:
    const uint8_t* data_ {};
};

}  // namespace rtpkit::rtcp
