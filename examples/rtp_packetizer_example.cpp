/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#include "rtpkit/core/exception.hpp"
#include "rtpkit/core/log.hpp"
#include "rtpkit/core/random.hpp"
#include "rtpkit/rtp/rtp_packet_view.hpp"
#include "rtpkit/rtp/rtp_packetizer.hpp"

#include <CLI/App.hpp>

#include <numeric>
#include <optional>
#include <vector>

/**
 * Packetizes a number of synthetic frames, encodes every packet and decodes it again, logging the result.
 */
int main(int const argc, char* argv[]) {
    rtpkit::set_log_level_from_env();

    size_t mtu = 1200;
    size_t frame_size = 3000;
    size_t num_frames = 3;
    uint32_t frame_duration = 960;
    uint32_t ssrc = 0x12345678;
    int payload_type = 96;

    CLI::App app {"RTP packetizer example"};
    app.add_option("--mtu", mtu, "The maximum packet size in bytes")->check(CLI::Range(0, 65535));
    app.add_option("--frame-size", frame_size, "The size of each frame in bytes");
    app.add_option("--frames", num_frames, "The number of frames to packetize");
    app.add_option("--frame-duration", frame_duration, "The duration of each frame in timestamp units");
    app.add_option("--ssrc", ssrc, "The synchronization source identifier");
    app.add_option("--payload-type", payload_type, "The payload type")->check(CLI::Range(0, 127));
    CLI11_PARSE(app, argc, argv);

    std::vector<uint8_t> frame(frame_size);
    std::iota(frame.begin(), frame.end(), uint8_t {0});

    rtpkit::Random random;
    std::optional<rtpkit::rtp::Packetizer> packetizer;
    try {
        packetizer.emplace(mtu, static_cast<uint8_t>(payload_type), ssrc, random);
    } catch (const rtpkit::Exception& e) {
        RTPKIT_ERROR("Failed to create packetizer: {}", e);
        return 1;
    }

    rtpkit::ByteBuffer buffer;
    for (size_t i = 0; i < num_frames; ++i) {
        for (const auto& packet : packetizer->packetize(rtpkit::BufferView<const uint8_t>(frame), frame_duration)) {
            buffer.clear();
            packet.encode(buffer);

            const auto view = rtpkit::rtp::PacketView::decode(buffer.data(), buffer.size());
            if (!view) {
                RTPKIT_ERROR("Failed to decode packet: {}", view.error());
                return 1;
            }

            RTPKIT_INFO("{}", view->to_string());
        }
    }

    return 0;
}
