#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace droneid::pipeline {

// Per-session decode tallies. Owned by the orchestrator and fed from the
// reports workers send back; no global counters.
struct SessionStatistics {
    std::size_t total_packets = 0;      // bursts the detector returned
    std::size_t successful_decodes = 0; // CRC-valid frames
    std::size_t crc_errors = 0;         // parsed frames with a bad CRC

    void add(std::size_t bursts, std::size_t crc_valid, std::size_t crc_bad) {
        total_packets += bursts;
        successful_decodes += crc_valid;
        crc_errors += crc_bad;
    }

    // successful / total * 100, unset without bursts.
    std::optional<double> success_rate() const;
    // crc_errors / (successful + crc_errors) * 100, unset without decodes.
    std::optional<double> crc_error_rate() const;

    // Fixed-width table printed at shutdown.
    std::string format_table() const;
};

} // namespace droneid::pipeline
