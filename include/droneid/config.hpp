#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace droneid {

enum class PacketType { DroneId, C2, Beacon, Pairing, Video };

// Throws ConfigurationError for names other than droneid|c2|beacon|pairing|video.
PacketType parse_packet_type(const std::string& name);
const char* to_string(PacketType type);

// Allowed on-air duration of one burst, in seconds.
struct BurstEnvelope {
    double min_s = 0.0;
    double max_s = 0.0;
};

BurstEnvelope burst_envelope(PacketType type, bool legacy);

struct ReceiverConfig {
    // Front end
    double sample_rate_hz = 20e6;
    // RX gain in dB; unset selects AGC.
    std::optional<int> gain_db;
    // Capture length per channel visit, seconds.
    double duration_s = 0.5;
    bool band_2_4_only = true;

    // Decode
    PacketType packet_type = PacketType::DroneId;
    bool legacy = false;
    // Try all four phase hypotheses and keep a CRC-valid one if any.
    bool prefer_crc_valid_phase = false;
    double chunk_seconds = 0.25;
    std::size_t max_packets_per_capture = 5;

    // Workers and queues
    std::size_t num_workers = 2;
    // Captures waiting for a worker; 0 picks two per worker.
    std::size_t queue_capacity = 0;
    std::chrono::milliseconds worker_poll_timeout{1000};
    std::chrono::milliseconds capture_join_timeout{10000};
    std::chrono::milliseconds worker_join_timeout{5000};

    // Diagnostics / artifacts
    bool debug = false;
    bool verbose = false;
    bool save_files = false;
    std::string output_dir;

    std::size_t sample_queue_capacity() const {
        return queue_capacity ? queue_capacity : 2 * num_workers;
    }

    // Throws ConfigurationError on the first invalid field.
    void validate() const;
};

} // namespace droneid
