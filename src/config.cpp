#include "droneid/config.hpp"

#include "droneid/errors.hpp"

namespace droneid {

PacketType parse_packet_type(const std::string& name) {
    if (name == "droneid") return PacketType::DroneId;
    if (name == "c2")      return PacketType::C2;
    if (name == "beacon")  return PacketType::Beacon;
    if (name == "pairing") return PacketType::Pairing;
    if (name == "video")   return PacketType::Video;
    throw ConfigurationError("unknown packet type: " + name);
}

const char* to_string(PacketType type) {
    switch (type) {
    case PacketType::DroneId: return "droneid";
    case PacketType::C2:      return "c2";
    case PacketType::Beacon:  return "beacon";
    case PacketType::Pairing: return "pairing";
    case PacketType::Video:   return "video";
    }
    return "unknown";
}

BurstEnvelope burst_envelope(PacketType type, bool legacy) {
    switch (type) {
    case PacketType::DroneId:
        return legacy ? BurstEnvelope{565e-6, 600e-6} : BurstEnvelope{630e-6, 665e-6};
    case PacketType::C2:
        return {500e-6, 520e-6};
    case PacketType::Beacon:
    case PacketType::Pairing:
        return {490e-6, 540e-6};
    case PacketType::Video:
        return {630e-6, 665e-6};
    }
    return {630e-6, 665e-6};
}

void ReceiverConfig::validate() const {
    if (!(sample_rate_hz > 0.0))
        throw ConfigurationError("sample rate must be positive");
    if (!(duration_s > 0.0))
        throw ConfigurationError("capture duration must be positive");
    if (!(chunk_seconds > 0.0))
        throw ConfigurationError("chunk length must be positive");
    if (gain_db && (*gain_db < 0 || *gain_db > 76))
        throw ConfigurationError("gain must be within 0..76 dB");
    if (num_workers == 0)
        throw ConfigurationError("at least one worker is required");
    if (max_packets_per_capture == 0)
        throw ConfigurationError("max packets per capture must be positive");
}

} // namespace droneid
