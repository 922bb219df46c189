#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "droneid/capture.hpp"

namespace droneid::frame {

// Wire fields of the 89-byte payload in transmission order, unscaled.
struct TelemetryFields {
    uint8_t  pkt_len = 0;
    uint8_t  unk = 0;
    uint8_t  version = 0;
    uint16_t sequence_number = 0;
    uint16_t state_info = 0;
    std::string serial_number;   // up to 16 bytes, NUL padded on the wire
    int32_t  longitude = 0;
    int32_t  latitude = 0;
    int16_t  altitude = 0;       // feet
    int16_t  height = 0;         // feet
    int16_t  v_north = 0;
    int16_t  v_east = 0;
    int16_t  v_up = 0;
    int16_t  d_1_angle = 0;
    uint64_t gps_time = 0;
    int32_t  app_lat = 0;
    int32_t  app_lon = 0;
    int32_t  longitude_home = 0;
    int32_t  latitude_home = 0;
    uint8_t  device_type = 0;
    uint8_t  uuid_len = 0;
    std::string uuid;            // up to 20 bytes, NUL padded on the wire
};

// Decoded telemetry of one frame.
struct TelemetryRecord {
    uint8_t  pkt_len = 0;
    uint8_t  unk = 0;
    uint8_t  version = 0;
    uint16_t sequence_number = 0;
    uint16_t state_info = 0;
    std::string serial_number;
    double   longitude = 0.0;    // degrees
    double   latitude = 0.0;     // degrees
    double   altitude = 0.0;     // metres, two decimals
    double   height = 0.0;       // metres, two decimals
    int16_t  v_north = 0;
    int16_t  v_east = 0;
    int16_t  v_up = 0;
    int16_t  d_1_angle = 0;
    uint64_t gps_time = 0;
    int32_t  app_lat = 0;        // operator position, unscaled
    int32_t  app_lon = 0;
    int32_t  longitude_home = 0;
    int32_t  latitude_home = 0;
    uint8_t  device_type = 0;
    uint8_t  uuid_len = 0;
    std::string uuid;

    bool     crc_valid = false;
    uint16_t crc_packet = 0;
    uint16_t crc_calculated = 0;
};

// Serialise the payload and append its CRC.
RawFrame encode(const TelemetryFields& fields);

// Parse a frame of at least kRawFrameBytes bytes. Numeric fields never fail;
// a serial/uuid field that is not valid text throws TextDecodeError and a
// short buffer throws std::invalid_argument.
TelemetryRecord decode(std::span<const uint8_t> frame);

// Recompute the CRC over the payload and compare it with the trailer.
bool check_crc(std::span<const uint8_t> frame);

uint16_t compute_crc(std::span<const uint8_t> payload);

double scale_coordinate(int32_t raw);
// raw feet -> metres rounded half-even to two decimals.
double scale_altitude(int16_t raw);

// Pretty-printed JSON document for one record.
std::string to_json(const TelemetryRecord& record, std::optional<double> frequency_hz = std::nullopt);

} // namespace droneid::frame
