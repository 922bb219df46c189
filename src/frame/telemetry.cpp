#include "droneid/frame/telemetry.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <type_traits>

#include "droneid/errors.hpp"
#include "droneid/utils/crc.hpp"

namespace droneid::frame {

namespace {

constexpr std::size_t kSerialBytes = 16;
constexpr std::size_t kUuidBytes = 20;

// Sequential little-endian reader over the payload.
class FieldReader {
public:
    explicit FieldReader(std::span<const uint8_t> data) : data_(data) {}

    template <typename T>
    T read() {
        using U = std::make_unsigned_t<T>;
        U v = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i)
            v |= static_cast<U>(static_cast<U>(data_[pos_ + i]) << (8 * i));
        pos_ += sizeof(T);
        return static_cast<T>(v);
    }

    std::span<const uint8_t> bytes(std::size_t n) {
        auto s = data_.subspan(pos_, n);
        pos_ += n;
        return s;
    }

    std::size_t position() const { return pos_; }

private:
    std::span<const uint8_t> data_;
    std::size_t pos_ = 0;
};

class FieldWriter {
public:
    explicit FieldWriter(uint8_t* out) : out_(out) {}

    template <typename T>
    void write(T value) {
        using U = std::make_unsigned_t<T>;
        const U v = static_cast<U>(value);
        for (std::size_t i = 0; i < sizeof(T); ++i)
            out_[pos_++] = static_cast<uint8_t>((v >> (8 * i)) & 0xFFu);
    }

    void text(const std::string& s, std::size_t width) {
        const std::size_t n = std::min(s.size(), width);
        std::memcpy(out_ + pos_, s.data(), n);
        std::memset(out_ + pos_ + n, 0, width - n);
        pos_ += width;
    }

    std::size_t position() const { return pos_; }

private:
    uint8_t* out_;
    std::size_t pos_ = 0;
};

bool valid_utf8(const uint8_t* p, std::size_t n) {
    std::size_t i = 0;
    while (i < n) {
        const uint8_t c = p[i];
        std::size_t extra;
        uint32_t cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;
        if (i + extra >= n) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((p[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i + k] & 0x3F);
        }
        // overlong forms, surrogates and out-of-range code points
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000))
            return false;
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return false;
        i += extra + 1;
    }
    return true;
}

std::string decode_text(std::span<const uint8_t> field, const char* name) {
    std::size_t n = field.size();
    while (n > 0 && field[n - 1] == 0) --n;
    if (!valid_utf8(field.data(), n))
        throw TextDecodeError(std::string("non-text bytes in ") + name);
    return std::string(reinterpret_cast<const char*>(field.data()), n);
}

void append_json_string(std::string& out, const std::string& s) {
    out += '"';
    for (unsigned char c : s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (c < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out += static_cast<char>(c);
            }
        }
    }
    out += '"';
}

std::string iso_time(std::chrono::system_clock::time_point tp, bool utc) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (utc) gmtime_r(&t, &tm);
    else     localtime_r(&t, &tm);
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                        tp.time_since_epoch()).count() % 1000000;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld%s",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(us),
                  utc ? "Z" : "");
    return buf;
}

} // namespace

uint16_t compute_crc(std::span<const uint8_t> payload) {
    return utils::Crc16::droneid().compute(payload.data(), payload.size());
}

double scale_coordinate(int32_t raw) {
    return static_cast<double>(raw) / kCoordinateScale;
}

double scale_altitude(int16_t raw) {
    // printf rounds the exact binary value half-even, then strtod returns the
    // nearest double to the two-decimal string.
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(raw) / kFeetPerMeter);
    return std::strtod(buf, nullptr);
}

RawFrame encode(const TelemetryFields& f) {
    RawFrame out{};
    FieldWriter w(out.data());
    w.write<uint8_t>(f.pkt_len);
    w.write<uint8_t>(f.unk);
    w.write<uint8_t>(f.version);
    w.write<uint16_t>(f.sequence_number);
    w.write<uint16_t>(f.state_info);
    w.text(f.serial_number, kSerialBytes);
    w.write<int32_t>(f.longitude);
    w.write<int32_t>(f.latitude);
    w.write<int16_t>(f.altitude);
    w.write<int16_t>(f.height);
    w.write<int16_t>(f.v_north);
    w.write<int16_t>(f.v_east);
    w.write<int16_t>(f.v_up);
    w.write<int16_t>(f.d_1_angle);
    w.write<uint64_t>(f.gps_time);
    w.write<int32_t>(f.app_lat);
    w.write<int32_t>(f.app_lon);
    w.write<int32_t>(f.longitude_home);
    w.write<int32_t>(f.latitude_home);
    w.write<uint8_t>(f.device_type);
    w.write<uint8_t>(f.uuid_len);
    w.text(f.uuid, kUuidBytes);

    const auto [lo, hi] = utils::Crc16::droneid().make_trailer_le(out.data(), kPayloadBytes);
    out[kPayloadBytes] = lo;
    out[kPayloadBytes + 1] = hi;
    return out;
}

TelemetryRecord decode(std::span<const uint8_t> frame) {
    if (frame.size() < kRawFrameBytes)
        throw std::invalid_argument("DroneID frame shorter than 91 bytes");

    TelemetryRecord r;
    FieldReader rd(frame);
    r.pkt_len         = rd.read<uint8_t>();
    r.unk             = rd.read<uint8_t>();
    r.version         = rd.read<uint8_t>();
    r.sequence_number = rd.read<uint16_t>();
    r.state_info      = rd.read<uint16_t>();
    r.serial_number   = decode_text(rd.bytes(kSerialBytes), "serial_number");
    r.longitude       = scale_coordinate(rd.read<int32_t>());
    r.latitude        = scale_coordinate(rd.read<int32_t>());
    r.altitude        = scale_altitude(rd.read<int16_t>());
    r.height          = scale_altitude(rd.read<int16_t>());
    r.v_north         = rd.read<int16_t>();
    r.v_east          = rd.read<int16_t>();
    r.v_up            = rd.read<int16_t>();
    r.d_1_angle       = rd.read<int16_t>();
    r.gps_time        = rd.read<uint64_t>();
    r.app_lat         = rd.read<int32_t>();
    r.app_lon         = rd.read<int32_t>();
    r.longitude_home  = rd.read<int32_t>();
    r.latitude_home   = rd.read<int32_t>();
    r.device_type     = rd.read<uint8_t>();
    r.uuid_len        = rd.read<uint8_t>();
    r.uuid            = decode_text(rd.bytes(kUuidBytes), "uuid");

    const auto [ok, calc] = utils::Crc16::droneid().verify_with_trailer_le(frame.data(), kRawFrameBytes);
    r.crc_calculated = calc;
    r.crc_packet = static_cast<uint16_t>(frame[kPayloadBytes] | (frame[kPayloadBytes + 1] << 8));
    r.crc_valid = ok;
    return r;
}

bool check_crc(std::span<const uint8_t> frame) {
    if (frame.size() < kRawFrameBytes) return false;
    return utils::Crc16::droneid().verify_with_trailer_le(frame.data(), kRawFrameBytes).first;
}

std::string to_json(const TelemetryRecord& r, std::optional<double> frequency_hz) {
    const auto now = std::chrono::system_clock::now();
    char num[128];
    std::string out;
    out.reserve(1024);

    out += "{\n  \"timestamp\": \"" + iso_time(now, false) + "\",\n";
    out += "  \"reception_time_utc\": \"" + iso_time(now, true) + "\",\n";
    if (frequency_hz) {
        std::snprintf(num, sizeof(num), "  \"frequency_mhz\": %.3f,\n", *frequency_hz / 1e6);
        out += num;
    }
    out += "  \"telemetry\": {\n    \"serial_number\": ";
    append_json_string(out, r.serial_number);
    std::snprintf(num, sizeof(num), ",\n    \"device_type\": %u,\n", unsigned(r.device_type));
    out += num;
    std::snprintf(num, sizeof(num),
                  "    \"position\": {\"latitude\": %.7f, \"longitude\": %.7f, \"altitude_m\": %.2f, \"height_m\": %.2f},\n",
                  r.latitude, r.longitude, r.altitude, r.height);
    out += num;
    std::snprintf(num, sizeof(num), "    \"velocity\": {\"north\": %d, \"east\": %d, \"up\": %d},\n",
                  int(r.v_north), int(r.v_east), int(r.v_up));
    out += num;
    std::snprintf(num, sizeof(num), "    \"home_position\": {\"latitude\": %d, \"longitude\": %d},\n",
                  int(r.latitude_home), int(r.longitude_home));
    out += num;
    std::snprintf(num, sizeof(num), "    \"operator_position\": {\"latitude\": %d, \"longitude\": %d},\n",
                  int(r.app_lat), int(r.app_lon));
    out += num;
    std::snprintf(num, sizeof(num), "    \"gps_time\": %llu,\n    \"sequence_number\": %u,\n    \"uuid\": ",
                  static_cast<unsigned long long>(r.gps_time), unsigned(r.sequence_number));
    out += num;
    append_json_string(out, r.uuid);
    std::snprintf(num, sizeof(num),
                  "\n  },\n  \"crc_valid\": %s,\n  \"crc_packet\": \"%04x\",\n  \"crc_calculated\": \"%04x\"\n}",
                  r.crc_valid ? "true" : "false", unsigned(r.crc_packet), unsigned(r.crc_calculated));
    out += num;
    return out;
}

} // namespace droneid::frame
