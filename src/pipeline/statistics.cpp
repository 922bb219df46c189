#include "droneid/pipeline/statistics.hpp"

#include <cstdio>

namespace droneid::pipeline {

std::optional<double> SessionStatistics::success_rate() const {
    if (total_packets == 0) return std::nullopt;
    return 100.0 * static_cast<double>(successful_decodes) / static_cast<double>(total_packets);
}

std::optional<double> SessionStatistics::crc_error_rate() const {
    const std::size_t attempts = successful_decodes + crc_errors;
    if (attempts == 0) return std::nullopt;
    return 100.0 * static_cast<double>(crc_errors) / static_cast<double>(attempts);
}

std::string SessionStatistics::format_table() const {
    const std::string rule(50, '=');
    char line[96];
    std::string out = "\n" + rule + "\n         DroneID Receiver Statistics\n" + rule + "\n";
    std::snprintf(line, sizeof(line), "  Total packets detected:    %8zu\n", total_packets);
    out += line;
    std::snprintf(line, sizeof(line), "  Successfully decoded:      %8zu\n", successful_decodes);
    out += line;
    std::snprintf(line, sizeof(line), "  CRC errors:                %8zu\n", crc_errors);
    out += line;
    if (const auto r = success_rate()) {
        std::snprintf(line, sizeof(line), "  Success rate:              %7.1f%%\n", *r);
        out += line;
    } else {
        out += "  Success rate:                  N/A\n";
    }
    if (const auto r = crc_error_rate()) {
        std::snprintf(line, sizeof(line), "  CRC error rate:            %7.1f%%\n", *r);
        out += line;
    }
    out += rule + "\n";
    return out;
}

} // namespace droneid::pipeline
