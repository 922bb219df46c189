#include "droneid/scan/frequency_scanner.hpp"

#include <cmath>
#include <utility>

#include "droneid/errors.hpp"

namespace droneid::scan {

const char* to_string(ScanState s) {
    return s == ScanState::Locked ? "locked" : "scanning";
}

const std::vector<double>& FrequencyScanner::channels_2_4ghz() {
    static const std::vector<double> ch = {
        2459.5e6, 2444.5e6, 2429.5e6, 2474.5e6, 2434.5e6, 2414.5e6,
    };
    return ch;
}

const std::vector<double>& FrequencyScanner::channels_5_8ghz() {
    static const std::vector<double> ch = {
        5721.5e6, 5731.5e6, 5741.5e6, 5756.5e6, 5761.5e6,
        5771.5e6, 5786.5e6, 5801.5e6, 5816.5e6, 5831.5e6,
    };
    return ch;
}

FrequencyScanner::FrequencyScanner(bool band_2_4_only) : channels_(channels_2_4ghz()) {
    if (!band_2_4_only)
        channels_.insert(channels_.end(), channels_5_8ghz().begin(), channels_5_8ghz().end());
}

FrequencyScanner::FrequencyScanner(std::vector<double> channels) : channels_(std::move(channels)) {
    if (channels_.empty())
        throw ConfigurationError("scanner needs at least one channel");
}

void FrequencyScanner::lock(double frequency_hz) {
    state_ = ScanState::Locked;
    locked_ = frequency_hz;
    empty_scans_ = 0;
}

void FrequencyScanner::unlock() {
    state_ = ScanState::Scanning;
    locked_.reset();
    empty_scans_ = 0;
}

void FrequencyScanner::reset() {
    unlock();
    cursor_ = 0;
}

void FrequencyScanner::record_detection(bool detected) {
    if (state_ != ScanState::Locked) return;
    if (detected) {
        empty_scans_ = 0;
        return;
    }
    if (++empty_scans_ >= kUnlockThreshold)
        unlock();
}

double FrequencyScanner::next_channel() {
    if (state_ == ScanState::Locked && locked_)
        return *locked_;
    const double f = channels_[cursor_];
    cursor_ = (cursor_ + 1) % channels_.size();
    return f;
}

std::size_t FrequencyScanner::sample_count(double duration_s, double sample_rate_hz) {
    const double n = std::floor(duration_s * sample_rate_hz);
    return n > 0.0 ? static_cast<std::size_t>(n) : 0;
}

} // namespace droneid::scan
