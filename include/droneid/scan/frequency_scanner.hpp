#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace droneid::scan {

enum class ScanState { Scanning, Locked };

const char* to_string(ScanState s);

// Channel hopping with lock/unlock hysteresis. Scans the channel list in a
// fixed order until a detection locks it to one frequency; kUnlockThreshold
// consecutive empty captures at that frequency release the lock again.
class FrequencyScanner {
public:
    static constexpr std::size_t kUnlockThreshold = 10;

    // Ordered by how often DJI links use them.
    static const std::vector<double>& channels_2_4ghz();
    static const std::vector<double>& channels_5_8ghz();

    explicit FrequencyScanner(bool band_2_4_only = true);
    // Arbitrary non-empty channel list; throws ConfigurationError when empty.
    explicit FrequencyScanner(std::vector<double> channels);

    ScanState state() const { return state_; }
    std::optional<double> locked_frequency() const { return locked_; }
    std::size_t empty_scan_count() const { return empty_scans_; }
    std::size_t cursor() const { return cursor_; }
    const std::vector<double>& channels() const { return channels_; }

    void lock(double frequency_hz);
    void unlock();
    // unlock() plus rewinding the cursor to the first channel.
    void reset();

    // Only has an effect while locked.
    void record_detection(bool detected);

    // Locked frequency while locked, otherwise the channel under the cursor
    // (the cursor then advances circularly).
    double next_channel();

    // floor(duration * rate)
    static std::size_t sample_count(double duration_s, double sample_rate_hz);

private:
    std::vector<double> channels_;
    ScanState state_ = ScanState::Scanning;
    std::optional<double> locked_;
    std::size_t cursor_ = 0;
    std::size_t empty_scans_ = 0;
};

} // namespace droneid::scan
