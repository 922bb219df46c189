#pragma once

#include <atomic>
#include <complex>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace droneid::pipeline {

// Front-end contract the capture thread drives. Only the capture thread
// touches an instance once the pipeline runs.
class RadioSource {
public:
    virtual ~RadioSource() = default;

    // Tune; false on failure, the caller may retry.
    virtual bool set_frequency(double hz) = 0;
    // Blocking read of up to `n` samples. Fewer only on error/timeout; an
    // empty result is a total failure.
    virtual std::vector<std::complex<float>> receive_samples(std::size_t n) = 0;
    // Idempotent.
    virtual void close() = 0;

    virtual double sample_rate() const = 0;
};

// Interleaved little-endian float32 I/Q with no header. Throws
// std::runtime_error on open/read failures or a size that is not a whole
// number of samples.
std::vector<std::complex<float>> load_cf32(const std::filesystem::path& path);

// Serves a recorded capture as if it were the hardware. The recording loops
// forever. With `on_air_hz` set, the recording is only "heard" while tuned
// to that frequency and silence (zeros) is returned elsewhere.
class FileReplaySource : public RadioSource {
public:
    FileReplaySource(std::vector<std::complex<float>> samples, double sample_rate_hz,
                     std::optional<double> on_air_hz = std::nullopt);
    FileReplaySource(const std::filesystem::path& path, double sample_rate_hz,
                     std::optional<double> on_air_hz = std::nullopt);

    bool set_frequency(double hz) override;
    std::vector<std::complex<float>> receive_samples(std::size_t n) override;
    void close() override;
    double sample_rate() const override { return rate_; }

    std::optional<double> tuned_frequency() const;
    std::size_t reads() const { return reads_.load(); }
    bool is_closed() const { return closed_.load(); }

private:
    std::vector<std::complex<float>> samples_;
    double rate_;
    std::optional<double> on_air_;
    mutable std::mutex mu_;
    std::optional<double> tuned_;
    std::size_t pos_ = 0;
    std::atomic<std::size_t> reads_{0};
    std::atomic<bool> closed_{false};
};

} // namespace droneid::pipeline
