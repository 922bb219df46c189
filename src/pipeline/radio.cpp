#include "droneid/pipeline/radio.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

#include "droneid/errors.hpp"

namespace droneid::pipeline {

std::vector<std::complex<float>> load_cf32(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        throw std::runtime_error("Failed to open IQ file: " + path.string());

    file.seekg(0, std::ios::end);
    const std::streampos file_size = file.tellg();
    if (file_size % (sizeof(float) * 2) != 0)
        throw std::runtime_error("IQ file size is not aligned to complex64 samples: " + path.string());
    const std::size_t count = static_cast<std::size_t>(file_size) / (sizeof(float) * 2);
    file.seekg(0, std::ios::beg);

    // Endianness is assumed little-endian host.
    std::vector<std::complex<float>> samples(count);
    file.read(reinterpret_cast<char*>(samples.data()), static_cast<std::streamsize>(count * sizeof(std::complex<float>)));
    if (!file)
        throw std::runtime_error("Failed to read IQ data from file: " + path.string());
    return samples;
}

FileReplaySource::FileReplaySource(std::vector<std::complex<float>> samples, double sample_rate_hz,
                                   std::optional<double> on_air_hz)
    : samples_(std::move(samples)), rate_(sample_rate_hz), on_air_(on_air_hz) {
    if (samples_.empty())
        throw RadioError("replay source has no samples");
    if (!(rate_ > 0.0))
        throw ConfigurationError("replay sample rate must be positive");
}

FileReplaySource::FileReplaySource(const std::filesystem::path& path, double sample_rate_hz,
                                   std::optional<double> on_air_hz)
    : FileReplaySource(load_cf32(path), sample_rate_hz, on_air_hz) {}

bool FileReplaySource::set_frequency(double hz) {
    if (closed_.load() || !(hz > 0.0)) return false;
    std::lock_guard<std::mutex> lock(mu_);
    tuned_ = hz;
    return true;
}

std::vector<std::complex<float>> FileReplaySource::receive_samples(std::size_t n) {
    if (closed_.load()) return {};
    std::lock_guard<std::mutex> lock(mu_);
    ++reads_;
    std::vector<std::complex<float>> out(n, {0.f, 0.f});
    const bool audible = !on_air_ || (tuned_ && std::abs(*tuned_ - *on_air_) < 1.0);
    for (std::size_t i = 0; i < n; ++i) {
        if (audible) out[i] = samples_[pos_];
        pos_ = (pos_ + 1) % samples_.size();
    }
    return out;
}

void FileReplaySource::close() {
    closed_.store(true);
}

std::optional<double> FileReplaySource::tuned_frequency() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tuned_;
}

} // namespace droneid::pipeline
